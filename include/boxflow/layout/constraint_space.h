#pragma once
#include <boxflow/css/computed_style.h>
#include <boxflow/layout/exclusion_space.h>
#include <boxflow/layout/geometry.h>
#include <memory>

namespace boxflow::layout {

// Immutable input to inline layout. Every with_* call returns a new space;
// the exclusion space is shared between copies, never copied.
class ConstraintSpace {
public:
    ConstraintSpace();
    explicit ConstraintSpace(Size available,
                             css::TextAlign text_align = css::TextAlign::Left,
                             bool no_wrap = false);

    const Size& available_size() const { return available_; }
    float available_width() const { return available_.width; }
    const ExclusionSpace& exclusion_space() const { return *exclusions_; }
    css::TextAlign text_align() const { return text_align_; }
    bool no_wrap() const { return no_wrap_; }

    ConstraintSpace with_exclusion(const Exclusion& exclusion) const;
    ConstraintSpace with_exclusion_space(ExclusionSpace exclusions) const;
    ConstraintSpace with_available_width(float width) const;
    ConstraintSpace with_text_align(css::TextAlign text_align) const;
    ConstraintSpace with_no_wrap(bool no_wrap) const;

    InlineOffsets exclusion_offsets(float y, float height) const {
        return exclusions_->available_inline_size(y, height);
    }

    // Available width minus both exclusion offsets; may be negative.
    float available_inline_size(float y, float height) const;

private:
    Size available_;
    std::shared_ptr<const ExclusionSpace> exclusions_;
    css::TextAlign text_align_ = css::TextAlign::Left;
    bool no_wrap_ = false;
};

} // namespace boxflow::layout
