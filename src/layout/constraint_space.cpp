#include <boxflow/layout/constraint_space.h>

namespace boxflow::layout {

namespace {

const std::shared_ptr<const ExclusionSpace>& empty_exclusions() {
    static const std::shared_ptr<const ExclusionSpace> empty =
        std::make_shared<const ExclusionSpace>();
    return empty;
}

} // namespace

ConstraintSpace::ConstraintSpace()
    : exclusions_(empty_exclusions()) {}

ConstraintSpace::ConstraintSpace(Size available, css::TextAlign text_align, bool no_wrap)
    : available_(available)
    , exclusions_(empty_exclusions())
    , text_align_(text_align)
    , no_wrap_(no_wrap) {}

ConstraintSpace ConstraintSpace::with_exclusion(const Exclusion& exclusion) const {
    ConstraintSpace result = *this;
    result.exclusions_ = std::make_shared<const ExclusionSpace>(exclusions_->add(exclusion));
    return result;
}

ConstraintSpace ConstraintSpace::with_exclusion_space(ExclusionSpace exclusions) const {
    ConstraintSpace result = *this;
    result.exclusions_ = std::make_shared<const ExclusionSpace>(std::move(exclusions));
    return result;
}

ConstraintSpace ConstraintSpace::with_available_width(float width) const {
    ConstraintSpace result = *this;
    result.available_.width = width;
    return result;
}

ConstraintSpace ConstraintSpace::with_text_align(css::TextAlign text_align) const {
    ConstraintSpace result = *this;
    result.text_align_ = text_align;
    return result;
}

ConstraintSpace ConstraintSpace::with_no_wrap(bool no_wrap) const {
    ConstraintSpace result = *this;
    result.no_wrap_ = no_wrap;
    return result;
}

float ConstraintSpace::available_inline_size(float y, float height) const {
    InlineOffsets offsets = exclusions_->available_inline_size(y, height);
    return available_.width - offsets.left - offsets.right;
}

} // namespace boxflow::layout
