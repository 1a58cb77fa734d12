#pragma once
#include <boxflow/css/computed_style.h>
#include <boxflow/layout/geometry.h>
#include <cstddef>
#include <optional>
#include <vector>

namespace boxflow::core {
class DiagnosticEmitter;
}

namespace boxflow::layout {

// A float's margin box intruding into a container's inline space.
// rect.x is the inset from the container edge on the float's own side:
// from the left edge for left floats, from the right edge for right floats.
struct Exclusion {
    Rect rect;
    css::Float side = css::Float::Left;
};

struct InlineOffsets {
    float left = 0;
    float right = 0;
};

// Immutable set of exclusions. add() returns a new space and leaves the
// receiver untouched.
class ExclusionSpace {
public:
    ExclusionSpace() = default;

    ExclusionSpace add(const Exclusion& exclusion) const;

    // Outer-most left and right intrusion for the band [y, y + height).
    // Exclusions that only touch the band do not count.
    InlineOffsets available_inline_size(float y, float height) const;

    // Nearest exclusion bottom strictly below y.
    std::optional<float> next_bottom_below(float y) const;

    // Y at or below y that clears the exclusions on the sides named by clear.
    float clearance_y(css::Clear clear, float y) const;

    // Top of the most recently added exclusion. A new float may not be
    // placed above it.
    std::optional<float> last_top() const;

    bool empty() const { return exclusions_.empty(); }
    size_t size() const { return exclusions_.size(); }
    const std::vector<Exclusion>& exclusions() const { return exclusions_; }

private:
    std::vector<Exclusion> exclusions_;
};

struct FloatPlacement {
    float inset = 0;     // from the container edge on the float's side
    float y = 0;
    bool gave_up = false;
};

// CSS 2.1 §9.5.1: places a float of the given margin-box size as high as
// possible at or below start_y. The float only moves down when an
// opposite-side exclusion leaves too little room; same-side floats stack
// horizontally even past the container edge. The search gives up after
// kMaxFloatDropIterations candidates or kMaxFloatDropDistance of descent and
// returns start_y.
FloatPlacement place_float(const ExclusionSpace& space, css::Float side,
                           float width, float height, float container_width,
                           float start_y, core::DiagnosticEmitter* diagnostics = nullptr);

} // namespace boxflow::layout
