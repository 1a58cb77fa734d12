#include <boxflow/layout/margins.h>

namespace boxflow::layout {

float collapse_margins(float first, float second) {
    if (first >= 0 && second >= 0) return std::max(first, second);
    if (first <= 0 && second <= 0) return std::min(first, second);
    return first + second;
}

bool should_collapse_margins(const css::ComputedStyle& style) {
    bool in_flow_position = style.position == css::Position::Static ||
        style.position == css::Position::Relative;
    return in_flow_position &&
        style.float_val == css::Float::None &&
        style.display != css::Display::InlineBlock &&
        style.overflow == css::Overflow::Visible;
}

bool establishes_bfc(const css::ComputedStyle& style, bool is_root) {
    return is_root ||
        style.float_val != css::Float::None ||
        style.position == css::Position::Absolute ||
        style.position == css::Position::Fixed ||
        style.display == css::Display::InlineBlock ||
        style.display == css::Display::Table ||
        style.display == css::Display::Flex ||
        style.display == css::Display::Grid ||
        style.overflow != css::Overflow::Visible;
}

bool can_collapse_top_with_children(const css::ComputedStyle& style, bool is_root) {
    return should_collapse_margins(style) &&
        !establishes_bfc(style, is_root) &&
        style.border_top.used_width() == 0 &&
        style.padding.top.is_zero();
}

bool can_collapse_bottom_with_children(const css::ComputedStyle& style, bool is_root) {
    return should_collapse_margins(style) &&
        !establishes_bfc(style, is_root) &&
        style.border_bottom.used_width() == 0 &&
        style.padding.bottom.is_zero() &&
        style.height.is_auto() &&
        style.min_height.is_zero();
}

} // namespace boxflow::layout
