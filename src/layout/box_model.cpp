#include <boxflow/layout/box_model.h>
#include <algorithm>

namespace boxflow::layout {

float resolve_length(const css::Length& length, float percent_base,
                     const css::ComputedStyle& style) {
    return length.to_px(percent_base, style.font_size_px());
}

EdgeSizes resolve_margin(const css::ComputedStyle& style, float containing_width) {
    EdgeSizes e;
    e.top = resolve_length(style.margin.top, containing_width, style);
    e.right = resolve_length(style.margin.right, containing_width, style);
    e.bottom = resolve_length(style.margin.bottom, containing_width, style);
    e.left = resolve_length(style.margin.left, containing_width, style);
    return e;
}

EdgeSizes resolve_padding(const css::ComputedStyle& style, float containing_width) {
    EdgeSizes e;
    e.top = std::max(0.0f, resolve_length(style.padding.top, containing_width, style));
    e.right = std::max(0.0f, resolve_length(style.padding.right, containing_width, style));
    e.bottom = std::max(0.0f, resolve_length(style.padding.bottom, containing_width, style));
    e.left = std::max(0.0f, resolve_length(style.padding.left, containing_width, style));
    return e;
}

EdgeSizes resolve_border(const css::ComputedStyle& style) {
    float fs = style.font_size_px();
    EdgeSizes e;
    e.top = std::max(0.0f, style.border_top.used_width(fs));
    e.right = std::max(0.0f, style.border_right.used_width(fs));
    e.bottom = std::max(0.0f, style.border_bottom.used_width(fs));
    e.left = std::max(0.0f, style.border_left.used_width(fs));
    return e;
}

float clamp_min_max(float value, float min_value, std::optional<float> max_value) {
    if (max_value) {
        value = std::min(value, *max_value);
    }
    value = std::max(value, min_value);
    return std::max(value, 0.0f);
}

Point relative_offset(const css::ComputedStyle& style, float containing_width,
                      std::optional<float> containing_height) {
    Point offset;
    if (style.position != css::Position::Relative) return offset;

    if (!style.left_pos.is_auto()) {
        offset.x = resolve_length(style.left_pos, containing_width, style);
    } else if (!style.right_pos.is_auto()) {
        offset.x = -resolve_length(style.right_pos, containing_width, style);
    }

    auto vertical = [&](const css::Length& length) -> std::optional<float> {
        if (length.is_auto()) return std::nullopt;
        if (length.is_percent() && !containing_height) return std::nullopt;
        return resolve_length(length, containing_height.value_or(0), style);
    };
    if (auto top = vertical(style.top)) {
        offset.y = *top;
    } else if (auto bottom = vertical(style.bottom)) {
        offset.y = -*bottom;
    }
    return offset;
}

} // namespace boxflow::layout
