#pragma once
#include <boxflow/css/computed_style.h>
#include <boxflow/layout/geometry.h>
#include <optional>

namespace boxflow::layout {

// Used margins; auto margins resolve to 0. Percentages resolve against the
// containing block width on all four sides.
EdgeSizes resolve_margin(const css::ComputedStyle& style, float containing_width);
EdgeSizes resolve_padding(const css::ComputedStyle& style, float containing_width);
EdgeSizes resolve_border(const css::ComputedStyle& style);

// Length to px for a box property, with auto as 0.
float resolve_length(const css::Length& length, float percent_base,
                     const css::ComputedStyle& style);

// Clamp by min/max; min wins when they conflict.
float clamp_min_max(float value, float min_value, std::optional<float> max_value);

// position: relative shift from top/left, or -bottom/-right when those are
// auto. Vertical percentages need a definite containing block height.
Point relative_offset(const css::ComputedStyle& style, float containing_width,
                      std::optional<float> containing_height);

} // namespace boxflow::layout
