#pragma once
#include <boxflow/css/computed_style.h>
#include <functional>
#include <string>

namespace boxflow::layout {

struct TextMetrics {
    float width = 0;
    float height = 0;
};

// Callback type for measuring text using platform font APIs.
// Parameters: text, font_size, font_family, font_weight, is_italic, letter_spacing
// Returns: advance width and line height in pixels
using TextMeasureFn = std::function<TextMetrics(const std::string& text, float font_size,
                                                const std::string& font_family, int font_weight,
                                                bool is_italic, float letter_spacing)>;

class TextMeasurer {
public:
    TextMeasurer() = default;
    explicit TextMeasurer(TextMeasureFn fn) : fn_(std::move(fn)) {}

    void set_measure_fn(TextMeasureFn fn) { fn_ = std::move(fn); }

    TextMetrics measure(const std::string& text, const css::ComputedStyle& style) const;
    float width(const std::string& text, const css::ComputedStyle& style) const {
        return measure(text, style).width;
    }

    // Used line height: explicit line-height, or the font's metrics for normal.
    float line_height(const css::ComputedStyle& style) const;

private:
    TextMeasureFn fn_;
};

} // namespace boxflow::layout
