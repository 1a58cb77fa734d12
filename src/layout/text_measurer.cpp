#include <boxflow/layout/text_measurer.h>
#include <boxflow/core/config.h>

namespace boxflow::layout {

namespace {

// Number of code points in a UTF-8 string
size_t count_code_points(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

} // namespace

TextMetrics TextMeasurer::measure(const std::string& text, const css::ComputedStyle& style) const {
    float font_size = style.font_size_px();
    float letter_spacing = style.letter_spacing.to_px(0, font_size);
    if (fn_) {
        return fn_(text, font_size, style.font_family, style.font_weight,
                   style.is_italic(), letter_spacing);
    }
    // Fallback: approximate
    float char_w = font_size * core::config::kFallbackAdvanceFactor + letter_spacing;
    return {static_cast<float>(count_code_points(text)) * char_w,
            font_size * core::config::kDefaultLineHeightFactor};
}

float TextMeasurer::line_height(const css::ComputedStyle& style) const {
    if (auto lh = style.line_height_px()) {
        return *lh;
    }
    return measure(" ", style).height;
}

} // namespace boxflow::layout
