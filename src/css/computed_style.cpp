#include <boxflow/css/computed_style.h>
#include <boxflow/core/config.h>
#include <unordered_set>

namespace boxflow::css {

float Length::to_px(float percent_base, float font_size, float root_font_size) const {
    switch (unit) {
        case Unit::Px:
            return value;
        case Unit::Em:
            return value * font_size;
        case Unit::Rem:
            return value * root_font_size;
        case Unit::Percent:
            return (value / 100.0f) * percent_base;
        case Unit::Auto:
            return 0;
        case Unit::Zero:
            return 0;
    }
    return 0;
}

float ComputedStyle::font_size_px() const {
    // Computed font sizes are absolute; em/rem here are relative to the
    // initial font size.
    return font_size.to_px(core::config::kDefaultFontSize, core::config::kDefaultFontSize,
                           core::config::kDefaultFontSize);
}

std::optional<float> ComputedStyle::line_height_px() const {
    float fs = font_size_px();
    if (line_height_unitless > 0) {
        return line_height_unitless * fs;
    }
    if (line_height.is_auto()) {
        return std::nullopt;
    }
    return line_height.to_px(fs, fs);
}

namespace {

void apply_tag_defaults(ComputedStyle& style, const std::string& tag) {
    static const std::unordered_set<std::string> block_elements = {
        "html", "body", "div", "section", "article", "aside", "nav", "header",
        "footer", "main", "p", "blockquote", "pre", "figure", "figcaption",
        "address", "details", "summary", "dialog", "dd", "dt", "dl",
        "fieldset", "form", "hr", "h1", "h2", "h3", "h4", "h5", "h6",
        "ul", "ol"
    };

    if (block_elements.count(tag)) {
        style.display = Display::Block;
    } else if (tag == "li") {
        style.display = Display::ListItem;
    } else if (tag == "table") {
        style.display = Display::Table;
    } else if (tag == "head" || tag == "meta" || tag == "link" || tag == "script" ||
               tag == "style" || tag == "title") {
        style.display = Display::None;
    } else {
        // Unknown elements default to inline
        style.display = Display::Inline;
    }

    if (tag == "h1") {
        style.font_size = Length::px(32.0f);
        style.font_weight = 700;
    } else if (tag == "h2") {
        style.font_size = Length::px(24.0f);
        style.font_weight = 700;
    } else if (tag == "h3") {
        style.font_size = Length::px(18.72f);
        style.font_weight = 700;
    } else if (tag == "h4" || tag == "h5" || tag == "h6") {
        style.font_weight = 700;
    }

    if (tag == "strong" || tag == "b") {
        style.font_weight = 700;
    }
    if (tag == "em" || tag == "i" || tag == "cite" || tag == "var" || tag == "dfn") {
        style.font_style = FontStyle::Italic;
    }

    if (tag == "code" || tag == "kbd" || tag == "samp" || tag == "pre") {
        style.font_family = "monospace";
    }
    if (tag == "pre") {
        style.white_space = WhiteSpace::Pre;
    }

    if (tag == "hr") {
        style.border_top.style = BorderStyle::Solid;
        style.border_top.width = Length::px(1);
    }
}

} // namespace

ComputedStyle default_style_for_tag(const std::string& tag) {
    ComputedStyle style;
    apply_tag_defaults(style, tag);
    return style;
}

ComputedStyle default_style_for_tag(const std::string& tag, const ComputedStyle& parent) {
    ComputedStyle style;
    inherit_text_properties(style, parent);
    apply_tag_defaults(style, tag);
    return style;
}

void inherit_text_properties(ComputedStyle& style, const ComputedStyle& parent) {
    style.font_family = parent.font_family;
    style.font_size = parent.font_size;
    style.font_weight = parent.font_weight;
    style.font_style = parent.font_style;
    style.line_height = parent.line_height;
    style.line_height_unitless = parent.line_height_unitless;
    style.letter_spacing = parent.letter_spacing;
    style.text_align = parent.text_align;
    style.white_space = parent.white_space;
}

} // namespace boxflow::css
