#include <boxflow/layout/style_lookup.h>
#include <boxflow/dom/element.h>
#include <cctype>

namespace boxflow::layout {

namespace {

const StylePtr& initial_style() {
    static const StylePtr style = std::make_shared<const css::ComputedStyle>();
    return style;
}

} // namespace

StylePtr resolve_style(const dom::Node& node, const StylePtr& parent_style) {
    if (node.shared_style()) {
        return node.shared_style();
    }
    if (node.is_text()) {
        return parent_style ? parent_style : initial_style();
    }
    const auto& tag = static_cast<const dom::Element&>(node).tag_name();
    if (parent_style) {
        return std::make_shared<const css::ComputedStyle>(
            css::default_style_for_tag(tag, *parent_style));
    }
    return std::make_shared<const css::ComputedStyle>(css::default_style_for_tag(tag));
}

css::Display effective_display(const css::ComputedStyle& style) {
    if (style.display == css::Display::None) return css::Display::None;
    bool blockify = style.float_val != css::Float::None ||
        style.position == css::Position::Absolute ||
        style.position == css::Position::Fixed;
    if (blockify && (style.display == css::Display::Inline ||
                     style.display == css::Display::InlineBlock)) {
        return css::Display::Block;
    }
    return style.display;
}

bool is_block_level(css::Display display) {
    switch (display) {
        case css::Display::Block:
        case css::Display::ListItem:
        case css::Display::Table:
        case css::Display::Flex:
        case css::Display::Grid:
            return true;
        default:
            return false;
    }
}

bool is_out_of_flow(const css::ComputedStyle& style) {
    return style.position == css::Position::Absolute || style.position == css::Position::Fixed;
}

bool is_whitespace_only(const std::string& text) {
    for (unsigned char c : text) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

std::string tag_name_of(const dom::Node& node) {
    if (!node.is_element()) return {};
    std::string tag = static_cast<const dom::Element&>(node).tag_name();
    for (auto& c : tag) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return tag;
}

} // namespace boxflow::layout
