#include <boxflow/layout/intrinsic_sizes.h>
#include <boxflow/core/config.h>
#include <boxflow/dom/element.h>
#include <boxflow/dom/text.h>
#include <boxflow/layout/box_model.h>
#include <algorithm>
#include <cctype>

namespace boxflow::layout {

namespace {

// Horizontal border + padding with percentages treated as 0, since
// intrinsic sizes do not depend on the containing block.
float horizontal_edges(const css::ComputedStyle& style) {
    return resolve_padding(style, 0).horizontal() + resolve_border(style).horizontal();
}

} // namespace

struct IntrinsicSizer::LineState {
    IntrinsicSizes sizes;
    float line = 0;           // max-content width of the current line
    float word = 0;           // unbreakable run being measured for min-content
    float pending_space = 0;  // collapsed space not yet followed by content
    bool space_in_word = false;
    bool after_space = true;

    void end_word() {
        sizes.min_content = std::max(sizes.min_content, word);
        word = 0;
    }

    void commit_space() {
        line += pending_space;
        if (space_in_word) word += pending_space;
        pending_space = 0;
        space_in_word = false;
    }

    // Content with no break opportunity before it.
    void append(float width) {
        commit_space();
        line += width;
        word += width;
        after_space = false;
    }

    void add_space(float width, bool no_wrap) {
        if (after_space) return;
        if (!no_wrap) end_word();
        pending_space = width;
        space_in_word = no_wrap;
        after_space = true;
    }

    void add_atomic(const IntrinsicSizes& c) {
        end_word();
        commit_space();
        line += c.max_content;
        sizes.min_content = std::max(sizes.min_content, c.min_content);
        after_space = false;
    }

    // A trailing collapsed space never counts toward the line.
    void break_line() {
        end_word();
        sizes.max_content = std::max(sizes.max_content, line);
        line = 0;
        pending_space = 0;
        space_in_word = false;
        after_space = true;
    }
};

float IntrinsicSizer::shrink_to_fit(const IntrinsicSizes& sizes, float available) {
    return std::min(std::max(sizes.min_content, available), sizes.max_content);
}

IntrinsicSizes IntrinsicSizer::content_sizes(const dom::Node& node,
                                             const css::ComputedStyle& style) const {
    auto ptr = std::make_shared<const css::ComputedStyle>(style);
    return content_sizes_at(node, ptr, 0);
}

IntrinsicSizes IntrinsicSizer::contribution(const dom::Node& node,
                                            const css::ComputedStyle& style) const {
    auto ptr = std::make_shared<const css::ComputedStyle>(style);
    return contribution_at(node, ptr, 0);
}

void IntrinsicSizer::add_text(const std::string& text, const css::ComputedStyle& style,
                              LineState& state) const {
    if (style.white_space == css::WhiteSpace::Pre) {
        size_t start = 0;
        while (start <= text.size()) {
            size_t nl = text.find('\n', start);
            std::string segment = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
            if (!segment.empty()) state.append(measurer_.width(segment, style));
            if (nl == std::string::npos) break;
            state.break_line();
            start = nl + 1;
        }
        return;
    }

    bool no_wrap = style.white_space == css::WhiteSpace::NoWrap;
    std::string piece;
    auto flush_piece = [&]() {
        if (piece.empty()) return;
        state.append(measurer_.width(piece, style));
        piece.clear();
    };
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            flush_piece();
            state.add_space(measurer_.width(" ", style), no_wrap);
        } else {
            piece.push_back(c);
        }
    }
    flush_piece();
}

IntrinsicSizes IntrinsicSizer::content_sizes_at(const dom::Node& node, const StylePtr& style,
                                                int depth) const {
    LineState state;
    if (depth >= core::config::kMaxLayoutDepth) return state.sizes;
    if (node.is_text()) {
        add_text(static_cast<const dom::Text&>(node).data(), *style, state);
    } else {
        add_children(node, style, depth, state);
    }
    state.break_line();
    state.sizes.max_content = std::max(state.sizes.max_content, state.sizes.min_content);
    return state.sizes;
}

void IntrinsicSizer::add_children(const dom::Node& node, const StylePtr& style, int depth,
                                  LineState& state) const {
    if (depth >= core::config::kMaxLayoutDepth) return;

    node.for_each_child([&](const dom::Node& child) {
        StylePtr cs = resolve_style(child, style);
        if (child.is_text()) {
            add_text(static_cast<const dom::Text&>(child).data(), *cs, state);
            return;
        }
        css::Display display = effective_display(*cs);
        if (display == css::Display::None || is_out_of_flow(*cs)) return;

        std::string tag = tag_name_of(child);
        if (tag == "br") {
            state.break_line();
            return;
        }
        if (cs->float_val != css::Float::None) {
            IntrinsicSizes c = contribution_at(child, cs, depth + 1);
            state.sizes.min_content = std::max(state.sizes.min_content, c.min_content);
            state.line += c.max_content;
            return;
        }
        if (is_block_level(display)) {
            state.break_line();
            IntrinsicSizes c = contribution_at(child, cs, depth + 1);
            state.sizes.min_content = std::max(state.sizes.min_content, c.min_content);
            state.sizes.max_content = std::max(state.sizes.max_content, c.max_content);
            return;
        }
        if (display == css::Display::InlineBlock || tag == "img") {
            state.add_atomic(contribution_at(child, cs, depth + 1));
            return;
        }
        // Plain inline: edges stick to the adjacent words.
        EdgeSizes margin = resolve_margin(*cs, 0);
        EdgeSizes padding = resolve_padding(*cs, 0);
        EdgeSizes border = resolve_border(*cs);
        float start = margin.left + border.left + padding.left;
        float end = margin.right + border.right + padding.right;
        if (start != 0) state.append(start);
        add_children(child, cs, depth + 1, state);
        if (end != 0) state.append(end);
    });
}

IntrinsicSizes IntrinsicSizer::contribution_at(const dom::Node& node, const StylePtr& style,
                                               int depth) const {
    if (node.is_text()) {
        return content_sizes_at(node, style, depth);
    }
    float edges = horizontal_edges(*style);
    float margins = resolve_margin(*style, 0).horizontal();
    bool border_box = style->box_sizing == css::BoxSizing::BorderBox;

    float min_w = style->min_width.is_percent() ? 0.0f : resolve_length(style->min_width, 0, *style);
    std::optional<float> max_w;
    if (style->max_width && !style->max_width->is_percent()) {
        max_w = resolve_length(*style->max_width, 0, *style);
    }
    auto clamp = [&](float content) {
        return clamp_min_max(content, min_w, max_w);
    };

    if (!style->width.is_auto() && !style->width.is_percent()) {
        float w = resolve_length(style->width, 0, *style);
        if (border_box) w = std::max(0.0f, w - edges);
        float total = clamp(w) + edges + margins;
        return {total, total};
    }

    if (tag_name_of(node) == "img") {
        ImageSize image = resolve_image_size(static_cast<const dom::Element&>(node), *style,
                                             image_fetcher_, 0, std::nullopt);
        float total = clamp(image.width) + edges + margins;
        return {total, total};
    }

    IntrinsicSizes inner = content_sizes_at(node, style, depth);
    return {clamp(inner.min_content) + edges + margins,
            clamp(inner.max_content) + edges + margins};
}

} // namespace boxflow::layout
