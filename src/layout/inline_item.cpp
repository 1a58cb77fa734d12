#include <boxflow/layout/inline_item.h>
#include <boxflow/core/config.h>
#include <boxflow/core/diagnostics.h>
#include <boxflow/dom/element.h>
#include <boxflow/dom/text.h>
#include <boxflow/layout/box_model.h>
#include <cctype>
#include <sstream>

namespace boxflow::layout {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool contains_only_blocks(const dom::Node& node, const StylePtr& style) {
    bool saw_block = false;
    bool saw_inline = false;
    node.for_each_child([&](const dom::Node& child) {
        StylePtr cs = resolve_style(child, style);
        if (child.is_text()) {
            const auto& data = static_cast<const dom::Text&>(child).data();
            if (cs->white_space == css::WhiteSpace::Pre ? !data.empty() : !is_whitespace_only(data)) {
                saw_inline = true;
            }
            return;
        }
        css::Display display = effective_display(*cs);
        if (display == css::Display::None || is_out_of_flow(*cs) ||
            cs->float_val != css::Float::None) {
            return;
        }
        if (is_block_level(display)) {
            saw_block = true;
        } else {
            saw_inline = true;
        }
    });
    return saw_block && !saw_inline;
}

std::vector<InlineItem> InlineItemCollector::collect(const dom::Node& container,
                                                     const StylePtr& container_style,
                                                     float containing_width) const {
    State state;
    state.containing_width = containing_width;
    if (container_style && container_style->first_letter) {
        state.first_letter_pending = true;
        state.first_letter_style = container_style->first_letter;
    }
    container.for_each_child([&](const dom::Node& child) {
        collect_node(child, container_style, state);
    });
    return std::move(state.items);
}

void InlineItemCollector::collect_node(const dom::Node& node, const StylePtr& parent_style,
                                       State& state) const {
    StylePtr style = resolve_style(node, parent_style);
    if (node.is_text()) {
        collect_text(node, static_cast<const dom::Text&>(node).data(), style, state);
        return;
    }

    css::Display display = effective_display(*style);
    if (display == css::Display::None) return;

    if (is_out_of_flow(*style)) {
        InlineItem item;
        item.type = InlineItemType::OutOfFlow;
        item.node = &node;
        item.style = style;
        state.items.push_back(std::move(item));
        return;
    }

    if (style->float_val != css::Float::None) {
        state.items.push_back(make_atomic(InlineItemType::Float, node, style, state));
        return;
    }

    std::string tag = tag_name_of(node);
    if (tag == "br") {
        InlineItem item;
        item.type = InlineItemType::Control;
        item.node = &node;
        item.style = style;
        item.height = measurer_.line_height(*style);
        state.items.push_back(std::move(item));
        state.after_space = true;
        return;
    }

    if (is_block_level(display)) {
        InlineItem item;
        item.type = InlineItemType::BlockChild;
        item.node = &node;
        item.style = style;
        state.items.push_back(std::move(item));
        state.first_letter_pending = false;
        state.after_space = true;
        return;
    }

    if (display == css::Display::InlineBlock || tag == "img") {
        state.items.push_back(make_atomic(InlineItemType::Atomic, node, style, state));
        state.first_letter_pending = false;
        state.after_space = false;
        return;
    }

    if (state.depth >= core::config::kMaxLayoutDepth) {
        if (!state.truncated && diagnostics_) {
            std::ostringstream msg;
            msg << "<" << tag_name_of(node) << "> nested inline deeper than "
                << core::config::kMaxLayoutDepth << "; content skipped";
            diagnostics_->warning("layout", "depth", msg.str());
        }
        state.truncated = true;
        return;
    }

    bool emit_tags = !contains_only_blocks(node, style);
    EdgeSizes margin = resolve_margin(*style, state.containing_width);
    EdgeSizes padding = resolve_padding(*style, state.containing_width);
    EdgeSizes border = resolve_border(*style);
    if (emit_tags) {
        InlineItem open;
        open.type = InlineItemType::OpenTag;
        open.node = &node;
        open.style = style;
        open.margin = margin;
        open.width = margin.left + border.left + padding.left;
        state.items.push_back(std::move(open));
    }

    ++state.depth;
    node.for_each_child([&](const dom::Node& child) {
        collect_node(child, style, state);
    });
    --state.depth;

    if (emit_tags) {
        InlineItem close;
        close.type = InlineItemType::CloseTag;
        close.node = &node;
        close.style = style;
        close.margin = margin;
        close.width = padding.right + border.right + margin.right;
        state.items.push_back(std::move(close));
    }
}

void InlineItemCollector::collect_text(const dom::Node& node, const std::string& data,
                                       const StylePtr& style, State& state) const {
    if (style->white_space == css::WhiteSpace::Pre) {
        size_t start = 0;
        while (start <= data.size()) {
            size_t nl = data.find('\n', start);
            size_t end = nl == std::string::npos ? data.size() : nl;
            if (end > start) {
                push_text(node, style, data.substr(start, end - start), start, end, false, state);
            }
            if (nl == std::string::npos) break;
            InlineItem control;
            control.type = InlineItemType::Control;
            control.node = &node;
            control.style = style;
            control.start_offset = nl;
            control.end_offset = nl + 1;
            control.height = measurer_.line_height(*style);
            state.items.push_back(std::move(control));
            start = nl + 1;
        }
        state.after_space = false;
        return;
    }

    if (style->white_space == css::WhiteSpace::NoWrap) {
        // The whole collapsed text is one unbreakable run.
        std::string collapsed;
        bool space = state.after_space;
        for (char c : data) {
            if (is_space(c)) {
                if (!space) collapsed.push_back(' ');
                space = true;
            } else {
                collapsed.push_back(c);
                space = false;
            }
        }
        if (collapsed.empty()) return;
        bool ws_only = collapsed == " ";
        push_text(node, style, std::move(collapsed), 0, data.size(), ws_only, state);
        state.after_space = space;
        return;
    }

    size_t n = data.size();
    size_t i = 0;
    if (i < n && is_space(data[i])) {
        size_t j = i;
        while (j < n && is_space(data[j])) ++j;
        if (!state.after_space) {
            push_text(node, style, " ", i, j, true, state);
        }
        state.after_space = true;
        i = j;
    }
    while (i < n) {
        size_t j = i;
        while (j < n && !is_space(data[j])) ++j;
        size_t k = j;
        while (k < n && is_space(data[k])) ++k;
        std::string run = data.substr(i, j - i);
        if (k > j) run.push_back(' ');
        push_text(node, style, std::move(run), i, k, false, state);
        state.after_space = k > j;
        i = k;
    }
}

void InlineItemCollector::push_text(const dom::Node& node, const StylePtr& style, std::string text,
                                    size_t start, size_t end, bool whitespace_only,
                                    State& state) const {
    if (state.first_letter_pending && !whitespace_only) {
        state.first_letter_pending = false;
        if (std::isalnum(static_cast<unsigned char>(text[0]))) {
            InlineItem letter;
            letter.type = InlineItemType::Text;
            letter.node = &node;
            letter.style = state.first_letter_style;
            letter.text = text.substr(0, 1);
            letter.start_offset = start;
            letter.end_offset = start + 1;
            TextMetrics m = measurer_.measure(letter.text, *letter.style);
            letter.width = m.width;
            letter.height = measurer_.line_height(*letter.style);
            state.items.push_back(std::move(letter));
            text.erase(0, 1);
            start += 1;
            if (text.empty()) return;
        }
    }

    InlineItem item;
    item.type = InlineItemType::Text;
    item.node = &node;
    item.style = style;
    item.start_offset = start;
    item.end_offset = end;
    item.width = measurer_.measure(text, *style).width;
    if (whitespace_only) {
        item.trailing_space_width = item.width;
    } else if (!text.empty() && text.back() == ' ') {
        item.trailing_space_width = measurer_.measure(" ", *style).width;
    }
    item.height = measurer_.line_height(*style);
    item.whitespace_only = whitespace_only;
    item.text = std::move(text);
    state.items.push_back(std::move(item));
}

InlineItem InlineItemCollector::make_atomic(InlineItemType type, const dom::Node& node,
                                            const StylePtr& style, const State& state) const {
    const css::ComputedStyle& s = *style;
    float cw = state.containing_width;
    EdgeSizes margin = resolve_margin(s, cw);
    EdgeSizes padding = resolve_padding(s, cw);
    EdgeSizes border = resolve_border(s);
    float edges_h = padding.horizontal() + border.horizontal();
    float edges_v = padding.vertical() + border.vertical();
    bool border_box = s.box_sizing == css::BoxSizing::BorderBox;

    float content_w = 0;
    float content_h = 0;
    if (tag_name_of(node) == "img") {
        ImageSize image = resolve_image_size(static_cast<const dom::Element&>(node), s,
                                             image_fetcher_, cw, std::nullopt);
        content_w = image.width;
        content_h = image.height;
    } else {
        if (!s.width.is_auto()) {
            content_w = resolve_length(s.width, cw, s);
            if (border_box) content_w -= edges_h;
        } else {
            float available = cw - margin.horizontal() - edges_h;
            content_w = IntrinsicSizer::shrink_to_fit(sizer_.content_sizes(node, s), available);
        }
        std::optional<float> max_w;
        if (s.max_width) max_w = resolve_length(*s.max_width, cw, s);
        content_w = clamp_min_max(content_w, resolve_length(s.min_width, cw, s), max_w);

        // Height is only known here when it is explicit; the block builder
        // replaces it with the laid-out height.
        if (!s.height.is_auto() && !s.height.is_percent()) {
            content_h = resolve_length(s.height, 0, s);
            if (border_box) content_h -= edges_v;
            content_h = std::max(0.0f, content_h);
        }
    }

    InlineItem item;
    item.type = type;
    item.node = &node;
    item.style = style;
    item.margin = margin;
    item.width = content_w + edges_h + margin.horizontal();
    item.height = content_h + edges_v + margin.vertical();
    return item;
}

} // namespace boxflow::layout
