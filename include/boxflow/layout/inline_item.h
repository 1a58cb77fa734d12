#pragma once
#include <boxflow/css/computed_style.h>
#include <boxflow/dom/node.h>
#include <boxflow/layout/geometry.h>
#include <boxflow/layout/image_size.h>
#include <boxflow/layout/intrinsic_sizes.h>
#include <boxflow/layout/style_lookup.h>
#include <boxflow/layout/text_measurer.h>
#include <cstddef>
#include <string>
#include <vector>

namespace boxflow::core {
class DiagnosticEmitter;
}

namespace boxflow::layout {

enum class InlineItemType {
    Text,        // a word run, with its trailing space
    OpenTag,     // start of an inline element; width = left margin+border+padding
    CloseTag,    // end of an inline element; width = right margin+border+padding
    Atomic,      // inline-block or replaced element, never split
    Float,       // floated element, removed from the line's flow
    Control,     // forced line break
    BlockChild,  // block-level child laid out by the enclosing block
    OutOfFlow,   // absolutely or fixed positioned element, static position only
};

struct InlineItem {
    InlineItemType type = InlineItemType::Text;
    const dom::Node* node = nullptr;
    StylePtr style;
    std::string text;
    size_t start_offset = 0;   // byte range in the text node's data
    size_t end_offset = 0;
    float width = 0;           // margin box for Atomic/Float
    float height = 0;
    float trailing_space_width = 0;
    EdgeSizes margin;          // used margins for Atomic/Float
    bool whitespace_only = false;

    bool is_float() const { return type == InlineItemType::Float; }
    bool is_in_flow_content() const {
        return type == InlineItemType::Text || type == InlineItemType::Atomic ||
            type == InlineItemType::OpenTag || type == InlineItemType::CloseTag;
    }
    // Width used to decide whether the item fits on a line.
    float fit_width() const { return width - trailing_space_width; }
};

// True when every in-flow child of an inline element is block-level. Such
// an element would only produce an empty, invisible inline box, so it emits
// no tags.
bool contains_only_blocks(const dom::Node& node, const StylePtr& style);

// Whether item gives its line a height: visible text, atomic boxes, forced
// breaks, and inline element edges of non-zero width.
inline bool is_line_content(const InlineItem& item) {
    switch (item.type) {
        case InlineItemType::Text:
            return !item.whitespace_only;
        case InlineItemType::Atomic:
        case InlineItemType::Control:
            return true;
        case InlineItemType::OpenTag:
        case InlineItemType::CloseTag:
            return item.width > 0;
        default:
            return false;
    }
}

// Flattens the inline-level content of a block container into items.
// Pure: sizes come from the text measurer and intrinsic-size queries, never
// from layout, and no float or box state is touched.
class InlineItemCollector {
public:
    InlineItemCollector(const TextMeasurer& measurer, const IntrinsicSizer& sizer,
                        const ImageFetchFn& image_fetcher,
                        core::DiagnosticEmitter* diagnostics = nullptr)
        : measurer_(measurer), sizer_(sizer), image_fetcher_(image_fetcher),
          diagnostics_(diagnostics) {}

    // Items for the children of container. containing_width is the
    // container's content width, used for percentages and shrink-to-fit.
    // Inline elements nested deeper than kMaxLayoutDepth are skipped with a
    // layout/depth warning.
    std::vector<InlineItem> collect(const dom::Node& container, const StylePtr& container_style,
                                    float containing_width) const;

private:
    struct State {
        std::vector<InlineItem> items;
        bool first_letter_pending = false;
        bool after_space = true;
        StylePtr first_letter_style;
        float containing_width = 0;
        int depth = 0;
        bool truncated = false;
    };

    void collect_node(const dom::Node& node, const StylePtr& parent_style, State& state) const;
    void collect_text(const dom::Node& node, const std::string& data, const StylePtr& style,
                      State& state) const;
    void push_text(const dom::Node& node, const StylePtr& style, std::string text,
                   size_t start, size_t end, bool whitespace_only, State& state) const;
    InlineItem make_atomic(InlineItemType type, const dom::Node& node, const StylePtr& style,
                           const State& state) const;

    const TextMeasurer& measurer_;
    const IntrinsicSizer& sizer_;
    const ImageFetchFn& image_fetcher_;
    core::DiagnosticEmitter* diagnostics_;
};

} // namespace boxflow::layout
