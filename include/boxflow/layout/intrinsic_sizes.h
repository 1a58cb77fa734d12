#pragma once
#include <boxflow/css/computed_style.h>
#include <boxflow/dom/node.h>
#include <boxflow/layout/geometry.h>
#include <boxflow/layout/image_size.h>
#include <boxflow/layout/style_lookup.h>
#include <boxflow/layout/text_measurer.h>

namespace boxflow::layout {

// Pure min-content / max-content queries. Nothing here performs layout or
// touches float state.
class IntrinsicSizer {
public:
    IntrinsicSizer(const TextMeasurer& measurer, const ImageFetchFn& image_fetcher)
        : measurer_(measurer), image_fetcher_(image_fetcher) {}

    // Sizes of the content box of node, without its own edges.
    IntrinsicSizes content_sizes(const dom::Node& node, const css::ComputedStyle& style) const;

    // Margin-box contribution of node to its parent's intrinsic sizes.
    IntrinsicSizes contribution(const dom::Node& node, const css::ComputedStyle& style) const;

    // CSS 2.1 §10.3.5: min(max(min-content, available), max-content)
    static float shrink_to_fit(const IntrinsicSizes& sizes, float available);

private:
    IntrinsicSizes content_sizes_at(const dom::Node& node, const StylePtr& style, int depth) const;
    struct LineState;

    IntrinsicSizes contribution_at(const dom::Node& node, const StylePtr& style, int depth) const;
    // Inline children share one running line, so words and collapsed spaces
    // continue across sibling text nodes and into nested inline elements.
    void add_children(const dom::Node& node, const StylePtr& style, int depth,
                      LineState& state) const;
    void add_text(const std::string& text, const css::ComputedStyle& style,
                  LineState& state) const;

    const TextMeasurer& measurer_;
    const ImageFetchFn& image_fetcher_;
};

} // namespace boxflow::layout
