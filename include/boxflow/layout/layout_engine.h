#pragma once
#include <boxflow/core/diagnostics.h>
#include <boxflow/dom/node.h>
#include <boxflow/layout/box.h>
#include <boxflow/layout/image_size.h>
#include <boxflow/layout/inline_item.h>
#include <boxflow/layout/intrinsic_sizes.h>
#include <boxflow/layout/layout_context.h>
#include <boxflow/layout/margins.h>
#include <boxflow/layout/text_measurer.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace boxflow::layout {

class InlineBoxTracker;

// Input of the collaborator entry point.
struct LayoutInput {
    float available_width = 0;
    std::optional<float> available_height;   // nullopt when indefinite
    Box* parent = nullptr;                   // containing-block box, back-reference only
};

class LayoutEngine {
public:
    LayoutEngine();

    LayoutEngine(const LayoutEngine&) = delete;
    LayoutEngine& operator=(const LayoutEngine&) = delete;

    // Compute layout for the tree rooted at root against the viewport.
    std::unique_ptr<Box> layout(const dom::Node& root);

    // Lay out one subtree inside a caller-owned context. Used by table, flex
    // and grid layout for their items, and by generated content.
    std::unique_ptr<Box> layout_subtree(const dom::Node& node, const LayoutInput& input,
                                        LayoutContext& context);

    // min-content / max-content of node's content box, without layout.
    IntrinsicSizes intrinsic_sizes(const dom::Node& node) const;

    // Float queries for layouts that share a formatting context with floats.
    // origin_x and width describe the querying container's content box in
    // flow coordinates.
    InlineOffsets available_inline_size(const LayoutContext& context, float y, float height,
                                        float origin_x, float width) const;
    float clearance_y(const LayoutContext& context, css::Clear clear, float y) const;

    void set_viewport(float width, float height) {
        viewport_width_ = width;
        viewport_height_ = height;
    }
    float viewport_width() const { return viewport_width_; }
    float viewport_height() const { return viewport_height_; }

    // Scroll offset applied to position: fixed boxes.
    void set_scroll_y(float offset) { scroll_y_ = offset; }

    void set_text_measurer(TextMeasureFn fn) { measurer_.set_measure_fn(std::move(fn)); }
    void set_image_fetcher(ImageFetchFn fn) { image_fetcher_ = std::move(fn); }

    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }

private:
    struct BlockInput {
        float x = 0;                 // margin-box origin in the parent's content box
        float y = 0;
        float containing_width = 0;
        std::optional<float> containing_height;
        Point parent_origin;         // parent's content origin in flow coordinates
        bool is_root = false;
        std::optional<float> stretched_height;   // abs boxes with top and bottom set
    };

    struct BlockResult {
        std::unique_ptr<Box> box;
        MarginStrut end_strut;       // margins that may still collapse below the box
    };

    struct FlowInput {
        float content_width = 0;
        std::optional<float> content_height;
        Point origin;                // content origin in flow coordinates
        bool absorb_top = false;     // top margin collapses with the first child
        bool collapse_bottom = false;
    };

    struct FlowState;

    struct FlowResult {
        float content_height = 0;
        MarginStrut trailing;        // bottom margins passed through to the parent
    };

    BlockResult layout_block(const dom::Node& node, const StylePtr& style,
                             const BlockInput& in, LayoutContext& ctx);

    float compute_width(const dom::Node& node, const css::ComputedStyle& style, Box& box,
                        const BlockInput& in) const;
    std::optional<float> explicit_height(const css::ComputedStyle& style, const Box& box,
                                         const BlockInput& in) const;

    FlowResult layout_flow(const dom::Node& node, const StylePtr& style, Box& box,
                           const FlowInput& in, LayoutContext& ctx);
    void layout_inline_run(std::vector<InlineItem> run, const StylePtr& style, Box& box,
                           const FlowInput& in, FlowState& state, InlineBoxTracker& tracker,
                           LayoutContext& ctx);
    void layout_block_child(const InlineItem& item, Box& box, const FlowInput& in,
                            FlowState& state, InlineBoxTracker& tracker, LayoutContext& ctx);

    // Pre-lays out an atomic or floated item so its margin box is known.
    std::unique_ptr<Box> layout_atomic(InlineItem& item, const FlowInput& in, LayoutContext& ctx);

    // Top margin of node as seen by its previous sibling, including margins
    // of first children it collapses with.
    MarginStrut effective_top_margin(const dom::Node& node, const StylePtr& style,
                                     float containing_width, int depth) const;
    bool is_collapse_through(const dom::Node& node, const StylePtr& style,
                             float containing_width, int depth) const;

    void layout_positioned(PositionedScope& scope, Box& containing_block, bool initial,
                           LayoutContext& ctx);
    void place_positioned(const PendingPositioned& pending, Box& containing_block,
                          const Rect& area, LayoutContext& ctx);
    static void apply_relative_offset(Box& box, float containing_width,
                                      std::optional<float> containing_height);

    // Member order matters: the sizer and collector keep references to the
    // emitter, the measurer and the image fetcher.
    core::DiagnosticEmitter diagnostics_;
    TextMeasurer measurer_;
    ImageFetchFn image_fetcher_;
    IntrinsicSizer sizer_;
    InlineItemCollector collector_;

    float viewport_width_;
    float viewport_height_;
    float scroll_y_ = 0;
    std::uint64_t pass_ = 0;
};

} // namespace boxflow::layout
