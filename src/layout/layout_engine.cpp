#include <boxflow/layout/layout_engine.h>
#include <boxflow/core/config.h>
#include <boxflow/dom/element.h>
#include <boxflow/dom/text.h>
#include <boxflow/layout/box_model.h>
#include <boxflow/layout/constraint_space.h>
#include <boxflow/layout/inline_box_tracker.h>
#include <boxflow/layout/inline_layout.h>
#include <algorithm>
#include <limits>
#include <sstream>

namespace boxflow::layout {

namespace {

constexpr float kIndefinite = std::numeric_limits<float>::infinity();

bool is_img(const dom::Node& node) {
    return node.is_element() && tag_name_of(node) == "img";
}

// One step of a container's flow as margin collapsing sees it: a block-level
// child, or inline content (node == nullptr) that starts a line box.
struct FlowEvent {
    const dom::Node* node = nullptr;
    StylePtr style;
};

// Mirrors how the collector flattens inline elements, so margin queries
// agree with the flow that is actually laid out.
void flatten_flow(const dom::Node& node, const StylePtr& style, float containing_width,
                  std::vector<FlowEvent>& out, int depth = 0) {
    if (depth >= core::config::kMaxLayoutDepth) return;
    node.for_each_child([&](const dom::Node& child) {
        StylePtr cs = resolve_style(child, style);
        if (child.is_text()) {
            const auto& data = static_cast<const dom::Text&>(child).data();
            bool visible = cs->white_space == css::WhiteSpace::Pre
                ? !data.empty()
                : !is_whitespace_only(data);
            if (visible) out.push_back({});
            return;
        }
        css::Display display = effective_display(*cs);
        if (display == css::Display::None || is_out_of_flow(*cs) ||
            cs->float_val != css::Float::None) {
            return;
        }
        if (is_block_level(display)) {
            out.push_back({&child, cs});
            return;
        }
        std::string tag = tag_name_of(child);
        if (display == css::Display::InlineBlock || tag == "img" || tag == "br") {
            out.push_back({});
            return;
        }
        bool tags = !contains_only_blocks(child, cs);
        EdgeSizes margin = resolve_margin(*cs, containing_width);
        EdgeSizes padding = resolve_padding(*cs, containing_width);
        EdgeSizes border = resolve_border(*cs);
        if (tags && margin.left + border.left + padding.left > 0) out.push_back({});
        flatten_flow(child, cs, containing_width, out, depth + 1);
        if (tags && margin.right + border.right + padding.right > 0) out.push_back({});
    });
}

std::optional<float> resolve_max(const std::optional<css::Length>& max, float base,
                                 const css::ComputedStyle& style) {
    if (!max) return std::nullopt;
    return resolve_length(*max, base, style);
}

} // namespace

struct LayoutEngine::FlowState {
    float cursor = 0;            // bottom border edge of the last in-flow content
    MarginStrut pending;         // margins not yet resolved into a position
    bool absorbing = false;      // still collapsing into the parent's top margin
    float content_bottom = 0;
    size_t line_base = 0;        // lines emitted by earlier inline runs
};

LayoutEngine::LayoutEngine()
    : sizer_(measurer_, image_fetcher_),
      collector_(measurer_, sizer_, image_fetcher_, &diagnostics_),
      viewport_width_(static_cast<float>(core::config::kDefaultViewportWidth)),
      viewport_height_(static_cast<float>(core::config::kDefaultViewportHeight)) {}

std::unique_ptr<Box> LayoutEngine::layout(const dom::Node& root) {
    diagnostics_.set_correlation_id(++pass_);
    {
        std::ostringstream msg;
        msg << "viewport " << viewport_width_ << "x" << viewport_height_;
        diagnostics_.info("layout", "begin", msg.str());
    }

    LayoutContext ctx(&diagnostics_);
    PositionedScope initial(ctx);

    StylePtr style = resolve_style(root, nullptr);
    BlockInput in;
    in.containing_width = viewport_width_;
    in.containing_height = viewport_height_;
    in.is_root = true;
    BlockResult result = layout_block(root, style, in, ctx);
    apply_relative_offset(*result.box, viewport_width_, viewport_height_);
    layout_positioned(initial, *result.box, true, ctx);

    std::ostringstream msg;
    msg << "root " << result.box->geometry.width << "x" << result.box->geometry.height;
    diagnostics_.info("layout", "end", msg.str());
    return std::move(result.box);
}

std::unique_ptr<Box> LayoutEngine::layout_subtree(const dom::Node& node, const LayoutInput& input,
                                                  LayoutContext& context) {
    std::optional<PositionedScope> initial;
    if (!context.has_positioned_frame()) initial.emplace(context);

    StylePtr parent_style = input.parent ? input.parent->style : nullptr;
    StylePtr style = resolve_style(node, parent_style);
    BlockInput in;
    in.containing_width = input.available_width;
    in.containing_height = input.available_height;
    in.is_root = true;
    BlockResult result = layout_block(node, style, in, context);
    result.box->parent = input.parent;
    if (initial) layout_positioned(*initial, *result.box, true, context);
    return std::move(result.box);
}

IntrinsicSizes LayoutEngine::intrinsic_sizes(const dom::Node& node) const {
    StylePtr parent_style;
    if (node.parent()) parent_style = resolve_style(*node.parent(), nullptr);
    StylePtr style = resolve_style(node, parent_style);
    return sizer_.content_sizes(node, *style);
}

InlineOffsets LayoutEngine::available_inline_size(const LayoutContext& context, float y,
                                                  float height, float origin_x,
                                                  float width) const {
    return context.floats().exclusion_space(origin_x, 0, width).available_inline_size(y, height);
}

float LayoutEngine::clearance_y(const LayoutContext& context, css::Clear clear, float y) const {
    return context.floats().clearance_y(clear, y);
}

// ---------------------------------------------------------------------------
// Block boxes
// ---------------------------------------------------------------------------

LayoutEngine::BlockResult LayoutEngine::layout_block(const dom::Node& node, const StylePtr& style,
                                                     const BlockInput& in, LayoutContext& ctx) {
    BlockResult result;
    result.box = std::make_unique<Box>();
    Box& box = *result.box;
    box.node = &node;
    box.style = style;
    const css::ComputedStyle& s = *style;
    box.position = s.position;
    box.z_index = s.z_index;
    auto& g = box.geometry;

    LayoutDepthGuard guard(ctx);
    if (guard.exceeded()) {
        if (auto* diagnostics = ctx.diagnostics()) {
            std::ostringstream msg;
            msg << "<" << tag_name_of(node) << "> exceeds depth "
                << core::config::kMaxLayoutDepth << "; laid out as an empty box";
            diagnostics->warning("layout", "depth", msg.str());
        }
        g.x = in.x;
        g.y = in.y;
        return result;
    }

    css::Display display = effective_display(s);
    if (display == css::Display::None) {
        return result;
    }

    float cw = in.containing_width;
    g.margin = resolve_margin(s, cw);
    g.padding = resolve_padding(s, cw);
    g.border = resolve_border(s);
    box.establishes_bfc = establishes_bfc(s, in.is_root);
    box.kind = display == css::Display::InlineBlock ? BoxKind::InlineBlock : BoxKind::Block;

    std::optional<ImageSize> image;
    if (is_img(node)) {
        const auto& el = static_cast<const dom::Element&>(node);
        image = resolve_image_size(el, s, image_fetcher_, cw, in.containing_height);
        box.kind = BoxKind::Replaced;
        box.image_src = el.get_attribute("src").value_or("");
        if (image->placeholder && ctx.diagnostics()) {
            ctx.diagnostics()->warning("layout", "image",
                "no size for image '" + box.image_src + "'; using placeholder");
        }
        g.width = image->width;
    } else {
        g.width = compute_width(node, s, box, in);
    }

    // Auto margins center in-flow block-level boxes.
    bool in_flow_block = is_block_level(display) && s.float_val == css::Float::None &&
        !is_out_of_flow(s);
    if (in_flow_block && (s.margin.left.is_auto() || s.margin.right.is_auto())) {
        float remaining = cw - g.border_box_width() - g.margin.horizontal();
        remaining = std::max(0.0f, remaining);
        if (s.margin.left.is_auto() && s.margin.right.is_auto()) {
            g.margin.left += remaining / 2.0f;
            g.margin.right += remaining / 2.0f;
        } else if (s.margin.left.is_auto()) {
            g.margin.left += remaining;
        } else {
            g.margin.right += remaining;
        }
    }

    g.x = in.x + g.margin.left;
    g.y = in.y + g.margin.top;

    std::optional<float> height = image ? std::optional<float>(image->height)
                                        : explicit_height(s, box, in);

    std::optional<BfcScope> bfc;
    if (box.establishes_bfc) bfc.emplace(ctx.floats());
    std::optional<PositionedScope> positioned;
    if (s.position != css::Position::Static) positioned.emplace(ctx);

    Point origin{in.parent_origin.x + g.content_left(), in.parent_origin.y + g.content_top()};
    bool collapse_bottom = false;
    float content_height = 0;
    if (!image) {
        FlowInput flow;
        flow.content_width = g.width;
        flow.content_height = height;
        flow.origin = origin;
        flow.absorb_top = can_collapse_top_with_children(s, in.is_root);
        flow.collapse_bottom = can_collapse_bottom_with_children(s, in.is_root);
        FlowResult fr = layout_flow(node, style, box, flow, ctx);
        content_height = fr.content_height;
        collapse_bottom = flow.collapse_bottom;
        if (collapse_bottom) result.end_strut = fr.trailing;
    }
    result.end_strut.append(g.margin.bottom);

    if (height) {
        g.height = *height;
    } else {
        g.height = content_height;
        if (box.establishes_bfc) {
            if (auto lowest = ctx.floats().lowest_bottom()) {
                g.height = std::max(g.height, *lowest - origin.y);
            }
        }
    }

    // Percentage min/max heights need a definite containing block.
    std::optional<float> cb_height = s.position == css::Position::Fixed
        ? std::optional<float>(viewport_height_)
        : in.containing_height;
    float min_h = 0;
    if (!s.min_height.is_percent() || cb_height) {
        min_h = resolve_length(s.min_height, cb_height.value_or(0), s);
    }
    std::optional<float> max_h;
    if (s.max_height && (!s.max_height->is_percent() || cb_height)) {
        max_h = resolve_max(s.max_height, cb_height.value_or(0), s);
    }
    if (s.box_sizing == css::BoxSizing::BorderBox) {
        float edges = g.border.vertical() + g.padding.vertical();
        min_h = std::max(0.0f, min_h - edges);
        if (max_h) max_h = std::max(0.0f, *max_h - edges);
    }
    g.height = clamp_min_max(g.height, min_h, max_h);

    bfc.reset();
    if (positioned) layout_positioned(*positioned, box, false, ctx);
    return result;
}

float LayoutEngine::compute_width(const dom::Node& node, const css::ComputedStyle& s, Box& box,
                                  const BlockInput& in) const {
    const auto& g = box.geometry;
    bool out_of_flow = is_out_of_flow(s);
    float base = s.position == css::Position::Fixed ? viewport_width_ : in.containing_width;
    float edges = g.border.horizontal() + g.padding.horizontal();
    bool border_box = s.box_sizing == css::BoxSizing::BorderBox;

    float width;
    if (!s.width.is_auto()) {
        width = resolve_length(s.width, base, s);
        if (border_box) width -= edges;
    } else if (out_of_flow && !s.left_pos.is_auto() && !s.right_pos.is_auto()) {
        width = base - resolve_length(s.left_pos, base, s) - resolve_length(s.right_pos, base, s) -
            g.margin.horizontal() - edges;
    } else if (out_of_flow || s.float_val != css::Float::None ||
               s.display == css::Display::InlineBlock || s.display == css::Display::Table) {
        float available = base - g.margin.horizontal() - edges;
        width = IntrinsicSizer::shrink_to_fit(sizer_.content_sizes(node, s), available);
    } else {
        width = in.containing_width - g.margin.horizontal() - edges;
    }

    float min_w = resolve_length(s.min_width, base, s);
    std::optional<float> max_w = resolve_max(s.max_width, base, s);
    if (border_box) {
        min_w = std::max(0.0f, min_w - edges);
        if (max_w) max_w = std::max(0.0f, *max_w - edges);
    }
    return clamp_min_max(std::max(0.0f, width), min_w, max_w);
}

std::optional<float> LayoutEngine::explicit_height(const css::ComputedStyle& s, const Box& box,
                                                   const BlockInput& in) const {
    const auto& g = box.geometry;
    float edges = g.border.vertical() + g.padding.vertical();
    if (in.stretched_height) {
        return std::max(0.0f, *in.stretched_height - g.margin.vertical() - edges);
    }
    if (s.height.is_auto()) return std::nullopt;

    float h;
    if (s.height.is_percent()) {
        std::optional<float> base = s.position == css::Position::Fixed
            ? std::optional<float>(viewport_height_)
            : in.containing_height;
        if (!base) return std::nullopt;
        h = resolve_length(s.height, *base, s);
    } else {
        h = resolve_length(s.height, 0, s);
    }
    if (s.box_sizing == css::BoxSizing::BorderBox) h -= edges;
    return std::max(0.0f, h);
}

// ---------------------------------------------------------------------------
// Flow of a block container
// ---------------------------------------------------------------------------

LayoutEngine::FlowResult LayoutEngine::layout_flow(const dom::Node& node, const StylePtr& style,
                                                   Box& box, const FlowInput& in,
                                                   LayoutContext& ctx) {
    FlowState state;
    state.absorbing = in.absorb_top;
    InlineBoxTracker tracker(box);

    // Inline runs between block children go through the inline pipeline;
    // block children are laid out here, where margins can collapse.
    std::vector<InlineItem> items = collector_.collect(node, style, in.content_width);
    std::vector<InlineItem> run;
    for (auto& item : items) {
        if (item.type == InlineItemType::BlockChild) {
            if (!run.empty()) {
                layout_inline_run(std::move(run), style, box, in, state, tracker, ctx);
                run.clear();
            }
            layout_block_child(item, box, in, state, tracker, ctx);
        } else {
            run.push_back(std::move(item));
        }
    }
    if (!run.empty()) {
        layout_inline_run(std::move(run), style, box, in, state, tracker, ctx);
    }
    tracker.finish();

    FlowResult result;
    if (in.collapse_bottom) {
        result.content_height = state.content_bottom;
        result.trailing = state.pending;
    } else {
        result.content_height = std::max(state.content_bottom,
                                         state.cursor + state.pending.sum());
    }
    return result;
}

std::unique_ptr<Box> LayoutEngine::layout_atomic(InlineItem& item, const FlowInput& in,
                                                 LayoutContext& ctx) {
    // Floats and inline-blocks establish their own formatting context, so
    // their content does not depend on where they end up.
    BlockInput bi;
    bi.containing_width = in.content_width;
    bi.containing_height = in.content_height;
    BlockResult r = layout_block(*item.node, item.style, bi, ctx);
    const auto& g = r.box->geometry;
    item.margin = g.margin;
    item.width = g.margin_box_width();
    item.height = g.margin_box_height();
    return std::move(r.box);
}

void LayoutEngine::layout_inline_run(std::vector<InlineItem> run, const StylePtr& style, Box& box,
                                     const FlowInput& in, FlowState& state,
                                     InlineBoxTracker& tracker, LayoutContext& ctx) {
    const css::ComputedStyle& s = *style;

    std::vector<std::unique_ptr<Box>> atomics(run.size());
    for (size_t i = 0; i < run.size(); ++i) {
        if (run[i].type == InlineItemType::Atomic || run[i].type == InlineItemType::Float) {
            atomics[i] = layout_atomic(run[i], in, ctx);
        }
    }
    bool has_content = std::any_of(run.begin(), run.end(), is_line_content);

    float start_y = state.cursor + (state.absorbing ? 0.0f : state.pending.sum());
    ConstraintSpace space = ConstraintSpace(Size{in.content_width, in.content_height.value_or(kIndefinite)},
                                            s.text_align, s.white_space != css::WhiteSpace::Normal)
        .with_exclusion_space(ctx.floats().exclusion_space(in.origin.x, in.origin.y,
                                                           in.content_width));

    InlineLayoutAlgorithm algorithm(ctx.diagnostics());
    InlineLayoutResult res = algorithm.run(std::move(run), space, start_y,
                                                 measurer_.line_height(s));

    for (const Fragment& f : res.fragments) {
        const InlineItem& item = res.items[f.item_index];
        const LineBox& line = res.line_boxes[f.line_index];
        size_t line_id = state.line_base + f.line_index;
        switch (f.type) {
            case FragmentType::Text: {
                auto text = std::make_unique<Box>();
                text->kind = BoxKind::Text;
                text->node = f.node;
                text->style = f.style;
                text->text = f.text;
                text->geometry.x = f.position.x;
                text->geometry.y = f.position.y;
                text->geometry.width = f.size.width;
                text->geometry.height = f.size.height;
                tracker.add_content(std::move(text), line_id, line);
                break;
            }
            case FragmentType::Atomic: {
                std::unique_ptr<Box> child = std::move(atomics[f.item_index]);
                if (!child) break;
                child->geometry.x = f.position.x;
                child->geometry.y = f.position.y;
                Box* placed = child.get();
                tracker.add_content(std::move(child), line_id, line);
                apply_relative_offset(*placed, in.content_width, in.content_height);
                break;
            }
            case FragmentType::Float: {
                std::unique_ptr<Box> child = std::move(atomics[f.item_index]);
                if (!child) break;
                child->geometry.x = f.position.x;
                child->geometry.y = f.position.y;
                FloatInfo info;
                info.box = child.get();
                info.side = item.style->float_val;
                info.margin_rect = {in.origin.x + f.position.x - item.margin.left,
                                    in.origin.y + f.position.y - item.margin.top,
                                    item.width, item.height};
                info.start_y = in.origin.y + line.y;
                ctx.floats().add(info);
                Box* placed = child.get();
                tracker.add_float(std::move(child));
                apply_relative_offset(*placed, in.content_width, in.content_height);
                break;
            }
            case FragmentType::OpenTag:
                tracker.open(item, f, line_id, line);
                break;
            case FragmentType::CloseTag:
                tracker.close(f, line_id, line);
                break;
            case FragmentType::OutOfFlowPlaceholder:
                ctx.queue_positioned({f.node, f.style, &box, f.position});
                break;
            case FragmentType::Control:
            case FragmentType::BlockPlaceholder:
                break;
        }
    }

    for (const LineBox& line : res.line_boxes) {
        if (line.height > 0) box.line_boxes.push_back(line);
    }
    state.line_base += res.line_boxes.size();

    if (has_content) {
        state.cursor = start_y + res.height;
        state.pending = MarginStrut{};
        state.absorbing = false;
        state.content_bottom = std::max(state.content_bottom, state.cursor);
    }
}

void LayoutEngine::layout_block_child(const InlineItem& item, Box& box, const FlowInput& in,
                                      FlowState& state, InlineBoxTracker& tracker,
                                      LayoutContext& ctx) {
    const dom::Node& child = *item.node;
    const StylePtr& style = item.style;
    const css::ComputedStyle& s = *style;
    EdgeSizes margin = resolve_margin(s, in.content_width);

    bool collapses = should_collapse_margins(s);
    bool through = collapses && is_collapse_through(child, style, in.content_width, 0);

    float border_top;
    if (!collapses) {
        state.cursor += state.pending.sum();
        state.pending = MarginStrut{};
        state.absorbing = false;
        border_top = state.cursor + margin.top;
    } else {
        MarginStrut top = effective_top_margin(child, style, in.content_width, 0);
        if (s.clear != css::Clear::None) state.absorbing = false;
        if (state.absorbing) {
            border_top = state.cursor;
        } else {
            MarginStrut combined = state.pending;
            combined.append(top);
            border_top = state.cursor + combined.sum();
            if (through) {
                state.pending.append(top);
                state.pending.append(margin.bottom);
            }
        }
    }
    if (s.clear != css::Clear::None) {
        float cleared = ctx.floats().clearance_y(s.clear, in.origin.y + border_top) - in.origin.y;
        border_top = std::max(border_top, cleared);
    }

    BlockInput bi;
    bi.containing_width = in.content_width;
    bi.containing_height = in.content_height;
    bi.parent_origin = in.origin;
    bi.y = border_top - margin.top;
    if (establishes_bfc(s, false)) {
        // The border box of a formatting context root may not overlap floats.
        InlineOffsets offsets = ctx.floats()
            .exclusion_space(in.origin.x, in.origin.y, in.content_width)
            .available_inline_size(border_top, 0);
        bi.x = offsets.left;
        bi.containing_width = std::max(0.0f, in.content_width - offsets.left - offsets.right);
    }

    BlockResult r = layout_block(child, style, bi, ctx);
    const auto& g = r.box->geometry;
    float bottom = g.y + g.border_box_height();

    if (!collapses) {
        state.cursor = bottom + g.margin.bottom;
        state.content_bottom = std::max(state.content_bottom, state.cursor);
    } else if (!through) {
        state.cursor = bottom;
        state.pending = r.end_strut;
        state.absorbing = false;
        state.content_bottom = std::max(state.content_bottom, bottom);
    }

    apply_relative_offset(*r.box, in.content_width, in.content_height);
    tracker.add_block(std::move(r.box));
}

MarginStrut LayoutEngine::effective_top_margin(const dom::Node& node, const StylePtr& style,
                                               float containing_width, int depth) const {
    MarginStrut strut;
    strut.append(resolve_margin(*style, containing_width).top);
    if (depth >= core::config::kMaxLayoutDepth || is_img(node) ||
        !can_collapse_top_with_children(*style, false)) {
        return strut;
    }

    std::vector<FlowEvent> events;
    flatten_flow(node, style, containing_width, events);
    for (const auto& e : events) {
        if (!e.node) break;
        const css::ComputedStyle& cs = *e.style;
        if (!should_collapse_margins(cs) || cs.clear != css::Clear::None) break;
        strut.append(effective_top_margin(*e.node, e.style, containing_width, depth + 1));
        if (!is_collapse_through(*e.node, e.style, containing_width, depth + 1)) break;
        strut.append(resolve_margin(cs, containing_width).bottom);
    }
    return strut;
}

bool LayoutEngine::is_collapse_through(const dom::Node& node, const StylePtr& style,
                                       float containing_width, int depth) const {
    const css::ComputedStyle& s = *style;
    if (depth >= core::config::kMaxLayoutDepth || is_img(node)) return false;
    if (!should_collapse_margins(s) || establishes_bfc(s, false) || s.clear != css::Clear::None) {
        return false;
    }
    if (!s.height.is_auto() && !s.height.is_zero()) return false;
    if (!s.min_height.is_zero()) return false;
    if (s.border_top.used_width(s.font_size_px()) > 0 ||
        s.border_bottom.used_width(s.font_size_px()) > 0 ||
        !s.padding.top.is_zero() || !s.padding.bottom.is_zero()) {
        return false;
    }

    std::vector<FlowEvent> events;
    flatten_flow(node, style, containing_width, events);
    for (const auto& e : events) {
        if (!e.node) return false;
        if (!is_collapse_through(*e.node, e.style, containing_width, depth + 1)) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Positioning
// ---------------------------------------------------------------------------

void LayoutEngine::layout_positioned(PositionedScope& scope, Box& containing_block, bool initial,
                                     LayoutContext& ctx) {
    // Laying out a positioned box can queue more fixed boxes on this frame.
    std::vector<PendingPositioned> batch;
    while (!(batch = scope.take_pending()).empty()) {
        for (const auto& pending : batch) {
            const auto& g = containing_block.geometry;
            bool fixed = pending.style->position == css::Position::Fixed;
            Rect area;
            if (initial || fixed) {
                Point abs = containing_block.absolute_position();
                area = {-(abs.x + g.border.left + g.padding.left),
                        -(abs.y + g.border.top + g.padding.top),
                        viewport_width_, viewport_height_};
                if (fixed) area.y += scroll_y_;
            } else {
                area = {-g.padding.left, -g.padding.top,
                        g.width + g.padding.horizontal(), g.height + g.padding.vertical()};
            }
            place_positioned(pending, containing_block, area, ctx);
        }
    }
}

void LayoutEngine::place_positioned(const PendingPositioned& pending, Box& containing_block,
                                    const Rect& area, LayoutContext& ctx) {
    const css::ComputedStyle& s = *pending.style;

    Point static_pos = pending.static_offset;
    if (pending.static_parent) {
        Point offset = content_offset_within(*pending.static_parent, containing_block);
        static_pos.x += offset.x;
        static_pos.y += offset.y;
    }

    float left = resolve_length(s.left_pos, area.width, s);
    float right = resolve_length(s.right_pos, area.width, s);
    float top = resolve_length(s.top, area.height, s);
    float bottom = resolve_length(s.bottom, area.height, s);

    BlockInput bi;
    bi.containing_width = area.width;
    bi.containing_height = area.height;
    if (s.height.is_auto() && !s.top.is_auto() && !s.bottom.is_auto()) {
        bi.stretched_height = area.height - top - bottom;
    }
    BlockResult r = layout_block(*pending.node, pending.style, bi, ctx);
    auto& g = r.box->geometry;

    if (!s.left_pos.is_auto()) {
        g.x = area.x + left + g.margin.left;
    } else if (!s.right_pos.is_auto()) {
        g.x = area.right() - right - g.margin.right - g.border_box_width();
    } else {
        g.x = static_pos.x + g.margin.left;
    }
    if (!s.top.is_auto()) {
        g.y = area.y + top + g.margin.top;
    } else if (!s.bottom.is_auto()) {
        g.y = area.bottom() - bottom - g.margin.bottom - g.border_box_height();
    } else {
        g.y = static_pos.y + g.margin.top;
    }
    containing_block.append_child(std::move(r.box));
}

void LayoutEngine::apply_relative_offset(Box& box, float containing_width,
                                         std::optional<float> containing_height) {
    if (!box.style || box.style->position != css::Position::Relative) return;
    Point offset = relative_offset(*box.style, containing_width, containing_height);
    box.translate(offset.x, offset.y);
}

} // namespace boxflow::layout
