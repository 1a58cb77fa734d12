#include <boxflow/layout/inline_box_tracker.h>
#include <boxflow/layout/box_model.h>
#include <algorithm>

namespace boxflow::layout {

void InlineBoxTracker::open(const InlineItem& item, const Fragment& fragment, size_t line_id,
                            const LineBox& line) {
    Frame frame;
    frame.box = std::make_unique<Box>();
    Box& box = *frame.box;
    box.kind = BoxKind::Inline;
    box.node = item.node;
    box.style = item.style;
    if (item.style) {
        box.position = item.style->position;
        box.z_index = item.style->z_index;
        box.geometry.border = resolve_border(*item.style);
        box.geometry.padding = resolve_padding(*item.style, container_.geometry.width);
    }
    // Vertical margins of inline boxes have no effect.
    box.geometry.margin.left = item.margin.left;
    box.geometry.margin.right = item.margin.right;
    stack_.push_back(std::move(frame));

    float start = fragment.position.x + item.margin.left;
    extend(start, fragment.position.x + fragment.size.width, line_id, line);
    region_for(stack_.back(), line_id, line, start).has_start = true;
}

void InlineBoxTracker::close(const Fragment& fragment, size_t line_id, const LineBox& line) {
    if (stack_.empty()) return;
    float end = fragment.position.x + fragment.size.width -
        stack_.back().box->geometry.margin.right;
    extend(fragment.position.x, end, line_id, line);
    region_for(stack_.back(), line_id, line, fragment.position.x).has_end = true;

    Frame frame = std::move(stack_.back());
    stack_.pop_back();
    finalize(std::move(frame));
}

void InlineBoxTracker::add_content(std::unique_ptr<Box> box, size_t line_id, const LineBox& line) {
    Rect r = box->kind == BoxKind::Text ? box->geometry.border_box() : box->geometry.margin_box();
    extend(r.x, r.right(), line_id, line);
    emit(std::move(box));
}

void InlineBoxTracker::add_float(std::unique_ptr<Box> box) {
    emit(std::move(box));
}

void InlineBoxTracker::add_block(std::unique_ptr<Box> box) {
    emit(std::move(box));
}

void InlineBoxTracker::finish() {
    while (!stack_.empty()) {
        Frame frame = std::move(stack_.back());
        stack_.pop_back();
        if (!frame.regions.empty()) {
            frame.regions.back().has_end = true;
        }
        finalize(std::move(frame));
    }
}

InlineBoxTracker::Region& InlineBoxTracker::region_for(Frame& frame, size_t line_id,
                                                       const LineBox& line, float x) {
    for (auto it = frame.regions.rbegin(); it != frame.regions.rend(); ++it) {
        if (it->line_id == line_id) return *it;
    }
    const auto& g = frame.box->geometry;
    Region region;
    region.line_id = line_id;
    region.left = x;
    region.right = x;
    region.top = line.y - g.border.top - g.padding.top;
    region.bottom = line.y + line.height + g.padding.bottom + g.border.bottom;
    frame.regions.push_back(region);
    return frame.regions.back();
}

void InlineBoxTracker::extend(float left, float right, size_t line_id, const LineBox& line) {
    for (auto& frame : stack_) {
        Region& region = region_for(frame, line_id, line, left);
        region.left = std::min(region.left, left);
        region.right = std::max(region.right, right);
    }
}

void InlineBoxTracker::finalize(Frame frame) {
    Box& box = *frame.box;
    auto& g = box.geometry;

    Rect bounds;
    for (size_t i = 0; i < frame.regions.size(); ++i) {
        const Region& r = frame.regions[i];
        Rect rect{r.left, r.top, std::max(0.0f, r.right - r.left), r.bottom - r.top};
        bounds = i == 0 ? rect : bounds.united(rect);
        box.fragments.push_back({rect, BorderEdgeFlags{r.has_start, r.has_end}});
    }

    g.x = bounds.x;
    g.y = bounds.y;
    g.width = std::max(0.0f, bounds.width - g.border.horizontal() - g.padding.horizontal());
    g.height = std::max(0.0f, bounds.height - g.border.vertical() - g.padding.vertical());

    float cx = g.content_left();
    float cy = g.content_top();
    for (auto& child : frame.children) {
        child->translate(-cx, -cy);
        box.append_child(std::move(child));
    }

    if (box.style && box.style->position == css::Position::Relative) {
        Point offset = relative_offset(*box.style, container_.geometry.width, std::nullopt);
        box.translate(offset.x, offset.y);
    }

    emit(std::move(frame.box));
}

void InlineBoxTracker::emit(std::unique_ptr<Box> box) {
    if (!stack_.empty()) {
        stack_.back().children.push_back(std::move(box));
    } else {
        container_.append_child(std::move(box));
    }
}

} // namespace boxflow::layout
