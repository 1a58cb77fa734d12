#include <boxflow/layout/box.h>

namespace boxflow::layout {

Box& Box::append_child(std::unique_ptr<Box> child) {
    child->parent = this;
    children.push_back(std::move(child));
    return *children.back();
}

Point Box::absolute_position() const {
    Point p{geometry.x, geometry.y};
    for (const Box* b = parent; b; b = b->parent) {
        p.x += b->geometry.content_left();
        p.y += b->geometry.content_top();
    }
    return p;
}

void Box::translate(float dx, float dy) {
    geometry.x += dx;
    geometry.y += dy;
    for (auto& f : fragments) {
        f.rect.x += dx;
        f.rect.y += dy;
    }
}

Point content_offset_within(const Box& descendant, const Box& ancestor) {
    Point p;
    for (const Box* b = &descendant; b && b != &ancestor; b = b->parent) {
        p.x += b->geometry.content_left();
        p.y += b->geometry.content_top();
    }
    return p;
}

} // namespace boxflow::layout
