#include <boxflow/layout/geometry.h>
#include <algorithm>

namespace boxflow::layout {

Rect Rect::united(const Rect& other) const {
    float left = std::min(x, other.x);
    float top = std::min(y, other.y);
    float r = std::max(right(), other.right());
    float b = std::max(bottom(), other.bottom());
    return {left, top, r - left, b - top};
}

} // namespace boxflow::layout
