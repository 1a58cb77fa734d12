#include <boxflow/layout/float_context.h>
#include <algorithm>

namespace boxflow::layout {

void FloatContext::add(const FloatInfo& info) {
    floats_.push_back(info);
}

ExclusionSpace FloatContext::exclusion_space(float origin_x, float origin_y, float width) const {
    ExclusionSpace space;
    for (size_t i = bfc_base(); i < floats_.size(); ++i) {
        const auto& f = floats_[i];
        Exclusion e;
        e.side = f.side;
        e.rect.y = f.margin_rect.y - origin_y;
        e.rect.width = f.margin_rect.width;
        e.rect.height = f.margin_rect.height;
        if (f.side == css::Float::Right) {
            e.rect.x = (origin_x + width) - f.margin_rect.right();
        } else {
            e.rect.x = f.margin_rect.x - origin_x;
        }
        space = space.add(e);
    }
    return space;
}

float FloatContext::clearance_y(css::Clear clear, float y) const {
    if (clear == css::Clear::None) return y;
    float result = y;
    for (size_t i = bfc_base(); i < floats_.size(); ++i) {
        const auto& f = floats_[i];
        bool matches = clear == css::Clear::Both ||
            (clear == css::Clear::Left && f.side == css::Float::Left) ||
            (clear == css::Clear::Right && f.side == css::Float::Right);
        if (matches) {
            result = std::max(result, f.margin_rect.bottom());
        }
    }
    return result;
}

std::optional<float> FloatContext::lowest_bottom() const {
    std::optional<float> result;
    for (size_t i = bfc_base(); i < floats_.size(); ++i) {
        float b = floats_[i].margin_rect.bottom();
        if (!result || b > *result) {
            result = b;
        }
    }
    return result;
}

void FloatContext::push_bfc() {
    bases_.push_back(floats_.size());
}

void FloatContext::pop_bfc() {
    if (bases_.empty()) return;
    floats_.resize(bases_.back());
    bases_.pop_back();
}

BfcScope::BfcScope(FloatContext& floats) : floats_(floats) {
    floats_.push_bfc();
}

BfcScope::~BfcScope() {
    floats_.pop_bfc();
}

} // namespace boxflow::layout
