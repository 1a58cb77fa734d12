#include <boxflow/layout/exclusion_space.h>
#include <boxflow/core/config.h>
#include <boxflow/core/diagnostics.h>
#include <algorithm>
#include <sstream>

namespace boxflow::layout {

ExclusionSpace ExclusionSpace::add(const Exclusion& exclusion) const {
    ExclusionSpace result = *this;
    result.exclusions_.push_back(exclusion);
    return result;
}

InlineOffsets ExclusionSpace::available_inline_size(float y, float height) const {
    InlineOffsets offsets;
    for (const auto& e : exclusions_) {
        if (!e.rect.overlaps_band(y, height)) continue;
        float edge = e.rect.x + e.rect.width;
        if (e.side == css::Float::Left) {
            offsets.left = std::max(offsets.left, edge);
        } else if (e.side == css::Float::Right) {
            offsets.right = std::max(offsets.right, edge);
        }
    }
    return offsets;
}

std::optional<float> ExclusionSpace::next_bottom_below(float y) const {
    std::optional<float> result;
    for (const auto& e : exclusions_) {
        float b = e.rect.bottom();
        if (b > y && (!result || b < *result)) {
            result = b;
        }
    }
    return result;
}

float ExclusionSpace::clearance_y(css::Clear clear, float y) const {
    if (clear == css::Clear::None) return y;
    float result = y;
    for (const auto& e : exclusions_) {
        bool matches = clear == css::Clear::Both ||
            (clear == css::Clear::Left && e.side == css::Float::Left) ||
            (clear == css::Clear::Right && e.side == css::Float::Right);
        if (matches) result = std::max(result, e.rect.bottom());
    }
    return result;
}

std::optional<float> ExclusionSpace::last_top() const {
    if (exclusions_.empty()) return std::nullopt;
    return exclusions_.back().rect.y;
}

FloatPlacement place_float(const ExclusionSpace& space, css::Float side,
                           float width, float height, float container_width,
                           float start_y, core::DiagnosticEmitter* diagnostics) {
    auto own_side = [side](const InlineOffsets& o) {
        return side == css::Float::Right ? o.right : o.left;
    };
    auto other_side = [side](const InlineOffsets& o) {
        return side == css::Float::Right ? o.left : o.right;
    };

    float y = start_y;
    for (int i = 0; i < core::config::kMaxFloatDropIterations; ++i) {
        InlineOffsets offsets = space.available_inline_size(y, height);
        float opposite = other_side(offsets);
        if (opposite <= 0 || own_side(offsets) + width + opposite <= container_width) {
            return {own_side(offsets), y, false};
        }
        auto next = space.next_bottom_below(y);
        if (!next || *next - start_y > core::config::kMaxFloatDropDistance) {
            break;
        }
        y = *next;
    }

    if (diagnostics) {
        std::ostringstream msg;
        msg << "no fitting position for " << width << "px float below y=" << start_y
            << "; placed at its candidate position";
        diagnostics->warning("layout", "float-drop", msg.str());
    }
    return {own_side(space.available_inline_size(start_y, height)), start_y, true};
}

} // namespace boxflow::layout
