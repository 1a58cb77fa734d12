#pragma once
#include <boxflow/css/computed_style.h>
#include <boxflow/layout/exclusion_space.h>
#include <boxflow/layout/geometry.h>
#include <cstddef>
#include <optional>
#include <vector>

namespace boxflow::layout {

struct Box;

struct FloatInfo {
    const Box* box = nullptr;
    css::Float side = css::Float::Left;
    Rect margin_rect;   // in flow coordinates of the current layout pass
    float start_y = 0;  // candidate Y the float was placed from
};

// Floats placed so far in a layout pass, plus the stack of block formatting
// context bases. Queries only see floats of the innermost BFC.
class FloatContext {
public:
    FloatContext() = default;

    void add(const FloatInfo& info);

    // Floats of the current BFC as container-local exclusions. origin is the
    // container's content-box origin in flow coordinates.
    ExclusionSpace exclusion_space(float origin_x, float origin_y, float width) const;

    // Flow Y at or below y that clears the margin boxes of the matching
    // floats in the current BFC.
    float clearance_y(css::Clear clear, float y) const;

    // Lowest margin-box bottom of the current BFC's floats.
    std::optional<float> lowest_bottom() const;

    size_t size() const { return floats_.size(); }
    size_t bfc_base() const { return bases_.empty() ? 0 : bases_.back(); }
    size_t bfc_depth() const { return bases_.size(); }
    const std::vector<FloatInfo>& floats() const { return floats_; }

private:
    friend class BfcScope;

    void push_bfc();
    void pop_bfc();

    std::vector<FloatInfo> floats_;
    std::vector<size_t> bases_;
};

// Scopes a block formatting context. Floats added while the scope is alive
// are discarded when it ends.
class BfcScope {
public:
    explicit BfcScope(FloatContext& floats);
    ~BfcScope();

    BfcScope(const BfcScope&) = delete;
    BfcScope& operator=(const BfcScope&) = delete;

private:
    FloatContext& floats_;
};

} // namespace boxflow::layout
