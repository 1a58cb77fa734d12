#pragma once
#include <boxflow/layout/float_context.h>
#include <boxflow/layout/geometry.h>
#include <boxflow/layout/style_lookup.h>
#include <cstddef>
#include <vector>

namespace boxflow::core {
class DiagnosticEmitter;
}

namespace boxflow::layout {

struct Box;

// An absolutely or fixed positioned element waiting for its containing
// block's final size.
struct PendingPositioned {
    const dom::Node* node = nullptr;
    StylePtr style;
    const Box* static_parent = nullptr;   // box the static position is relative to
    Point static_offset;                  // in static_parent's content coordinates
};

// Mutable state of one layout pass, passed explicitly through the
// recursion: the float context, the stack of positioned containing
// blocks, and the recursion depth.
class LayoutContext {
public:
    explicit LayoutContext(core::DiagnosticEmitter* diagnostics = nullptr)
        : diagnostics_(diagnostics) {}

    LayoutContext(const LayoutContext&) = delete;
    LayoutContext& operator=(const LayoutContext&) = delete;

    FloatContext& floats() { return floats_; }
    const FloatContext& floats() const { return floats_; }
    core::DiagnosticEmitter* diagnostics() const { return diagnostics_; }

    int depth() const { return depth_; }

    // Absolute elements go to the innermost positioned frame, fixed ones to
    // the outermost (initial containing block) frame.
    void queue_positioned(PendingPositioned pending);
    bool has_positioned_frame() const { return !frames_.empty(); }

private:
    friend class LayoutDepthGuard;
    friend class PositionedScope;

    FloatContext floats_;
    std::vector<std::vector<PendingPositioned>> frames_;
    core::DiagnosticEmitter* diagnostics_;
    int depth_ = 0;
};

class LayoutDepthGuard {
public:
    explicit LayoutDepthGuard(LayoutContext& context) : context_(context) { ++context_.depth_; }
    ~LayoutDepthGuard() { --context_.depth_; }

    LayoutDepthGuard(const LayoutDepthGuard&) = delete;
    LayoutDepthGuard& operator=(const LayoutDepthGuard&) = delete;

    bool exceeded() const;

private:
    LayoutContext& context_;
};

// Frame collecting the positioned descendants of one containing block.
class PositionedScope {
public:
    explicit PositionedScope(LayoutContext& context);
    ~PositionedScope();

    PositionedScope(const PositionedScope&) = delete;
    PositionedScope& operator=(const PositionedScope&) = delete;

    // Removes and returns everything queued on this frame so far.
    std::vector<PendingPositioned> take_pending();

private:
    LayoutContext& context_;
    size_t index_;
};

} // namespace boxflow::layout
