#include <boxflow/layout/layout_context.h>
#include <boxflow/core/config.h>

namespace boxflow::layout {

void LayoutContext::queue_positioned(PendingPositioned pending) {
    if (frames_.empty()) return;
    if (pending.style && pending.style->position == css::Position::Fixed) {
        frames_.front().push_back(std::move(pending));
    } else {
        frames_.back().push_back(std::move(pending));
    }
}

bool LayoutDepthGuard::exceeded() const {
    return context_.depth_ > core::config::kMaxLayoutDepth;
}

PositionedScope::PositionedScope(LayoutContext& context)
    : context_(context), index_(context.frames_.size()) {
    context_.frames_.emplace_back();
}

PositionedScope::~PositionedScope() {
    context_.frames_.resize(index_);
}

std::vector<PendingPositioned> PositionedScope::take_pending() {
    std::vector<PendingPositioned> pending;
    pending.swap(context_.frames_[index_]);
    return pending;
}

} // namespace boxflow::layout
