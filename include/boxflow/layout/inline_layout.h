#pragma once
#include <boxflow/layout/constraint_space.h>
#include <boxflow/layout/fragment.h>
#include <boxflow/layout/fragment_builder.h>
#include <boxflow/layout/inline_item.h>
#include <vector>

namespace boxflow::core {
class DiagnosticEmitter;
}

namespace boxflow::layout {

struct InlineLayoutResult {
    std::vector<InlineItem> items;
    std::vector<Fragment> fragments;
    std::vector<LineBox> line_boxes;
    ConstraintSpace final_space;
    float height = 0;       // from start_y to the bottom of the last line
    int attempts = 0;
    bool converged = true;
};

// Break -> Construct, then Accept or Retry. Items come from the collector.
//
// Line breaking runs against a hint space. Construction always starts from
// the caller's space and may add float exclusions the breaker did not see.
// When any line's available width differs between the two, breaking is
// retried with the constructed exclusions as the new hint, up to
// kMaxInlineLayoutAttempts attempts; after that the last result is accepted.
class InlineLayoutAlgorithm {
public:
    explicit InlineLayoutAlgorithm(core::DiagnosticEmitter* diagnostics = nullptr)
        : diagnostics_(diagnostics) {}

    InlineLayoutResult run(std::vector<InlineItem> items, const ConstraintSpace& space,
                           float start_y, float strut) const;

private:
    enum class State { Break, Construct, Retry, Accept };

    core::DiagnosticEmitter* diagnostics_;
};

} // namespace boxflow::layout
