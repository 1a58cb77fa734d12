#pragma once
#include <boxflow/layout/constraint_space.h>
#include <boxflow/layout/fragment.h>
#include <boxflow/layout/inline_item.h>
#include <boxflow/layout/line_breaker.h>
#include <vector>

namespace boxflow::core {
class DiagnosticEmitter;
}

namespace boxflow::layout {

struct FragmentBuildResult {
    std::vector<Fragment> fragments;
    std::vector<LineBox> line_boxes;
    std::vector<float> line_widths;   // available inline size of each line after its floats
    ConstraintSpace final_space;
};

// Positions every item of every line. Floats of a line are placed before
// its other items, and each line sees the exclusions added by the lines
// above it. items must be the vector the lines point into.
FragmentBuildResult construct_fragments(const std::vector<InlineItem>& items,
                                        const std::vector<LineInfo>& lines,
                                        const ConstraintSpace& space,
                                        core::DiagnosticEmitter* diagnostics = nullptr);

} // namespace boxflow::layout
