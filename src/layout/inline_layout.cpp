#include <boxflow/layout/inline_layout.h>
#include <boxflow/core/config.h>
#include <boxflow/core/diagnostics.h>
#include <boxflow/layout/line_breaker.h>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace boxflow::layout {

namespace {

constexpr float kWidthEpsilon = 0.01f;

// Whether every line was broken against the width it was finally given.
bool lines_match(const std::vector<LineInfo>& lines, const ConstraintSpace& hint,
                 const FragmentBuildResult& built) {
    for (size_t i = 0; i < lines.size(); ++i) {
        float broken = hint.available_inline_size(lines[i].y, lines[i].height);
        if (std::abs(broken - built.line_widths[i]) > kWidthEpsilon) {
            return false;
        }
    }
    return true;
}

} // namespace

InlineLayoutResult InlineLayoutAlgorithm::run(std::vector<InlineItem> items,
                                              const ConstraintSpace& space,
                                              float start_y, float strut) const {
    InlineLayoutResult result;
    result.items = std::move(items);

    ConstraintSpace hint = space;
    std::vector<LineInfo> lines;
    FragmentBuildResult built;

    State state = State::Break;
    while (state != State::Accept) {
        switch (state) {
            case State::Break:
                ++result.attempts;
                lines = break_lines(result.items, hint, start_y, strut);
                state = State::Construct;
                break;
            case State::Construct:
                built = construct_fragments(result.items, lines, space, diagnostics_);
                if (lines_match(lines, hint, built)) {
                    result.converged = true;
                    state = State::Accept;
                } else if (result.attempts >= core::config::kMaxInlineLayoutAttempts) {
                    result.converged = false;
                    if (diagnostics_) {
                        std::ostringstream msg;
                        msg << "line widths still changing after " << result.attempts
                            << " attempts; keeping the last result";
                        diagnostics_->warning("layout", "inline-retry", msg.str());
                    }
                    state = State::Accept;
                } else {
                    state = State::Retry;
                }
                break;
            case State::Retry:
                if (diagnostics_) {
                    std::ostringstream msg;
                    msg << "float exclusions changed line widths; attempt "
                        << (result.attempts + 1);
                    diagnostics_->info("layout", "inline-retry", msg.str());
                }
                hint = built.final_space;
                state = State::Break;
                break;
            case State::Accept:
                break;
        }
    }

    float bottom = start_y;
    for (const auto& line : lines) {
        bottom = std::max(bottom, line.y + line.height);
    }
    result.height = bottom - start_y;
    result.fragments = std::move(built.fragments);
    result.line_boxes = std::move(built.line_boxes);
    result.final_space = built.final_space;
    return result;
}

} // namespace boxflow::layout
