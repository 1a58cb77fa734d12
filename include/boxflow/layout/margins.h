#pragma once
#include <boxflow/css/computed_style.h>
#include <algorithm>

namespace boxflow::layout {

// CSS 2.1 §8.3.1: two adjoining margins collapse to the larger positive,
// the more negative, or their sum when the signs differ.
float collapse_margins(float first, float second);

// Adjoining margins accumulated before they are resolved into a position.
struct MarginStrut {
    float positive = 0;
    float negative = 0;

    void append(float margin) {
        if (margin >= 0) {
            positive = std::max(positive, margin);
        } else {
            negative = std::min(negative, margin);
        }
    }
    void append(const MarginStrut& other) {
        positive = std::max(positive, other.positive);
        negative = std::min(negative, other.negative);
    }
    float sum() const { return positive + negative; }
    bool empty() const { return positive == 0 && negative == 0; }
};

// Whether a box takes part in margin collapsing at all. Floats, absolutely
// positioned boxes, inline-blocks and overflow != visible never do.
bool should_collapse_margins(const css::ComputedStyle& style);

// Whether a box establishes a new block formatting context.
bool establishes_bfc(const css::ComputedStyle& style, bool is_root);

// Whether a box's top margin can collapse with its first in-flow child.
bool can_collapse_top_with_children(const css::ComputedStyle& style, bool is_root);

// Whether a box's bottom margin can collapse with its last in-flow child.
bool can_collapse_bottom_with_children(const css::ComputedStyle& style, bool is_root);

} // namespace boxflow::layout
