#pragma once
#include <boxflow/layout/constraint_space.h>
#include <boxflow/layout/inline_item.h>
#include <vector>

namespace boxflow::layout {

struct LineInfo {
    float y = 0;
    std::vector<const InlineItem*> items;
    ConstraintSpace space;   // space the line was broken against
    float height = 0;
    // Candidate Y of each float on the line, in item order. A float that
    // precedes the line's first content keeps the Y the line had before it
    // moved below exclusions. Missing entries default to y.
    std::vector<float> float_ys;
};

// Partitions items into lines against space, starting at start_y. Pure.
//  - text and atomic items wrap when they do not fit and the line already
//    has content; an item wider than an empty line is placed anyway
//  - floats and out-of-flow items ride on the current line without taking
//    width or height; floats are not moved with the line
//  - control items end the line; block children get a line of their own
//  - a line whose first content does not fit beside the exclusions at its
//    Y moves down below them
// strut is the minimum height of a line that carries content.
std::vector<LineInfo> break_lines(const std::vector<InlineItem>& items,
                                  const ConstraintSpace& space,
                                  float start_y, float strut);

} // namespace boxflow::layout
