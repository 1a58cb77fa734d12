#include <boxflow/core/diagnostics.h>
#include <boxflow/layout/exclusion_space.h>

#include <gtest/gtest.h>

using namespace boxflow;
using namespace boxflow::layout;

static Exclusion left_float(float x, float y, float w, float h) {
    return {Rect{x, y, w, h}, css::Float::Left};
}

static Exclusion right_float(float inset, float y, float w, float h) {
    return {Rect{inset, y, w, h}, css::Float::Right};
}

// ---------------------------------------------------------------------------
// 1. Queries
// ---------------------------------------------------------------------------
TEST(ExclusionSpaceTest, EmptySpaceHasNoOffsets) {
    ExclusionSpace space;
    InlineOffsets offsets = space.available_inline_size(0, 100);
    EXPECT_FLOAT_EQ(offsets.left, 0.0f);
    EXPECT_FLOAT_EQ(offsets.right, 0.0f);
    EXPECT_TRUE(space.empty());
}

TEST(ExclusionSpaceTest, AddLeavesReceiverUnchanged) {
    ExclusionSpace original;
    ExclusionSpace grown = original.add(left_float(0, 0, 100, 50));

    EXPECT_TRUE(original.empty());
    EXPECT_FLOAT_EQ(original.available_inline_size(10, 10).left, 0.0f);
    EXPECT_EQ(grown.size(), 1u);
    EXPECT_FLOAT_EQ(grown.available_inline_size(10, 10).left, 100.0f);
}

TEST(ExclusionSpaceTest, StackedLeftFloatsCombineWhereTheyOverlap) {
    ExclusionSpace space = ExclusionSpace()
        .add(left_float(0, 0, 100, 50))
        .add(left_float(100, 20, 80, 50));

    EXPECT_FLOAT_EQ(space.available_inline_size(25, 10).left, 180.0f);
    EXPECT_FLOAT_EQ(space.available_inline_size(0, 10).left, 100.0f);
    EXPECT_FLOAT_EQ(space.available_inline_size(80, 10).left, 0.0f);
}

TEST(ExclusionSpaceTest, TouchingBandsDoNotCount) {
    ExclusionSpace space = ExclusionSpace().add(left_float(0, 0, 100, 50));
    EXPECT_FLOAT_EQ(space.available_inline_size(50, 20).left, 0.0f);
    EXPECT_FLOAT_EQ(space.available_inline_size(30, 0).left, 100.0f);
}

TEST(ExclusionSpaceTest, RightFloatsReportRightOffset) {
    ExclusionSpace space = ExclusionSpace().add(right_float(0, 0, 60, 40));
    InlineOffsets offsets = space.available_inline_size(10, 10);
    EXPECT_FLOAT_EQ(offsets.left, 0.0f);
    EXPECT_FLOAT_EQ(offsets.right, 60.0f);
}

TEST(ExclusionSpaceTest, NextBottomAndLastTop) {
    ExclusionSpace space = ExclusionSpace()
        .add(left_float(0, 0, 10, 30))
        .add(right_float(0, 10, 10, 50));
    EXPECT_FLOAT_EQ(*space.next_bottom_below(0), 30.0f);
    EXPECT_FLOAT_EQ(*space.next_bottom_below(30), 60.0f);
    EXPECT_FALSE(space.next_bottom_below(60).has_value());
    EXPECT_FLOAT_EQ(*space.last_top(), 10.0f);
    EXPECT_FALSE(ExclusionSpace().last_top().has_value());
}

TEST(ExclusionSpaceTest, ClearanceBySide) {
    ExclusionSpace space = ExclusionSpace()
        .add(left_float(0, 0, 100, 50))
        .add(right_float(0, 0, 100, 70));
    EXPECT_FLOAT_EQ(space.clearance_y(css::Clear::Left, 0), 50.0f);
    EXPECT_FLOAT_EQ(space.clearance_y(css::Clear::Right, 0), 70.0f);
    EXPECT_FLOAT_EQ(space.clearance_y(css::Clear::Both, 10), 70.0f);
    EXPECT_FLOAT_EQ(space.clearance_y(css::Clear::None, 10), 10.0f);
    EXPECT_FLOAT_EQ(space.clearance_y(css::Clear::Left, 90), 90.0f);
}

// ---------------------------------------------------------------------------
// 2. Float placement
// ---------------------------------------------------------------------------
TEST(FloatPlacementTest, SameSideFloatsStackWithoutDropping) {
    ExclusionSpace space = ExclusionSpace().add(left_float(0, 0, 100, 50));
    FloatPlacement p = place_float(space, css::Float::Left, 250, 20, 300, 0);
    EXPECT_FLOAT_EQ(p.inset, 100.0f);
    EXPECT_FLOAT_EQ(p.y, 0.0f);
    EXPECT_FALSE(p.gave_up);
}

TEST(FloatPlacementTest, DropsBelowOpposingFloatWhenTooNarrow) {
    ExclusionSpace space = ExclusionSpace().add(right_float(0, 0, 150, 50));
    FloatPlacement p = place_float(space, css::Float::Left, 200, 20, 300, 0);
    EXPECT_FLOAT_EQ(p.inset, 0.0f);
    EXPECT_FLOAT_EQ(p.y, 50.0f);
    EXPECT_FALSE(p.gave_up);
}

TEST(FloatPlacementTest, FitsBesideOpposingFloat) {
    ExclusionSpace space = ExclusionSpace().add(right_float(0, 0, 100, 50));
    FloatPlacement p = place_float(space, css::Float::Left, 200, 20, 300, 0);
    EXPECT_FLOAT_EQ(p.y, 0.0f);
}

TEST(FloatPlacementTest, GivesUpPastDescentCapAndWarns) {
    // A right float taller than the descent cap blocks every candidate.
    ExclusionSpace space = ExclusionSpace().add(right_float(0, 0, 250, 5000));
    core::DiagnosticEmitter diagnostics;
    FloatPlacement p = place_float(space, css::Float::Left, 100, 20, 300, 0, &diagnostics);

    EXPECT_TRUE(p.gave_up);
    EXPECT_FLOAT_EQ(p.y, 0.0f);
    ASSERT_EQ(diagnostics.events_by_stage("float-drop").size(), 1u);
    EXPECT_EQ(diagnostics.events()[0].severity, core::Severity::Warning);
}
