#include <boxflow/layout/float_context.h>

#include <gtest/gtest.h>

using namespace boxflow;
using namespace boxflow::layout;

static FloatInfo make_float(css::Float side, float x, float y, float w, float h) {
    FloatInfo info;
    info.side = side;
    info.margin_rect = {x, y, w, h};
    info.start_y = y;
    return info;
}

// ---------------------------------------------------------------------------
// 1. BFC scoping
// ---------------------------------------------------------------------------
TEST(FloatContextTest, ScopeDiscardsInnerFloats) {
    FloatContext floats;
    floats.add(make_float(css::Float::Left, 0, 0, 100, 50));
    {
        BfcScope scope(floats);
        EXPECT_EQ(floats.bfc_depth(), 1u);
        EXPECT_EQ(floats.bfc_base(), 1u);
        floats.add(make_float(css::Float::Left, 0, 0, 30, 30));
        floats.add(make_float(css::Float::Right, 0, 0, 30, 30));
        EXPECT_EQ(floats.size(), 3u);
    }
    EXPECT_EQ(floats.size(), 1u);
    EXPECT_EQ(floats.bfc_depth(), 0u);
}

TEST(FloatContextTest, QueriesOnlySeeCurrentBfc) {
    FloatContext floats;
    floats.add(make_float(css::Float::Left, 0, 0, 100, 50));
    BfcScope scope(floats);
    EXPECT_TRUE(floats.exclusion_space(0, 0, 400).empty());
    EXPECT_FLOAT_EQ(floats.clearance_y(css::Clear::Both, 10), 10.0f);
    EXPECT_FALSE(floats.lowest_bottom().has_value());
}

// ---------------------------------------------------------------------------
// 2. Exclusions relative to a container
// ---------------------------------------------------------------------------
TEST(FloatContextTest, ExclusionSpaceIsContainerLocal) {
    FloatContext floats;
    floats.add(make_float(css::Float::Left, 20, 100, 50, 40));
    floats.add(make_float(css::Float::Right, 350, 100, 70, 40));

    // Container content box at x=20, y=80, 400 wide.
    ExclusionSpace space = floats.exclusion_space(20, 80, 400);
    InlineOffsets offsets = space.available_inline_size(30, 10);
    EXPECT_FLOAT_EQ(offsets.left, 50.0f);
    EXPECT_FLOAT_EQ(offsets.right, 70.0f);
    EXPECT_FLOAT_EQ(space.available_inline_size(0, 10).left, 0.0f);
}

// ---------------------------------------------------------------------------
// 3. Clearance
// ---------------------------------------------------------------------------
TEST(FloatContextTest, ClearanceMatchesSide) {
    FloatContext floats;
    floats.add(make_float(css::Float::Left, 0, 0, 100, 50));
    floats.add(make_float(css::Float::Right, 300, 0, 100, 80));

    EXPECT_FLOAT_EQ(floats.clearance_y(css::Clear::Left, 0), 50.0f);
    EXPECT_FLOAT_EQ(floats.clearance_y(css::Clear::Right, 0), 80.0f);
    EXPECT_FLOAT_EQ(floats.clearance_y(css::Clear::Both, 0), 80.0f);
    EXPECT_FLOAT_EQ(floats.clearance_y(css::Clear::None, 0), 0.0f);
    EXPECT_FLOAT_EQ(floats.clearance_y(css::Clear::Both, 120), 120.0f);
    EXPECT_FLOAT_EQ(*floats.lowest_bottom(), 80.0f);
}

TEST(FloatContextTest, NegativeBottomMarginShortensClearance) {
    // 50px border box with margin-bottom: -20px
    FloatContext floats;
    floats.add(make_float(css::Float::Left, 0, 0, 100, 30));
    EXPECT_FLOAT_EQ(floats.clearance_y(css::Clear::Left, 0), 30.0f);
    EXPECT_FLOAT_EQ(*floats.lowest_bottom(), 30.0f);
    EXPECT_FLOAT_EQ(floats.exclusion_space(0, 0, 400).available_inline_size(25, 10).left, 100.0f);
    EXPECT_FLOAT_EQ(floats.exclusion_space(0, 0, 400).available_inline_size(30, 10).left, 0.0f);
}
