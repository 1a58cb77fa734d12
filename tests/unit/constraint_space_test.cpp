#include <boxflow/layout/constraint_space.h>

#include <gtest/gtest.h>

using namespace boxflow;
using namespace boxflow::layout;

// 1. with_* returns a new space and keeps the original intact
TEST(ConstraintSpaceTest, WithExclusionIsNonDestructive) {
    ConstraintSpace base(Size{400, 300});
    ConstraintSpace narrowed = base.with_exclusion({Rect{0, 0, 100, 50}, css::Float::Left});

    EXPECT_TRUE(base.exclusion_space().empty());
    EXPECT_FLOAT_EQ(base.available_inline_size(0, 20), 400.0f);
    EXPECT_FLOAT_EQ(narrowed.available_inline_size(0, 20), 300.0f);
    EXPECT_FLOAT_EQ(narrowed.available_width(), 400.0f);
}

// 2. Unchanged fields carry over
TEST(ConstraintSpaceTest, WithFieldsKeepOthers) {
    ConstraintSpace base(Size{400, 300}, css::TextAlign::Center, true);
    ConstraintSpace wider = base.with_available_width(500);
    EXPECT_FLOAT_EQ(wider.available_width(), 500.0f);
    EXPECT_FLOAT_EQ(wider.available_size().height, 300.0f);
    EXPECT_EQ(wider.text_align(), css::TextAlign::Center);
    EXPECT_TRUE(wider.no_wrap());

    ConstraintSpace right = base.with_text_align(css::TextAlign::Right).with_no_wrap(false);
    EXPECT_EQ(right.text_align(), css::TextAlign::Right);
    EXPECT_FALSE(right.no_wrap());
    EXPECT_EQ(base.text_align(), css::TextAlign::Center);
}

// 3. Exclusion spaces are shared between copies
TEST(ConstraintSpaceTest, CopiesShareExclusionSpace) {
    ConstraintSpace base = ConstraintSpace(Size{400, 300})
        .with_exclusion({Rect{0, 0, 100, 50}, css::Float::Left});
    ConstraintSpace aligned = base.with_text_align(css::TextAlign::Right);
    EXPECT_EQ(&base.exclusion_space(), &aligned.exclusion_space());
}

// 4. Both offsets are subtracted and the result may go negative
TEST(ConstraintSpaceTest, AvailableInlineSizeMayBeNegative) {
    ConstraintSpace space = ConstraintSpace(Size{100, 0})
        .with_exclusion({Rect{0, 0, 80, 50}, css::Float::Left})
        .with_exclusion({Rect{0, 0, 60, 50}, css::Float::Right});
    InlineOffsets offsets = space.exclusion_offsets(10, 10);
    EXPECT_FLOAT_EQ(offsets.left, 80.0f);
    EXPECT_FLOAT_EQ(offsets.right, 60.0f);
    EXPECT_FLOAT_EQ(space.available_inline_size(10, 10), -40.0f);
}
