#include <boxflow/layout/line_breaker.h>

#include <gtest/gtest.h>
#include <vector>

using namespace boxflow;
using namespace boxflow::layout;

static InlineItem make_text(float width, float height = 20, float trailing = 0) {
    InlineItem item;
    item.type = InlineItemType::Text;
    item.width = width;
    item.height = height;
    item.trailing_space_width = trailing;
    return item;
}

static InlineItem make_item(InlineItemType type, float width = 0, float height = 0) {
    InlineItem item;
    item.type = type;
    item.width = width;
    item.height = height;
    return item;
}

// 1. Items wrap when the next one does not fit
TEST(LineBreakerTest, WrapsAtLineWidth) {
    std::vector<InlineItem> items = {make_text(50), make_text(10), make_text(90)};
    auto lines = break_lines(items, ConstraintSpace(Size{100, 0}), 0, 20);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].items.size(), 2u);
    EXPECT_EQ(lines[1].items.size(), 1u);
    EXPECT_FLOAT_EQ(lines[0].y, 0.0f);
    EXPECT_FLOAT_EQ(lines[0].height, 20.0f);
    EXPECT_FLOAT_EQ(lines[1].y, 20.0f);
}

// 2. Trailing spaces do not count when fitting
TEST(LineBreakerTest, TrailingSpaceHangs) {
    std::vector<InlineItem> items = {make_text(60, 20, 10), make_text(50)};
    auto lines = break_lines(items, ConstraintSpace(Size{100, 0}), 0, 20);
    ASSERT_EQ(lines.size(), 2u);

    items = {make_text(50, 20, 10), make_text(50)};
    lines = break_lines(items, ConstraintSpace(Size{100, 0}), 0, 20);
    EXPECT_EQ(lines.size(), 1u);
}

// 3. An item wider than an empty line is placed anyway
TEST(LineBreakerTest, OverwideItemIsForcePlaced) {
    std::vector<InlineItem> items = {make_text(250), make_text(10)};
    auto lines = break_lines(items, ConstraintSpace(Size{100, 0}), 0, 20);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].items.size(), 1u);
}

// 4. No-wrap keeps everything on one line
TEST(LineBreakerTest, NoWrapNeverBreaks) {
    std::vector<InlineItem> items = {make_text(50), make_text(50), make_text(50)};
    auto lines = break_lines(items, ConstraintSpace(Size{100, 0}, css::TextAlign::Left, true), 0, 20);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].items.size(), 3u);
}

// 5. Line height is the tallest item, at least the strut
TEST(LineBreakerTest, LineHeightUsesTallestItemAndStrut) {
    std::vector<InlineItem> items = {make_text(10, 12), make_item(InlineItemType::Atomic, 30, 45)};
    auto lines = break_lines(items, ConstraintSpace(Size{100, 0}), 5, 20);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_FLOAT_EQ(lines[0].y, 5.0f);
    EXPECT_FLOAT_EQ(lines[0].height, 45.0f);

    items = {make_text(10, 12)};
    lines = break_lines(items, ConstraintSpace(Size{100, 0}), 0, 20);
    EXPECT_FLOAT_EQ(lines[0].height, 20.0f);
}

// 6. Floats ride along without width or height
TEST(LineBreakerTest, FloatsTakeNoInlineSpace) {
    std::vector<InlineItem> items = {make_item(InlineItemType::Float, 90, 200),
                                     make_text(50), make_text(50)};
    auto lines = break_lines(items, ConstraintSpace(Size{100, 0}), 0, 20);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].items.size(), 3u);
    EXPECT_FLOAT_EQ(lines[0].height, 20.0f);
}

// 7. Control items end the line, even an empty one
TEST(LineBreakerTest, ControlForcesBreak) {
    std::vector<InlineItem> items = {make_text(10), make_item(InlineItemType::Control, 0, 20),
                                     make_item(InlineItemType::Control, 0, 20), make_text(10)};
    auto lines = break_lines(items, ConstraintSpace(Size{100, 0}), 0, 20);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_FLOAT_EQ(lines[1].y, 20.0f);
    EXPECT_FLOAT_EQ(lines[2].y, 40.0f);
}

// 8. Block children get a line of their own
TEST(LineBreakerTest, BlockChildIsAlone) {
    std::vector<InlineItem> items = {make_text(10), make_item(InlineItemType::BlockChild),
                                     make_text(10)};
    auto lines = break_lines(items, ConstraintSpace(Size{100, 0}), 0, 20);
    ASSERT_EQ(lines.size(), 3u);
    ASSERT_EQ(lines[1].items.size(), 1u);
    EXPECT_EQ(lines[1].items[0]->type, InlineItemType::BlockChild);
    EXPECT_FLOAT_EQ(lines[1].height, 0.0f);
}

// 9. A line whose first item does not fit beside a float moves below it
TEST(LineBreakerTest, LineMovesBelowExclusions) {
    ConstraintSpace space = ConstraintSpace(Size{100, 0})
        .with_exclusion({Rect{0, 0, 80, 50}, css::Float::Left});
    std::vector<InlineItem> items = {make_text(40)};
    auto lines = break_lines(items, space, 0, 20);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_FLOAT_EQ(lines[0].y, 50.0f);

    items = {make_text(15)};
    lines = break_lines(items, space, 0, 20);
    EXPECT_FLOAT_EQ(lines[0].y, 0.0f);
}

// 10. Whitespace at the start of a line is dropped
TEST(LineBreakerTest, LeadingWhitespaceDropped) {
    InlineItem space_item = make_text(10, 20, 10);
    space_item.whitespace_only = true;
    std::vector<InlineItem> items = {space_item, make_text(30)};
    auto lines = break_lines(items, ConstraintSpace(Size{100, 0}), 0, 20);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].items.size(), 1u);
}

// 11. Open tags move to the next line with the content they precede
TEST(LineBreakerTest, OpenTagCarriesToNextLine) {
    std::vector<InlineItem> items = {make_text(90), make_item(InlineItemType::OpenTag, 5),
                                     make_text(40), make_item(InlineItemType::CloseTag, 5)};
    auto lines = break_lines(items, ConstraintSpace(Size{100, 0}), 0, 20);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].items.size(), 1u);
    ASSERT_EQ(lines[1].items.size(), 3u);
    EXPECT_EQ(lines[1].items[0]->type, InlineItemType::OpenTag);
}
