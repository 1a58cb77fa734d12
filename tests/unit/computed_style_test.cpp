#include <boxflow/css/computed_style.h>

#include <gtest/gtest.h>

using namespace boxflow::css;

// ---------------------------------------------------------------------------
// 1. Length resolution
// ---------------------------------------------------------------------------
TEST(LengthTest, ResolvesUnits) {
    EXPECT_FLOAT_EQ(Length::px(12).to_px(), 12.0f);
    EXPECT_FLOAT_EQ(Length::em(2).to_px(0, 10), 20.0f);
    EXPECT_FLOAT_EQ(Length::rem(2).to_px(0, 10, 16), 32.0f);
    EXPECT_FLOAT_EQ(Length::percent(25).to_px(400), 100.0f);
    EXPECT_FLOAT_EQ(Length::auto_val().to_px(400), 0.0f);
    EXPECT_FLOAT_EQ(Length::zero().to_px(400), 0.0f);
}

TEST(LengthTest, Predicates) {
    EXPECT_TRUE(Length::auto_val().is_auto());
    EXPECT_FALSE(Length::auto_val().is_zero());
    EXPECT_TRUE(Length::px(0).is_zero());
    EXPECT_TRUE(Length::percent(50).is_percent());
    EXPECT_FALSE(Length::px(1).is_zero());
}

TEST(BorderEdgeTest, NoneStyleHasNoWidth) {
    BorderEdge edge;
    edge.width = Length::px(5);
    EXPECT_FLOAT_EQ(edge.used_width(), 0.0f);
    edge.style = BorderStyle::Solid;
    EXPECT_FLOAT_EQ(edge.used_width(), 5.0f);
}

// ---------------------------------------------------------------------------
// 2. Line height
// ---------------------------------------------------------------------------
TEST(ComputedStyleTest, LineHeightNormalIsUnresolved) {
    ComputedStyle style;
    EXPECT_FALSE(style.line_height_px().has_value());
}

TEST(ComputedStyleTest, LineHeightUnitlessScalesFontSize) {
    ComputedStyle style;
    style.font_size = Length::px(20);
    style.line_height_unitless = 1.5f;
    ASSERT_TRUE(style.line_height_px().has_value());
    EXPECT_FLOAT_EQ(*style.line_height_px(), 30.0f);
}

TEST(ComputedStyleTest, LineHeightPercentOfFontSize) {
    ComputedStyle style;
    style.font_size = Length::px(10);
    style.line_height = Length::percent(200);
    EXPECT_FLOAT_EQ(*style.line_height_px(), 20.0f);
}

// ---------------------------------------------------------------------------
// 3. Tag defaults and inheritance
// ---------------------------------------------------------------------------
TEST(DefaultStyleTest, DisplayByTag) {
    EXPECT_EQ(default_style_for_tag("div").display, Display::Block);
    EXPECT_EQ(default_style_for_tag("p").display, Display::Block);
    EXPECT_EQ(default_style_for_tag("span").display, Display::Inline);
    EXPECT_EQ(default_style_for_tag("img").display, Display::Inline);
    EXPECT_EQ(default_style_for_tag("li").display, Display::ListItem);
    EXPECT_EQ(default_style_for_tag("table").display, Display::Table);
    EXPECT_EQ(default_style_for_tag("script").display, Display::None);
    EXPECT_EQ(default_style_for_tag("made-up").display, Display::Inline);
}

TEST(DefaultStyleTest, PreKeepsWhiteSpace) {
    ComputedStyle pre = default_style_for_tag("pre");
    EXPECT_EQ(pre.white_space, WhiteSpace::Pre);
    EXPECT_EQ(pre.font_family, "monospace");
}

TEST(DefaultStyleTest, TagDefaultsApplyAfterInheritance) {
    ComputedStyle parent;
    parent.font_size = Length::px(12);
    parent.text_align = TextAlign::Center;
    parent.font_weight = 300;

    ComputedStyle h1 = default_style_for_tag("h1", parent);
    EXPECT_FLOAT_EQ(h1.font_size_px(), 32.0f);
    EXPECT_EQ(h1.font_weight, 700);
    EXPECT_EQ(h1.text_align, TextAlign::Center);

    ComputedStyle span = default_style_for_tag("span", parent);
    EXPECT_FLOAT_EQ(span.font_size_px(), 12.0f);
    EXPECT_EQ(span.font_weight, 300);
}

TEST(DefaultStyleTest, BoxPropertiesAreNotInherited) {
    ComputedStyle parent;
    parent.width = Length::px(100);
    parent.margin.left = Length::px(5);
    ComputedStyle child = default_style_for_tag("div", parent);
    EXPECT_TRUE(child.width.is_auto());
    EXPECT_TRUE(child.margin.left.is_zero());
}
