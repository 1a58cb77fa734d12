#include <boxflow/core/config.h>
#include <boxflow/core/diagnostics.h>
#include <boxflow/dom/element.h>
#include <boxflow/dom/text.h>
#include <boxflow/layout/inline_item.h>

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace boxflow;
using namespace boxflow::layout;

// Every character is 10px wide and lines are 20px tall.
static TextMeasurer make_measurer() {
    return TextMeasurer([](const std::string& text, float, const std::string&, int, bool, float) {
        return TextMetrics{static_cast<float>(text.size()) * 10.0f, 20.0f};
    });
}

static dom::Element& add_element(dom::Node& parent, const std::string& tag,
                                 const css::ComputedStyle& style) {
    auto el = std::make_unique<dom::Element>(tag);
    el->set_style(style);
    return static_cast<dom::Element&>(parent.append_child(std::move(el)));
}

static dom::Element& add_element(dom::Node& parent, const std::string& tag) {
    return add_element(parent, tag, css::default_style_for_tag(tag));
}

static void add_text(dom::Node& parent, const std::string& text) {
    parent.append_child(std::make_unique<dom::Text>(text));
}

class InlineItemCollectorTest : public ::testing::Test {
protected:
    InlineItemCollectorTest()
        : measurer_(make_measurer()),
          sizer_(measurer_, fetcher_),
          collector_(measurer_, sizer_, fetcher_, &diagnostics_),
          root_("div") {
        root_.set_style(css::default_style_for_tag("div"));
    }

    std::vector<InlineItem> collect(float width = 400) {
        return collector_.collect(root_, root_.shared_style(), width);
    }

    core::DiagnosticEmitter diagnostics_;
    TextMeasurer measurer_;
    ImageFetchFn fetcher_;
    IntrinsicSizer sizer_;
    InlineItemCollector collector_;
    dom::Element root_;
};

// ---------------------------------------------------------------------------
// 1. Text runs
// ---------------------------------------------------------------------------
TEST_F(InlineItemCollectorTest, SplitsWordsKeepingTrailingSpace) {
    add_text(root_, "Hello   world");
    auto items = collect();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].text, "Hello ");
    EXPECT_FLOAT_EQ(items[0].width, 60.0f);
    EXPECT_FLOAT_EQ(items[0].trailing_space_width, 10.0f);
    EXPECT_FLOAT_EQ(items[0].fit_width(), 50.0f);
    EXPECT_EQ(items[1].text, "world");
    EXPECT_FLOAT_EQ(items[1].height, 20.0f);
}

TEST_F(InlineItemCollectorTest, WhitespaceOnlyTextBecomesOneRun) {
    add_text(root_, "a");
    add_text(root_, "   \n  ");
    add_text(root_, "b");
    auto items = collect();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_TRUE(items[1].whitespace_only);
    EXPECT_EQ(items[1].text, " ");
    EXPECT_FALSE(is_line_content(items[1]));
    EXPECT_TRUE(is_line_content(items[2]));
}

TEST_F(InlineItemCollectorTest, PreSplitsAtNewlines) {
    css::ComputedStyle pre = css::default_style_for_tag("div");
    pre.white_space = css::WhiteSpace::Pre;
    root_.set_style(pre);
    add_text(root_, "ab  c\nd");
    auto items = collect();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].text, "ab  c");
    EXPECT_EQ(items[1].type, InlineItemType::Control);
    EXPECT_EQ(items[2].text, "d");
}

TEST_F(InlineItemCollectorTest, NoWrapTextIsOneRun) {
    css::ComputedStyle nowrap = css::default_style_for_tag("div");
    nowrap.white_space = css::WhiteSpace::NoWrap;
    root_.set_style(nowrap);
    add_text(root_, "one  two three");
    auto items = collect();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].text, "one two three");
}

TEST_F(InlineItemCollectorTest, FirstLetterGetsItsOwnItem) {
    css::ComputedStyle block = css::default_style_for_tag("div");
    auto letter = std::make_shared<css::ComputedStyle>(block);
    letter->font_size = css::Length::px(32);
    block.first_letter = letter;
    root_.set_style(block);
    add_text(root_, "  Hello");

    auto items = collect();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].text, "H");
    EXPECT_EQ(items[0].style.get(), letter.get());
    EXPECT_EQ(items[1].text, "ello");
}

// ---------------------------------------------------------------------------
// 2. Elements
// ---------------------------------------------------------------------------
TEST_F(InlineItemCollectorTest, InlineElementEmitsTags) {
    css::ComputedStyle span = css::default_style_for_tag("span");
    span.padding.left = css::Length::px(5);
    span.margin.right = css::Length::px(3);
    auto& el = add_element(root_, "span", span);
    add_text(el, "hi");

    auto items = collect();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].type, InlineItemType::OpenTag);
    EXPECT_FLOAT_EQ(items[0].width, 5.0f);
    EXPECT_EQ(items[1].type, InlineItemType::Text);
    EXPECT_EQ(items[2].type, InlineItemType::CloseTag);
    EXPECT_FLOAT_EQ(items[2].width, 3.0f);
}

TEST_F(InlineItemCollectorTest, InlineWithOnlyBlocksEmitsNoTags) {
    auto& span = add_element(root_, "span");
    add_text(span, "  ");
    add_element(span, "div");
    EXPECT_TRUE(contains_only_blocks(span, span.shared_style()));

    auto items = collect();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].type, InlineItemType::BlockChild);
}

TEST_F(InlineItemCollectorTest, DeeplyNestedInlinesAreCut) {
    dom::Node* current = &root_;
    for (int i = 0; i < 300; ++i) {
        current = &add_element(*current, "span");
    }
    add_text(*current, "deep");

    auto items = collect();
    size_t opens = 0;
    for (const auto& item : items) {
        EXPECT_NE(item.type, InlineItemType::Text);
        if (item.type == InlineItemType::OpenTag) ++opens;
    }
    EXPECT_EQ(opens, static_cast<size_t>(core::config::kMaxLayoutDepth));
    EXPECT_EQ(items.size(), 2 * opens);

    auto warnings = diagnostics_.events_by_stage("depth");
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].severity, core::Severity::Warning);
}

TEST_F(InlineItemCollectorTest, BlockInsideInlineSplitsTags) {
    auto& span = add_element(root_, "span");
    add_text(span, "a");
    add_element(span, "div");
    add_text(span, "b");

    auto items = collect();
    ASSERT_EQ(items.size(), 5u);
    EXPECT_EQ(items[0].type, InlineItemType::OpenTag);
    EXPECT_EQ(items[2].type, InlineItemType::BlockChild);
    EXPECT_EQ(items[4].type, InlineItemType::CloseTag);
}

TEST_F(InlineItemCollectorTest, FloatsAreSizedWithoutLayout) {
    css::ComputedStyle style = css::default_style_for_tag("div");
    style.float_val = css::Float::Left;
    style.width = css::Length::px(100);
    style.height = css::Length::px(40);
    style.margin.left = css::Length::px(5);
    add_element(root_, "div", style);

    auto items = collect();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].type, InlineItemType::Float);
    EXPECT_FLOAT_EQ(items[0].width, 105.0f);
    EXPECT_FLOAT_EQ(items[0].height, 40.0f);
    EXPECT_FLOAT_EQ(items[0].margin.left, 5.0f);
}

TEST_F(InlineItemCollectorTest, InlineBlockShrinksToContent) {
    css::ComputedStyle style = css::default_style_for_tag("span");
    style.display = css::Display::InlineBlock;
    style.padding.left = css::Length::px(2);
    style.padding.right = css::Length::px(2);
    auto& el = add_element(root_, "span", style);
    add_text(el, "abc");

    auto items = collect();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].type, InlineItemType::Atomic);
    EXPECT_FLOAT_EQ(items[0].width, 34.0f);
}

TEST_F(InlineItemCollectorTest, ImageWithoutSizeUsesPlaceholder) {
    auto& img = add_element(root_, "img");
    img.set_attribute("src", "missing.png");
    auto items = collect();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].type, InlineItemType::Atomic);
    EXPECT_FLOAT_EQ(items[0].width, 100.0f);
    EXPECT_FLOAT_EQ(items[0].height, 100.0f);
}

TEST_F(InlineItemCollectorTest, BreaksHiddenAndPositionedElements) {
    add_text(root_, "a");
    add_element(root_, "br");
    css::ComputedStyle hidden = css::default_style_for_tag("span");
    hidden.display = css::Display::None;
    add_element(root_, "span", hidden);
    css::ComputedStyle absolute = css::default_style_for_tag("div");
    absolute.position = css::Position::Absolute;
    add_element(root_, "div", absolute);

    auto items = collect();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[1].type, InlineItemType::Control);
    EXPECT_FLOAT_EQ(items[1].height, 20.0f);
    EXPECT_EQ(items[2].type, InlineItemType::OutOfFlow);
}

TEST_F(InlineItemCollectorTest, TextInheritsParentStyle) {
    css::ComputedStyle span = css::default_style_for_tag("span");
    span.font_weight = 700;
    auto& el = add_element(root_, "span", span);
    add_text(el, "bold");
    auto items = collect();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[1].style->font_weight, 700);
}
