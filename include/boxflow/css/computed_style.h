#pragma once
#include <memory>
#include <optional>
#include <string>

namespace boxflow::css {

enum class Display { Block, Inline, InlineBlock, ListItem, Table, Flex, Grid, None };
enum class Position { Static, Relative, Absolute, Fixed };
enum class Float { None, Left, Right };
enum class Clear { None, Left, Right, Both };
enum class BoxSizing { ContentBox, BorderBox };
enum class Overflow { Visible, Hidden, Scroll, Auto };
enum class TextAlign { Left, Right, Center, Justify };
enum class WhiteSpace { Normal, NoWrap, Pre };
enum class VerticalAlign { Baseline, Top, Middle, Bottom };
enum class FontStyle { Normal, Italic, Oblique };
enum class BorderStyle { None, Solid, Dashed, Dotted, Double };

struct Length {
    enum class Unit { Px, Em, Rem, Percent, Auto, Zero };
    float value = 0;
    Unit unit = Unit::Px;

    static Length px(float v) { return {v, Unit::Px}; }
    static Length em(float v) { return {v, Unit::Em}; }
    static Length rem(float v) { return {v, Unit::Rem}; }
    static Length percent(float v) { return {v, Unit::Percent}; }
    static Length auto_val() { return {0, Unit::Auto}; }
    static Length zero() { return {0, Unit::Zero}; }

    bool is_auto() const { return unit == Unit::Auto; }
    bool is_percent() const { return unit == Unit::Percent; }
    bool is_zero() const { return (unit == Unit::Zero) || (value == 0 && unit != Unit::Auto); }

    // Percentages resolve against percent_base, em against font_size.
    // Auto resolves to 0; callers check is_auto() first where auto matters.
    float to_px(float percent_base = 0, float font_size = 16, float root_font_size = 16) const;
};

struct EdgeSizes {
    Length top, right, bottom, left;
};

struct BorderEdge {
    Length width = Length::zero();
    BorderStyle style = BorderStyle::None;

    // A border with style none has a used width of 0 whatever its width says.
    float used_width(float font_size = 16) const {
        return style == BorderStyle::None ? 0.0f : width.to_px(0, font_size);
    }
};

struct ComputedStyle {
    // Box generation and positioning
    Display display = Display::Inline;
    Position position = Position::Static;
    Float float_val = Float::None;
    Clear clear = Clear::None;
    BoxSizing box_sizing = BoxSizing::ContentBox;
    Overflow overflow = Overflow::Visible;
    std::optional<int> z_index;  // nullopt = auto

    // Dimensions
    Length width = Length::auto_val();
    Length height = Length::auto_val();
    Length min_width = Length::zero();
    std::optional<Length> max_width;   // nullopt = none
    Length min_height = Length::zero();
    std::optional<Length> max_height;  // nullopt = none

    // Box model
    EdgeSizes margin = {Length::zero(), Length::zero(), Length::zero(), Length::zero()};
    EdgeSizes padding = {Length::zero(), Length::zero(), Length::zero(), Length::zero()};
    BorderEdge border_top, border_right, border_bottom, border_left;

    // Box offsets for positioned elements
    Length top = Length::auto_val();
    Length right_pos = Length::auto_val();
    Length bottom = Length::auto_val();
    Length left_pos = Length::auto_val();

    // Text
    std::string font_family = "sans-serif";
    Length font_size = Length::px(16);
    int font_weight = 400;
    FontStyle font_style = FontStyle::Normal;
    Length line_height = Length::auto_val();  // auto = normal
    float line_height_unitless = 0;           // >0 overrides line_height as a factor
    Length letter_spacing = Length::zero();
    TextAlign text_align = TextAlign::Left;
    WhiteSpace white_space = WhiteSpace::Normal;
    VerticalAlign vertical_align = VerticalAlign::Baseline;  // atomic inlines only

    // ::first-letter style of a block container, if a rule matched
    std::shared_ptr<const ComputedStyle> first_letter;

    float font_size_px() const;
    bool is_italic() const { return font_style != FontStyle::Normal; }
    // nullopt when line-height is normal and depends on font metrics
    std::optional<float> line_height_px() const;
};

// User-agent default style for an element with the given tag name.
ComputedStyle default_style_for_tag(const std::string& tag);
// Same, with inherited text properties taken from parent first.
ComputedStyle default_style_for_tag(const std::string& tag, const ComputedStyle& parent);

// Copies inherited text properties (font, line height, alignment,
// white space) from parent into style.
void inherit_text_properties(ComputedStyle& style, const ComputedStyle& parent);

} // namespace boxflow::css
