#include <boxflow/layout/image_size.h>
#include <boxflow/core/config.h>
#include <boxflow/layout/box_model.h>
#include <algorithm>
#include <cstdlib>
#include <string_view>

namespace boxflow::layout {

namespace {

std::optional<float> parse_dimension_attribute(const dom::Element& img, std::string_view name) {
    auto value = img.get_attribute(name);
    if (!value || value->empty()) return std::nullopt;
    char* end = nullptr;
    float v = std::strtof(value->c_str(), &end);
    if (end == value->c_str() || v < 0) return std::nullopt;
    return v;
}

} // namespace

ImageSize resolve_image_size(const dom::Element& img, const css::ComputedStyle& style,
                             const ImageFetchFn& fetch, float containing_width,
                             std::optional<float> containing_height) {
    bool border_box = style.box_sizing == css::BoxSizing::BorderBox;
    EdgeSizes padding = resolve_padding(style, containing_width);
    EdgeSizes border = resolve_border(style);

    std::optional<float> width;
    std::optional<float> height;
    if (!style.width.is_auto()) {
        float w = resolve_length(style.width, containing_width, style);
        if (border_box) w -= padding.horizontal() + border.horizontal();
        width = std::max(0.0f, w);
    }
    if (!style.height.is_auto() && (!style.height.is_percent() || containing_height)) {
        float h = resolve_length(style.height, containing_height.value_or(0), style);
        if (border_box) h -= padding.vertical() + border.vertical();
        height = std::max(0.0f, h);
    }

    if (!width) width = parse_dimension_attribute(img, "width");
    if (!height) height = parse_dimension_attribute(img, "height");

    if ((!width || !height) && fetch) {
        auto src = img.get_attribute("src");
        std::optional<ImageDimensions> natural;
        if (src && !src->empty()) natural = fetch(*src);
        if (natural && natural->width > 0 && natural->height > 0) {
            if (!width && !height) {
                width = natural->width;
                height = natural->height;
            } else if (!width) {
                width = *height * natural->width / natural->height;
            } else {
                height = *width * natural->height / natural->width;
            }
        }
    }

    ImageSize size;
    size.placeholder = !width || !height;
    size.width = width.value_or(core::config::kImagePlaceholderWidth);
    size.height = height.value_or(core::config::kImagePlaceholderHeight);
    return size;
}

} // namespace boxflow::layout
