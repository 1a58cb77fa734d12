#pragma once
#include <boxflow/css/computed_style.h>
#include <boxflow/dom/element.h>
#include <functional>
#include <optional>
#include <string>

namespace boxflow::layout {

struct ImageDimensions {
    float width = 0;
    float height = 0;
};

// Callback returning the natural size of an image source, or nullopt when
// it cannot be fetched or decoded.
using ImageFetchFn = std::function<std::optional<ImageDimensions>(const std::string& src)>;

struct ImageSize {
    float width = 0;
    float height = 0;
    bool placeholder = false;  // some dimension fell back to the placeholder size
};

// Content size of an <img>: CSS width/height, then the width/height
// attributes, then the natural size (keeping the aspect ratio when one
// dimension is known), then the placeholder.
ImageSize resolve_image_size(const dom::Element& img, const css::ComputedStyle& style,
                             const ImageFetchFn& fetch, float containing_width,
                             std::optional<float> containing_height);

} // namespace boxflow::layout
