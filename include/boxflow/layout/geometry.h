#pragma once

namespace boxflow::layout {

struct Point {
    float x = 0, y = 0;
};

struct Size {
    float width = 0, height = 0;
};

struct Rect {
    float x = 0, y = 0;
    float width = 0, height = 0;

    float right() const { return x + width; }
    float bottom() const { return y + height; }

    // Strict vertical overlap with the band [top, top + band_height).
    // A zero-height band is the single line y = top.
    bool overlaps_band(float top, float band_height) const {
        if (band_height <= 0) {
            return y <= top && bottom() > top;
        }
        return y < top + band_height && bottom() > top;
    }

    Rect united(const Rect& other) const;
};

struct EdgeSizes {
    float top = 0, right = 0, bottom = 0, left = 0;

    float horizontal() const { return left + right; }
    float vertical() const { return top + bottom; }
};

// min-content / max-content pair
struct IntrinsicSizes {
    float min_content = 0;
    float max_content = 0;
};

struct BoxGeometry {
    float x = 0, y = 0;           // border-box origin relative to the parent's content box
    float width = 0, height = 0;   // content box size
    EdgeSizes margin, border, padding;

    float border_box_width() const { return border.left + padding.left + width + padding.right + border.right; }
    float border_box_height() const { return border.top + padding.top + height + padding.bottom + border.bottom; }
    float margin_box_width() const { return margin.left + border_box_width() + margin.right; }
    float margin_box_height() const { return margin.top + border_box_height() + margin.bottom; }

    // Content box origin in the parent's content coordinates.
    float content_left() const { return x + border.left + padding.left; }
    float content_top() const { return y + border.top + padding.top; }

    Rect border_box() const { return {x, y, border_box_width(), border_box_height()}; }
    Rect margin_box() const {
        return {x - margin.left, y - margin.top, margin_box_width(), margin_box_height()};
    }
};

} // namespace boxflow::layout
