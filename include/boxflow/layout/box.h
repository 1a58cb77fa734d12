#pragma once
#include <boxflow/css/computed_style.h>
#include <boxflow/dom/node.h>
#include <boxflow/layout/fragment.h>
#include <boxflow/layout/geometry.h>
#include <boxflow/layout/style_lookup.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace boxflow::layout {

enum class BoxKind {
    Block,
    InlineBlock,
    Inline,
    Text,
    Replaced,
};

struct BorderEdgeFlags {
    bool left = true;
    bool right = true;
};

// One region of an inline box that wraps across lines or is split by a
// block child. rect is the border box in the same coordinates as the
// owning box's geometry.x/y.
struct BoxFragment {
    Rect rect;
    BorderEdgeFlags edges;
};

struct Box {
    BoxGeometry geometry;
    BoxKind kind = BoxKind::Block;
    const dom::Node* node = nullptr;   // null for anonymous boxes
    StylePtr style;
    css::Position position = css::Position::Static;
    std::optional<int> z_index;
    bool establishes_bfc = false;

    Box* parent = nullptr;   // back-reference, not an owner
    std::vector<std::unique_ptr<Box>> children;
    std::vector<BoxFragment> fragments;
    std::vector<LineBox> line_boxes;

    std::string text;        // Text boxes
    std::string image_src;   // Replaced boxes

    Box& append_child(std::unique_ptr<Box> child);

    // Border-box origin in the initial containing block.
    Point absolute_position() const;

    // Moves this box and its fragments; descendants follow implicitly.
    void translate(float dx, float dy);
};

// Offset of descendant's content box inside ancestor's content box.
Point content_offset_within(const Box& descendant, const Box& ancestor);

} // namespace boxflow::layout
