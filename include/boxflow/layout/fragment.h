#pragma once
#include <boxflow/dom/node.h>
#include <boxflow/layout/geometry.h>
#include <boxflow/layout/style_lookup.h>
#include <cstddef>
#include <string>

namespace boxflow::layout {

struct Box;

enum class FragmentType {
    Text,
    Atomic,
    Float,
    OpenTag,
    CloseTag,
    Control,
    BlockPlaceholder,
    OutOfFlowPlaceholder,
};

// Output of inline layout. The position is final when the fragment is
// created; nothing downstream moves it.
struct Fragment {
    FragmentType type = FragmentType::Text;
    const dom::Node* node = nullptr;
    StylePtr style;
    Point position;   // border-box origin in the container's content coordinates
    Size size;        // border-box size
    std::string text;
    std::string image_src;
    const Box* box = nullptr;
    size_t item_index = 0;
    size_t line_index = 0;
};

struct LineBox {
    float y = 0;
    float height = 0;
    float left_edge = 0;    // inline start after exclusions
    float right_edge = 0;   // inline end after exclusions
};

} // namespace boxflow::layout
