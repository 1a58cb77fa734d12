#pragma once
#include <boxflow/layout/box.h>
#include <boxflow/layout/fragment.h>
#include <boxflow/layout/inline_item.h>
#include <cstddef>
#include <memory>
#include <vector>

namespace boxflow::layout {

// Builds the boxes of inline elements from the fragments of one block
// container. An open inline element buffers its children and the regions it
// covers on each line; when it closes, its geometry and BoxFragments are
// computed, its children are made relative to it, and only then is it
// emitted. It stays open across block children and across separate inline
// runs of the same container.
class InlineBoxTracker {
public:
    explicit InlineBoxTracker(Box& container) : container_(container) {}

    InlineBoxTracker(const InlineBoxTracker&) = delete;
    InlineBoxTracker& operator=(const InlineBoxTracker&) = delete;

    void open(const InlineItem& item, const Fragment& fragment, size_t line_id, const LineBox& line);
    void close(const Fragment& fragment, size_t line_id, const LineBox& line);

    // Text and atomic boxes, positioned in container coordinates.
    void add_content(std::unique_ptr<Box> box, size_t line_id, const LineBox& line);
    // Floats and block children do not extend the open inline boxes.
    void add_float(std::unique_ptr<Box> box);
    void add_block(std::unique_ptr<Box> box);

    // Closes anything still open.
    void finish();

private:
    struct Region {
        size_t line_id = 0;
        float left = 0, right = 0;
        float top = 0, bottom = 0;
        bool has_start = false;
        bool has_end = false;
    };

    struct Frame {
        std::unique_ptr<Box> box;
        std::vector<std::unique_ptr<Box>> children;
        std::vector<Region> regions;
    };

    Region& region_for(Frame& frame, size_t line_id, const LineBox& line, float x);
    void extend(float left, float right, size_t line_id, const LineBox& line);
    void finalize(Frame frame);
    void emit(std::unique_ptr<Box> box);

    Box& container_;
    std::vector<Frame> stack_;
};

} // namespace boxflow::layout
