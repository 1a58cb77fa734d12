#include <boxflow/layout/line_breaker.h>
#include <boxflow/core/config.h>
#include <algorithm>

namespace boxflow::layout {

namespace {

class LineBuilder {
public:
    LineBuilder(const ConstraintSpace& space, float start_y, float strut)
        : space_(space), y_(start_y), strut_(strut) {
        reset();
    }

    // Whether the line holds text, an atomic box or a forced break.
    bool has_glyphs() const { return has_glyphs_; }

    void add_passive(const InlineItem& item) {
        line_.items.push_back(&item);
        if (item.is_float()) line_.float_ys.push_back(line_.y);
    }

    void add_tag(const InlineItem& item) {
        line_.items.push_back(&item);
        used_ += item.width;
        if (item.width > 0) has_content_ = true;
    }

    bool fits(const InlineItem& item) const {
        float h = std::max({line_height_, strut_, item.height});
        return used_ + item.fit_width() <= space_.available_inline_size(line_.y, h);
    }

    // Moves a line without glyphs down until item fits beside the exclusions.
    void avoid_exclusions(const InlineItem& item) {
        float h = std::max(strut_, item.height);
        float start = line_.y;
        for (int i = 0; i < core::config::kMaxFloatDropIterations; ++i) {
            InlineOffsets offsets = space_.exclusion_offsets(line_.y, h);
            if (offsets.left <= 0 && offsets.right <= 0) return;
            if (used_ + item.fit_width() <= space_.available_inline_size(line_.y, h)) return;
            auto next = space_.exclusion_space().next_bottom_below(line_.y);
            if (!next || *next - start > core::config::kMaxFloatDropDistance) return;
            line_.y = *next;
        }
    }

    void add_content(const InlineItem& item) {
        line_.items.push_back(&item);
        used_ += item.width;
        line_height_ = std::max(line_height_, item.height);
        has_content_ = true;
        has_glyphs_ = true;
    }

    // Open tags at the end of the line; they belong with the content that
    // follows them.
    std::vector<const InlineItem*> take_trailing_open_tags() {
        std::vector<const InlineItem*> tags;
        while (!line_.items.empty() && line_.items.back()->type == InlineItemType::OpenTag) {
            used_ -= line_.items.back()->width;
            tags.insert(tags.begin(), line_.items.back());
            line_.items.pop_back();
        }
        return tags;
    }

    void finish(std::vector<LineInfo>& lines) {
        while (!line_.items.empty() && line_.items.back()->whitespace_only) {
            line_.items.pop_back();
        }
        if (!line_.items.empty()) {
            line_.height = has_content_ ? std::max(line_height_, strut_) : line_height_;
            y_ = line_.y + line_.height;
            lines.push_back(std::move(line_));
        }
        reset();
    }

    void finish_control(const InlineItem& item, std::vector<LineInfo>& lines) {
        // A forced break always produces a line, even an empty one.
        line_.items.push_back(&item);
        line_height_ = std::max(line_height_, item.height);
        has_content_ = true;
        finish(lines);
    }

    void finish_block_child(const InlineItem& item, std::vector<LineInfo>& lines) {
        LineInfo block_line;
        block_line.y = y_;
        block_line.items.push_back(&item);
        block_line.space = space_;
        block_line.height = 0;
        lines.push_back(std::move(block_line));
    }

private:
    void reset() {
        line_ = LineInfo{};
        line_.y = y_;
        line_.space = space_;
        used_ = 0;
        line_height_ = 0;
        has_content_ = false;
        has_glyphs_ = false;
    }

    const ConstraintSpace& space_;
    float y_;
    float strut_;
    LineInfo line_;
    float used_ = 0;
    float line_height_ = 0;
    bool has_content_ = false;
    bool has_glyphs_ = false;
};

} // namespace

std::vector<LineInfo> break_lines(const std::vector<InlineItem>& items,
                                  const ConstraintSpace& space,
                                  float start_y, float strut) {
    std::vector<LineInfo> lines;
    LineBuilder line(space, start_y, strut);

    for (const auto& item : items) {
        switch (item.type) {
            case InlineItemType::Float:
            case InlineItemType::OutOfFlow:
                line.add_passive(item);
                break;
            case InlineItemType::OpenTag:
            case InlineItemType::CloseTag:
                line.add_tag(item);
                break;
            case InlineItemType::Control:
                line.finish_control(item, lines);
                break;
            case InlineItemType::BlockChild:
                line.finish(lines);
                line.finish_block_child(item, lines);
                break;
            case InlineItemType::Text:
            case InlineItemType::Atomic: {
                bool line_start = !line.has_glyphs();
                if (item.whitespace_only && line_start) {
                    break;
                }
                if (!line_start && !space.no_wrap() && !line.fits(item)) {
                    auto carried = line.take_trailing_open_tags();
                    line.finish(lines);
                    for (const auto* tag : carried) line.add_tag(*tag);
                    if (item.whitespace_only) {
                        break;
                    }
                    line_start = true;
                }
                if (line_start) {
                    line.avoid_exclusions(item);
                }
                line.add_content(item);
                break;
            }
        }
    }
    line.finish(lines);
    return lines;
}

} // namespace boxflow::layout
