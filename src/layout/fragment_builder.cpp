#include <boxflow/layout/fragment_builder.h>
#include <boxflow/dom/element.h>
#include <algorithm>

namespace boxflow::layout {

namespace {

Fragment make_fragment(FragmentType type, const InlineItem& item, size_t item_index,
                       size_t line_index) {
    Fragment f;
    f.type = type;
    f.node = item.node;
    f.style = item.style;
    f.item_index = item_index;
    f.line_index = line_index;
    return f;
}

// Offset of an atomic inline's margin box from the top of its line. Baseline
// keeps the top edge on the line top, as the items carry no baseline.
float vertical_offset(const InlineItem& item, float line_height) {
    css::VerticalAlign align = item.style ? item.style->vertical_align
                                          : css::VerticalAlign::Baseline;
    switch (align) {
        case css::VerticalAlign::Middle: return (line_height - item.height) / 2.0f;
        case css::VerticalAlign::Bottom: return line_height - item.height;
        default:                         return 0.0f;
    }
}

float alignment_offset(css::TextAlign align, float line_width, float content_width) {
    float extra = std::max(0.0f, line_width - content_width);
    switch (align) {
        case css::TextAlign::Right:  return extra;
        case css::TextAlign::Center: return extra / 2.0f;
        default:                     return 0.0f;
    }
}

} // namespace

FragmentBuildResult construct_fragments(const std::vector<InlineItem>& items,
                                        const std::vector<LineInfo>& lines,
                                        const ConstraintSpace& space,
                                        core::DiagnosticEmitter* diagnostics) {
    FragmentBuildResult result;
    ConstraintSpace current = space;
    float available = space.available_width();
    auto index_of = [&items](const InlineItem* item) {
        return static_cast<size_t>(item - items.data());
    };

    for (size_t li = 0; li < lines.size(); ++li) {
        const LineInfo& line = lines[li];

        size_t float_index = 0;
        for (const InlineItem* item : line.items) {
            if (!item->is_float()) continue;
            css::Float side = item->style ? item->style->float_val : css::Float::Left;
            float min_y = float_index < line.float_ys.size() ? line.float_ys[float_index] : line.y;
            ++float_index;
            if (auto last = current.exclusion_space().last_top()) {
                min_y = std::max(min_y, *last);
            }
            if (item->style && item->style->clear != css::Clear::None) {
                min_y = current.exclusion_space().clearance_y(item->style->clear, min_y);
            }
            FloatPlacement placement = place_float(current.exclusion_space(), side,
                                                   item->width, item->height, available,
                                                   min_y, diagnostics);
            current = current.with_exclusion(
                {Rect{placement.inset, placement.y, item->width, item->height}, side});

            float left = side == css::Float::Right
                ? available - placement.inset - item->width
                : placement.inset;
            Fragment f = make_fragment(FragmentType::Float, *item, index_of(item), li);
            f.position = {left + item->margin.left, placement.y + item->margin.top};
            f.size = {std::max(0.0f, item->width - item->margin.horizontal()),
                      std::max(0.0f, item->height - item->margin.vertical())};
            result.fragments.push_back(std::move(f));
        }

        InlineOffsets offsets = current.exclusion_offsets(line.y, line.height);
        float line_width = available - offsets.left - offsets.right;

        float content_width = 0;
        const InlineItem* last_content = nullptr;
        for (const InlineItem* item : line.items) {
            if (item->is_float()) continue;
            content_width += item->width;
            if (item->is_in_flow_content()) last_content = item;
        }
        if (last_content) content_width -= last_content->trailing_space_width;

        float x = offsets.left +
            alignment_offset(space.text_align(), line_width, content_width);

        for (const InlineItem* item : line.items) {
            size_t index = index_of(item);
            switch (item->type) {
                case InlineItemType::Float:
                    break;
                case InlineItemType::Text: {
                    Fragment f = make_fragment(FragmentType::Text, *item, index, li);
                    f.position = {x, line.y};
                    f.size = {item->width, item->height};
                    f.text = item->text;
                    result.fragments.push_back(std::move(f));
                    x += item->width;
                    break;
                }
                case InlineItemType::Atomic: {
                    Fragment f = make_fragment(FragmentType::Atomic, *item, index, li);
                    f.position = {x + item->margin.left,
                                  line.y + vertical_offset(*item, line.height) + item->margin.top};
                    f.size = {std::max(0.0f, item->width - item->margin.horizontal()),
                              std::max(0.0f, item->height - item->margin.vertical())};
                    if (item->node && item->node->is_element()) {
                        const auto& el = static_cast<const dom::Element&>(*item->node);
                        f.image_src = el.get_attribute("src").value_or("");
                    }
                    result.fragments.push_back(std::move(f));
                    x += item->width;
                    break;
                }
                case InlineItemType::OpenTag:
                case InlineItemType::CloseTag: {
                    Fragment f = make_fragment(item->type == InlineItemType::OpenTag
                                                   ? FragmentType::OpenTag
                                                   : FragmentType::CloseTag,
                                               *item, index, li);
                    f.position = {x, line.y};
                    f.size = {item->width, 0};
                    result.fragments.push_back(std::move(f));
                    x += item->width;
                    break;
                }
                case InlineItemType::Control: {
                    Fragment f = make_fragment(FragmentType::Control, *item, index, li);
                    f.position = {x, line.y};
                    f.size = {0, item->height};
                    result.fragments.push_back(std::move(f));
                    break;
                }
                case InlineItemType::BlockChild: {
                    // Laid out by the enclosing block, which has the box-model context.
                    Fragment f = make_fragment(FragmentType::BlockPlaceholder, *item, index, li);
                    f.position = {offsets.left, line.y};
                    result.fragments.push_back(std::move(f));
                    break;
                }
                case InlineItemType::OutOfFlow: {
                    Fragment f = make_fragment(FragmentType::OutOfFlowPlaceholder, *item, index, li);
                    f.position = {x, line.y};
                    result.fragments.push_back(std::move(f));
                    break;
                }
            }
        }

        result.line_boxes.push_back({line.y, line.height, offsets.left, available - offsets.right});
        result.line_widths.push_back(line_width);
    }

    result.final_space = current;
    return result;
}

} // namespace boxflow::layout
