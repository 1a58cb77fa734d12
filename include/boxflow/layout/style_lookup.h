#pragma once
#include <boxflow/css/computed_style.h>
#include <boxflow/dom/node.h>
#include <memory>
#include <string>

namespace boxflow::layout {

using StylePtr = std::shared_ptr<const css::ComputedStyle>;

// Style of node for layout. Elements without a computed style get the
// user-agent default for their tag; text nodes use their parent's style.
StylePtr resolve_style(const dom::Node& node, const StylePtr& parent_style);

// Display after CSS 2.1 §9.7: floated and absolutely positioned boxes
// become block-level.
css::Display effective_display(const css::ComputedStyle& style);

bool is_block_level(css::Display display);
bool is_out_of_flow(const css::ComputedStyle& style);
bool is_whitespace_only(const std::string& text);

// Lower-case tag name, or empty for text nodes.
std::string tag_name_of(const dom::Node& node);

} // namespace boxflow::layout
