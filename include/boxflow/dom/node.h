#pragma once
#include <boxflow/css/computed_style.h>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace boxflow::dom {

enum class NodeType {
    Element, Text
};

class Node {
public:
    explicit Node(NodeType type);
    virtual ~Node();

    // Non-copyable
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    NodeType node_type() const { return type_; }
    bool is_element() const { return type_ == NodeType::Element; }
    bool is_text() const { return type_ == NodeType::Text; }

    Node* parent() const { return parent_; }
    Node* first_child() const;
    Node* last_child() const;
    Node* next_sibling() const { return next_sibling_; }
    Node* previous_sibling() const { return prev_sibling_; }

    // Tree manipulation
    Node& append_child(std::unique_ptr<Node> child);
    Node& insert_before(std::unique_ptr<Node> child, Node* reference);
    std::unique_ptr<Node> remove_child(Node& child);

    size_t child_count() const;

    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) {
            fn(*child);
        }
    }

    // Computed style attached by the style system. Null means the node has
    // no computed style and layout falls back to defaults.
    const css::ComputedStyle* style() const { return style_.get(); }
    const std::shared_ptr<const css::ComputedStyle>& shared_style() const { return style_; }
    void set_style(std::shared_ptr<const css::ComputedStyle> style) { style_ = std::move(style); }
    void set_style(const css::ComputedStyle& style);

    // Text content (recursive)
    virtual std::string text_content() const;

protected:
    NodeType type_;
    Node* parent_ = nullptr;
    Node* next_sibling_ = nullptr;
    Node* prev_sibling_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
    std::shared_ptr<const css::ComputedStyle> style_;
};

} // namespace boxflow::dom
