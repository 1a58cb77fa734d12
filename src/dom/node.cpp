#include <boxflow/dom/node.h>
#include <algorithm>
#include <cassert>

namespace boxflow::dom {

Node::Node(NodeType type) : type_(type) {}

Node::~Node() = default;

Node* Node::first_child() const {
    if (children_.empty()) return nullptr;
    return children_.front().get();
}

Node* Node::last_child() const {
    if (children_.empty()) return nullptr;
    return children_.back().get();
}

Node& Node::append_child(std::unique_ptr<Node> child) {
    return insert_before(std::move(child), nullptr);
}

Node& Node::insert_before(std::unique_ptr<Node> child, Node* reference) {
    assert(child != nullptr);

    Node* new_child = child.get();
    new_child->parent_ = this;

    if (reference == nullptr) {
        Node* old_last = last_child();
        new_child->prev_sibling_ = old_last;
        new_child->next_sibling_ = nullptr;
        if (old_last) {
            old_last->next_sibling_ = new_child;
        }
        children_.push_back(std::move(child));
        return *new_child;
    }

    auto it = std::find_if(children_.begin(), children_.end(),
        [reference](const std::unique_ptr<Node>& c) {
            return c.get() == reference;
        });
    assert(it != children_.end() && "reference node is not a child of this node");

    Node* prev = reference->prev_sibling_;
    new_child->prev_sibling_ = prev;
    new_child->next_sibling_ = reference;
    reference->prev_sibling_ = new_child;
    if (prev) {
        prev->next_sibling_ = new_child;
    }

    children_.insert(it, std::move(child));
    return *new_child;
}

std::unique_ptr<Node> Node::remove_child(Node& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [&child](const std::unique_ptr<Node>& c) {
            return c.get() == &child;
        });
    assert(it != children_.end() && "child is not a child of this node");

    Node* prev = child.prev_sibling_;
    Node* next = child.next_sibling_;
    if (prev) {
        prev->next_sibling_ = next;
    }
    if (next) {
        next->prev_sibling_ = prev;
    }

    child.parent_ = nullptr;
    child.prev_sibling_ = nullptr;
    child.next_sibling_ = nullptr;

    std::unique_ptr<Node> removed = std::move(*it);
    children_.erase(it);
    return removed;
}

size_t Node::child_count() const {
    return children_.size();
}

void Node::set_style(const css::ComputedStyle& style) {
    style_ = std::make_shared<const css::ComputedStyle>(style);
}

std::string Node::text_content() const {
    std::string result;
    for (auto& child : children_) {
        result += child->text_content();
    }
    return result;
}

} // namespace boxflow::dom
