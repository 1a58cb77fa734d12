#include <boxflow/dom/element.h>
#include <algorithm>

namespace boxflow::dom {

Element::Element(const std::string& tag_name)
    : Node(NodeType::Element)
    , tag_name_(tag_name) {}

std::optional<std::string> Element::get_attribute(std::string_view name) const {
    for (auto& attr : attributes_) {
        if (attr.name == name) {
            return attr.value;
        }
    }
    return std::nullopt;
}

void Element::set_attribute(const std::string& name, const std::string& value) {
    for (auto& attr : attributes_) {
        if (attr.name == name) {
            attr.value = value;
            return;
        }
    }
    attributes_.push_back({name, value});
}

void Element::remove_attribute(const std::string& name) {
    attributes_.erase(
        std::remove_if(attributes_.begin(), attributes_.end(),
            [&name](const Attribute& a) { return a.name == name; }),
        attributes_.end());
}

bool Element::has_attribute(std::string_view name) const {
    return get_attribute(name).has_value();
}

} // namespace boxflow::dom
