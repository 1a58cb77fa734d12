#pragma once
#include <boxflow/dom/node.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace boxflow::dom {

struct Attribute {
    std::string name;
    std::string value;
};

class Element : public Node {
public:
    explicit Element(const std::string& tag_name);

    const std::string& tag_name() const { return tag_name_; }

    // Attributes
    std::optional<std::string> get_attribute(std::string_view name) const;
    void set_attribute(const std::string& name, const std::string& value);
    void remove_attribute(const std::string& name);
    bool has_attribute(std::string_view name) const;
    const std::vector<Attribute>& attributes() const { return attributes_; }

private:
    std::string tag_name_;
    std::vector<Attribute> attributes_;
};

} // namespace boxflow::dom
