#include <boxflow/dom/text.h>

namespace boxflow::dom {

Text::Text(const std::string& data)
    : Node(NodeType::Text)
    , data_(data) {}

void Text::set_data(const std::string& data) {
    data_ = data;
}

std::string Text::text_content() const {
    return data_;
}

} // namespace boxflow::dom
