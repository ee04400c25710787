#include <eventsource-cpp/value.hpp>
#include <eventsource-cpp/error.hpp>

#include <algorithm>
#include <utility>

namespace eventsource_cpp {

namespace {

constexpr auto fold(char c) noexcept -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

}  // anonymous namespace

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
    return std::ranges::equal(a, b, [](char x, char y) { return fold(x) == fold(y); });
}

// -- ValueNode ----------------------------------------------------------------

ValueNode::ValueNode() : kind_{NodeKind::null} {}

ValueNode::ValueNode(NodeKind kind) : kind_{kind} {}

ValueNode::ValueNode(NodeKind kind, std::string text)
    : kind_{kind}, text_{std::move(text)} {}

auto ValueNode::size() const noexcept -> std::size_t {
    switch (kind_) {
        case NodeKind::object: return members_.size();
        case NodeKind::array:  return elements_.size();
        default:               return 0;
    }
}

auto ValueNode::members() const noexcept -> const Members& { return members_; }
auto ValueNode::members() noexcept -> Members& { return members_; }

auto ValueNode::find(std::string_view name) -> ValueNode* {
    if (kind_ != NodeKind::object) return nullptr;
    auto it = std::ranges::find_if(members_, [&](const Member& m) { return iequals(m.name, name); });
    return it != members_.end() ? &it->value : nullptr;
}

auto ValueNode::find(std::string_view name) const -> const ValueNode* {
    return const_cast<ValueNode*>(this)->find(name);
}

auto ValueNode::set_member(std::string name, ValueNode value) -> ValueNode& {
    auto it = std::ranges::find(members_, name, &Member::name);
    if (it != members_.end()) {
        it->value = std::move(value);
        return it->value;
    }
    members_.push_back(Member{std::move(name), std::move(value)});
    return members_.back().value;
}

auto ValueNode::erase(std::string_view name) -> bool {
    if (kind_ != NodeKind::object) return false;
    auto it = std::ranges::find_if(members_, [&](const Member& m) { return iequals(m.name, name); });
    if (it == members_.end()) return false;
    members_.erase(it);
    return true;
}

auto ValueNode::elements() const noexcept -> const Elements& { return elements_; }
auto ValueNode::elements() noexcept -> Elements& { return elements_; }

auto ValueNode::append(ValueNode value) -> ValueNode& {
    elements_.push_back(std::move(value));
    return elements_.back();
}

void ValueNode::reset(NodeKind kind) {
    kind_ = kind;
    text_.clear();
    members_.clear();
    elements_.clear();
}

void ValueNode::assign(NodeKind kind, std::string text) {
    reset(kind);
    text_ = std::move(text);
}

auto ValueNode::operator==(const ValueNode& other) const -> bool {
    return kind_ == other.kind_ && text_ == other.text_ &&
           members_ == other.members_ && elements_ == other.elements_;
}

// -- RootContainer ------------------------------------------------------------

RootContainer::RootContainer() : holder_{NodeKind::object} {}

auto RootContainer::from_value(ValueNode value) -> RootContainer {
    auto root = RootContainer{};
    switch (value.kind()) {
        case NodeKind::object:
            root.holder_ = std::move(value);
            return root;
        case NodeKind::array:
            root.holder_.set_member(std::string{}, std::move(value));
            root.is_array_ = true;
            return root;
        default:
            throw Exception{ErrorKind::unsupported_root,
                std::string{"base document must be an object or an array, got "} +
                std::string{to_string_view(value.kind())}};
    }
}

auto RootContainer::value() const -> const ValueNode& {
    if (!is_array_) return holder_;
    const auto& members = holder_.members();
    if (members.size() != 1 || !members.front().name.empty() || !members.front().value.is_array()) {
        throw Exception{ErrorKind::serialize_error,
            "array document holder must contain exactly one unnamed array"};
    }
    return members.front().value;
}

}  // namespace eventsource_cpp
