/// @file value.hpp
/// @brief The mutable JSON tree: NodeKind, ValueNode and RootContainer.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace eventsource_cpp {

/// The kinds of value a ValueNode can hold.
enum class NodeKind : std::uint8_t {
    null,     ///< JSON null.
    string,   ///< JSON string, stored unescaped.
    number,   ///< JSON number, stored as its literal text.
    boolean,  ///< JSON true/false, stored as its literal text.
    object,   ///< Named members.
    array,    ///< Ordered, heterogeneous elements.
};

/// Convert a NodeKind to its string representation.
constexpr auto to_string_view(NodeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case NodeKind::null:    return "null";
        case NodeKind::string:  return "string";
        case NodeKind::number:  return "number";
        case NodeKind::boolean: return "boolean";
        case NodeKind::object:  return "object";
        case NodeKind::array:   return "array";
    }
    return "unknown";
}

/// Check whether a kind holds literal text rather than children.
constexpr auto is_scalar(NodeKind kind) noexcept -> bool {
    return kind != NodeKind::object && kind != NodeKind::array;
}

/// Compare two names with ASCII case folding.
auto iequals(std::string_view a, std::string_view b) noexcept -> bool;

/// One node of a JSON document tree.
///
/// Scalars keep their literal text: a number is never converted to a
/// floating point value, so `1.0` is written back as `1.0`. Objects keep
/// their members in insertion order. Member names are unique by exact
/// match; find() and erase() match case-insensitively.
///
/// @code
/// auto obj = ValueNode{NodeKind::object};
/// obj.set_member("price", ValueNode{NodeKind::number, "9.50"});
/// auto* price = obj.find("PRICE");  // case-insensitive
/// @endcode
class ValueNode {
public:
    struct Member;
    using Members = std::vector<Member>;
    using Elements = std::vector<ValueNode>;

    /// Construct a null node.
    ValueNode();

    /// Construct an empty node of the given kind (empty text for scalars).
    explicit ValueNode(NodeKind kind);

    /// Construct a scalar node with literal text.
    ValueNode(NodeKind kind, std::string text);

    auto kind() const noexcept -> NodeKind { return kind_; }
    auto is_null() const noexcept -> bool { return kind_ == NodeKind::null; }
    auto is_object() const noexcept -> bool { return kind_ == NodeKind::object; }
    auto is_array() const noexcept -> bool { return kind_ == NodeKind::array; }
    auto is_scalar() const noexcept -> bool { return eventsource_cpp::is_scalar(kind_); }

    /// The literal text of a scalar. Empty for null and containers.
    auto text() const noexcept -> const std::string& { return text_; }

    /// Number of members (object) or elements (array); 0 for scalars.
    auto size() const noexcept -> std::size_t;
    auto empty() const noexcept -> bool { return size() == 0; }

    // -- Object access --------------------------------------------------------

    auto members() const noexcept -> const Members&;
    auto members() noexcept -> Members&;

    /// Find the first member whose name matches case-insensitively.
    /// @return nullptr if this is not an object or no member matches.
    auto find(std::string_view name) -> ValueNode*;
    auto find(std::string_view name) const -> const ValueNode*;

    /// Set a member by exact name, replacing an existing value in place
    /// or appending a new member.
    /// @pre is_object()
    auto set_member(std::string name, ValueNode value) -> ValueNode&;

    /// Erase the first member whose name matches case-insensitively.
    /// @return true if a member was removed.
    auto erase(std::string_view name) -> bool;

    // -- Array access ---------------------------------------------------------

    auto elements() const noexcept -> const Elements&;
    auto elements() noexcept -> Elements&;

    /// Append an element. @pre is_array()
    auto append(ValueNode value) -> ValueNode&;

    // -- Mutation -------------------------------------------------------------

    /// Turn this node into an empty node of `kind`, dropping all content.
    void reset(NodeKind kind);

    /// Turn this node into a scalar with the given literal text.
    void assign(NodeKind kind, std::string text);

    /// Structural equality. Member order is significant.
    auto operator==(const ValueNode& other) const -> bool;

private:
    NodeKind kind_;
    std::string text_;
    Members members_;
    Elements elements_;
};

/// A named member of an object node.
struct ValueNode::Member {
    std::string name;
    ValueNode value;

    auto operator==(const Member& other) const -> bool {
        return name == other.name && value == other.value;
    }
};

/// The top-level value of a document: an object or an array.
///
/// Path resolution always starts at an object. When the document is an
/// array, the container holds a synthetic object whose only member has
/// the empty name and carries the array; `[new]`, `[first]` and friends
/// (with an empty property name) address it.
class RootContainer {
public:
    /// An empty object document.
    RootContainer();

    /// Wrap an object or array node.
    /// @throws Exception(unsupported_root) if `value` is a scalar.
    static auto from_value(ValueNode value) -> RootContainer;

    auto is_array() const noexcept -> bool { return is_array_; }

    /// The object that path resolution starts from.
    auto holder() noexcept -> ValueNode& { return holder_; }
    auto holder() const noexcept -> const ValueNode& { return holder_; }

    /// The real top-level value (the holder itself, or the wrapped array).
    /// @throws Exception(serialize_error) if an array root's holder no
    ///   longer contains exactly the synthetic array member.
    auto value() const -> const ValueNode&;

private:
    ValueNode holder_;
    bool is_array_ = false;
};

}  // namespace eventsource_cpp
