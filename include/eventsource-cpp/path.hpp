/// @file path.hpp
/// @brief Path expressions: parsing and resolution against a ValueNode tree.
///
/// Grammar:
/// @code
/// path     := segment ('.' segment)*
/// segment  := name indexer*
/// indexer  := '[' token ']'
/// token    := 'first' | 'last' | 'new' | 'all' | <anything else>
/// name     := any run of characters excluding '.' and '['
/// @endcode
///
/// Names and tokens match case-insensitively. Example:
/// `orders[first].lines[new].sku` addresses the `sku` property of a new
/// element appended to the `lines` array of the first order.

#pragma once

#include <eventsource-cpp/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace eventsource_cpp {

/// Positional keywords accepted inside `[...]`.
enum class IndexerKind : std::uint8_t {
    first,        ///< Element 0.
    last,         ///< Last element. Only supported by remove.
    new_element,  ///< A freshly appended element.
    all,          ///< Every element. Only supported by remove.
    other,        ///< Unrecognized token, e.g. a condition expression.
};

/// Convert an IndexerKind to its token text.
constexpr auto to_string_view(IndexerKind kind) noexcept -> std::string_view {
    switch (kind) {
        case IndexerKind::first:       return "first";
        case IndexerKind::last:        return "last";
        case IndexerKind::new_element: return "new";
        case IndexerKind::all:         return "all";
        case IndexerKind::other:       return "other";
    }
    return "unknown";
}

/// One `[token]` of a path segment.
struct Indexer {
    IndexerKind kind;
    std::string token;  ///< The token as written.

    auto operator==(const Indexer&) const -> bool = default;
};

/// A property name followed by zero or more indexers.
struct PathSegment {
    std::string name;
    std::vector<Indexer> indexers;

    auto operator==(const PathSegment&) const -> bool = default;
};

/// A parsed path. An empty path addresses the starting object itself.
using Path = std::vector<PathSegment>;

/// Classify an indexer token (case-insensitive).
auto classify_indexer(std::string_view token) noexcept -> IndexerKind;

/// Parse a path expression. The empty string yields one segment with an
/// empty name.
/// @throws Exception(invalid_path) on an unterminated or misplaced bracket.
auto parse_path(std::string_view text) -> Path;

/// Render a path back to its textual form.
auto to_string(const Path& path) -> std::string;

/// Locate the node addressed by `path`, starting at the object `root`.
///
/// With `create_if_missing`, absent segments are created: an array when
/// indexers follow, an object when more path follows, null otherwise,
/// and null values on the way are promoted to objects or arrays.
/// Without it, resolution never modifies the tree and fails instead of
/// returning a partial match.
///
/// @throws Exception(path_not_found, null_in_path, type_mismatch,
///   empty_array, unsupported_indexer, not_supported)
auto resolve(const Path& path, bool create_if_missing, ValueNode& root) -> ValueNode&;

/// Parse and resolve in one step.
auto resolve(std::string_view path, bool create_if_missing, ValueNode& root) -> ValueNode&;

}  // namespace eventsource_cpp
