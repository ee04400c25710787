#include <eventsource-cpp/path.hpp>
#include <eventsource-cpp/error.hpp>

#include <span>
#include <string>
#include <utility>

namespace eventsource_cpp {

namespace {

using Segments = std::span<const PathSegment>;
using Indexers = std::span<const Indexer>;

auto quoted(std::string_view name) -> std::string {
    auto result = std::string{"`"};
    result.append(name);
    result.push_back('`');
    return result;
}

// The kind to create for a node that is followed by `more_indexers`
// brackets and then `rest` segments.
auto placeholder_kind(bool more_indexers, bool more_path) -> NodeKind {
    if (more_indexers) return NodeKind::array;
    if (more_path) return NodeKind::object;
    return NodeKind::null;
}

auto resolve_in_object(ValueNode& object, Segments segments, bool create) -> ValueNode&;

// Make `node` usable as an object for the remaining path.
void require_object(ValueNode& node, std::string_view name, bool create) {
    if (node.is_object()) return;
    if (node.is_null()) {
        if (!create) {
            throw Exception{ErrorKind::null_in_path,
                "encountered null value at " + quoted(name) + " and create path is not enabled"};
        }
        node.reset(NodeKind::object);
        return;
    }
    throw Exception{ErrorKind::type_mismatch,
        quoted(name) + " is a " + std::string{to_string_view(node.kind())} +
        " and cannot contain further properties"};
}

// Make `node` usable as an array for an indexer.
void require_array(ValueNode& node, std::string_view name, bool create) {
    if (node.is_array()) return;
    if (node.is_null()) {
        if (!create) {
            throw Exception{ErrorKind::null_in_path,
                "encountered null value at " + quoted(name) + " and create path is not enabled"};
        }
        node.reset(NodeKind::array);
        return;
    }
    throw Exception{ErrorKind::type_mismatch,
        quoted(name) + " is a " + std::string{to_string_view(node.kind())} + ", not an array"};
}

auto resolve_in_array(ValueNode& array, std::string_view name, Indexers indexers,
                      Segments rest, bool create) -> ValueNode& {
    const auto& indexer = indexers.front();
    const auto more = indexers.subspan(1);
    auto& elements = array.elements();

    ValueNode* target = nullptr;
    switch (indexer.kind) {
        case IndexerKind::first:
            if (!elements.empty()) {
                target = &elements.front();
                break;
            }
            if (!create) {
                throw Exception{ErrorKind::empty_array,
                    "empty array " + quoted(name) + " encountered when seeking first element"};
            }
            target = &array.append(ValueNode{placeholder_kind(!more.empty(), !rest.empty())});
            break;
        case IndexerKind::new_element:
            if (!create) {
                throw Exception{ErrorKind::unsupported_indexer,
                    "array element operator `new` requires the path to be created"};
            }
            target = &array.append(ValueNode{placeholder_kind(!more.empty(), !rest.empty())});
            break;
        case IndexerKind::last:
            throw Exception{ErrorKind::not_supported, "last array element is not yet supported"};
        case IndexerKind::all:
            throw Exception{ErrorKind::unsupported_indexer,
                "array element operator `all` is only supported for the remove action"};
        case IndexerKind::other:
            throw Exception{ErrorKind::unsupported_indexer,
                "array element operator " + quoted(indexer.token) + " is not supported"};
    }

    if (!more.empty()) {
        require_array(*target, name, create);
        return resolve_in_array(*target, name, more, rest, create);
    }
    if (!rest.empty()) {
        require_object(*target, name, create);
        return resolve_in_object(*target, rest, create);
    }
    return *target;
}

auto resolve_in_object(ValueNode& object, Segments segments, bool create) -> ValueNode& {
    const auto& segment = segments.front();
    const auto rest = segments.subspan(1);
    const auto has_indexers = !segment.indexers.empty();

    auto* child = object.find(segment.name);
    if (!child) {
        if (!create) {
            throw Exception{ErrorKind::path_not_found,
                "unable to locate element named " + quoted(segment.name) + " and createIfMissing is false"};
        }
        child = &object.set_member(segment.name, ValueNode{placeholder_kind(has_indexers, !rest.empty())});
    }

    if (has_indexers) {
        require_array(*child, segment.name, create);
        return resolve_in_array(*child, segment.name, segment.indexers, rest, create);
    }
    if (rest.empty()) return *child;

    require_object(*child, segment.name, create);
    return resolve_in_object(*child, rest, create);
}

}  // anonymous namespace

auto classify_indexer(std::string_view token) noexcept -> IndexerKind {
    if (iequals(token, "first")) return IndexerKind::first;
    if (iequals(token, "last")) return IndexerKind::last;
    if (iequals(token, "new")) return IndexerKind::new_element;
    if (iequals(token, "all")) return IndexerKind::all;
    return IndexerKind::other;
}

auto parse_path(std::string_view text) -> Path {
    auto path = Path{};
    auto pos = std::size_t{0};
    while (true) {
        auto segment = PathSegment{};
        auto name_end = text.find_first_of(".[", pos);
        segment.name = std::string{text.substr(pos, name_end - pos)};
        pos = name_end;

        // Bracket chain: [a][b]...
        while (pos != std::string_view::npos && text[pos] == '[') {
            auto close = text.find_first_of("[]", pos + 1);
            if (close == std::string_view::npos || text[close] != ']') {
                throw Exception{ErrorKind::invalid_path,
                    "unterminated array indexer in path `" + std::string{text} + "`"};
            }
            auto token = text.substr(pos + 1, close - pos - 1);
            segment.indexers.push_back(Indexer{classify_indexer(token), std::string{token}});
            pos = close + 1;
            if (pos == text.size()) {
                pos = std::string_view::npos;
            } else if (text[pos] != '[' && text[pos] != '.') {
                throw Exception{ErrorKind::invalid_path,
                    "unexpected character after array indexer in path `" + std::string{text} + "`"};
            }
        }

        path.push_back(std::move(segment));
        if (pos == std::string_view::npos) break;
        ++pos;  // skip '.'
    }
    return path;
}

auto to_string(const Path& path) -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) result.push_back('.');
        result += path[i].name;
        for (const auto& indexer : path[i].indexers) {
            result.push_back('[');
            result += indexer.token;
            result.push_back(']');
        }
    }
    return result;
}

auto resolve(const Path& path, bool create_if_missing, ValueNode& root) -> ValueNode& {
    if (path.empty()) return root;
    if (!root.is_object()) {
        throw Exception{ErrorKind::type_mismatch, "path resolution must start at an object"};
    }
    return resolve_in_object(root, Segments{path}, create_if_missing);
}

auto resolve(std::string_view path, bool create_if_missing, ValueNode& root) -> ValueNode& {
    return resolve(parse_path(path), create_if_missing, root);
}

}  // namespace eventsource_cpp
