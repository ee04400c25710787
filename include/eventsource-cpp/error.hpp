/// @file error.hpp
/// @brief Error types for the eventsource-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace eventsource_cpp {

/// Categories of errors that can occur while replaying a document.
enum class ErrorKind : std::uint8_t {
    parse_error,          ///< Malformed JSON in a base document or instruction value.
    unsupported_root,     ///< The top-level JSON value is a scalar.
    invalid_path,         ///< A path expression is syntactically malformed.
    path_not_found,       ///< A path segment does not exist and may not be created.
    null_in_path,         ///< A null value blocks traversal of a read-only path.
    type_mismatch,        ///< A node has the wrong kind for the requested navigation.
    empty_array,          ///< An element was requested from an empty array.
    unsupported_indexer,  ///< An array indexer token is unknown or not valid here.
    not_supported,        ///< A recognized feature that is not available (e.g. `[last]` lookup).
    non_empty_replace,    ///< Whole-document replace against a non-empty root.
    not_implemented,      ///< The AddOnly action.
    unknown_action_type,  ///< An instruction carries an unrecognized action.
    unknown_data_type,    ///< An instruction carries an unrecognized data type.
    invalid_value,        ///< An instruction value does not match its data type.
    serialize_error,      ///< The tree is internally inconsistent and cannot be rendered.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::parse_error:         return "parse_error";
        case ErrorKind::unsupported_root:    return "unsupported_root";
        case ErrorKind::invalid_path:        return "invalid_path";
        case ErrorKind::path_not_found:      return "path_not_found";
        case ErrorKind::null_in_path:        return "null_in_path";
        case ErrorKind::type_mismatch:       return "type_mismatch";
        case ErrorKind::empty_array:         return "empty_array";
        case ErrorKind::unsupported_indexer: return "unsupported_indexer";
        case ErrorKind::not_supported:       return "not_supported";
        case ErrorKind::non_empty_replace:   return "non_empty_replace";
        case ErrorKind::not_implemented:     return "not_implemented";
        case ErrorKind::unknown_action_type: return "unknown_action_type";
        case ErrorKind::unknown_data_type:   return "unknown_data_type";
        case ErrorKind::invalid_value:       return "invalid_value";
        case ErrorKind::serialize_error:     return "serialize_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by the throwing API; carries the structured Error.
///
/// @code
/// try {
///     auto state = replay(doc);
/// } catch (const Exception& e) {
///     if (e.kind() == ErrorKind::path_not_found) { ... }
/// }
/// @endcode
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace eventsource_cpp
