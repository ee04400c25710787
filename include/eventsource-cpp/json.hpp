/// @file json.hpp
/// @brief JSON text <-> ValueNode tree: parser, serializer and writer.
///
/// Parsing runs nlohmann/json's SAX parser and builds the tree in a single
/// pass; every value's kind is reported by the parser directly. Numbers
/// keep their literal text. Serialization is compact and structural.

#pragma once

#include <eventsource-cpp/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace eventsource_cpp {

/// Deepest container nesting accepted by parse() and parse_value().
inline constexpr std::size_t max_nesting_depth = 512;

/// Parse a JSON document whose top-level value is an object or an array.
/// @throws Exception(parse_error) on malformed JSON.
/// @throws Exception(unsupported_root) if the top-level value is a scalar.
auto parse(std::string_view text) -> RootContainer;

/// Parse any JSON value (scalars included) into a detached node.
/// @throws Exception(parse_error) on malformed JSON.
auto parse_value(std::string_view text) -> ValueNode;

/// Render a document as compact JSON. An array document is rendered as
/// the bare array.
/// @throws Exception(serialize_error) if the tree is inconsistent.
auto serialize(const RootContainer& root) -> std::string;

/// Render a single subtree as compact JSON.
/// @throws Exception(serialize_error) if the tree is inconsistent.
auto serialize(const ValueNode& node) -> std::string;

/// Incremental compact JSON writer.
///
/// Tracks whether a separator is due, so callers only emit structure.
///
/// @code
/// auto w = JsonWriter{};
/// w.begin_object();
/// w.key("a");
/// w.literal("1");
/// w.end_object();
/// // w.str() == R"({"a":1})"
/// @endcode
class JsonWriter {
public:
    void begin_object();
    void end_object();
    void begin_array();
    void end_array();

    /// Write an object key and the following colon.
    void key(std::string_view name);

    /// Write a quoted, escaped string value.
    void string(std::string_view text);

    /// Write raw literal text (numbers, booleans).
    void literal(std::string_view text);

    void null();

    auto str() const noexcept -> const std::string& { return out_; }
    auto take() noexcept -> std::string { return std::move(out_); }

private:
    void separate();

    std::string out_;
    bool need_comma_ = false;
};

}  // namespace eventsource_cpp
