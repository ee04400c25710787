/// @file applier.hpp
/// @brief Applying a single instruction to a document tree.

#pragma once

#include <eventsource-cpp/config.hpp>
#include <eventsource-cpp/event.hpp>
#include <eventsource-cpp/value.hpp>

#include <string_view>

namespace eventsource_cpp {

/// Apply one instruction to `root`.
///
/// - An empty path with a `map` or `array` value (any action but remove)
///   replaces the whole document; the root must be empty.
/// - SetOrAdd resolves the path creating what is missing, SetOnly
///   resolves it read-only; both then call set_value().
/// - AddOnly always fails with ErrorKind::not_implemented.
/// - Remove deletes a property, or the `[first]`/`[last]`/`[all]`
///   elements of an array, honoring `config` for missing targets.
///
/// There is no rollback: if an instruction fails, changes made by earlier
/// instructions stay in the tree.
/// @throws Exception
void apply(RootContainer& root, const EventInstruction& instruction,
           const ReplayConfig& config = {});

/// Overwrite a node's kind and value from an instruction payload.
///
/// Scalars keep the literal text exactly as supplied (`"1.0"` stays
/// `1.0`). `map` and `array` payloads are parsed and spliced in.
/// @throws Exception(invalid_value) if the literal does not fit the type.
/// @throws Exception(parse_error) if a map/array payload is not valid
///   JSON of the matching kind.
void set_value(ValueNode& node, DataType type, std::string_view value);

}  // namespace eventsource_cpp
