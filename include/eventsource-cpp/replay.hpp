/// @file replay.hpp
/// @brief Replaying events onto a base document: the library's entry point.

#pragma once

#include <eventsource-cpp/config.hpp>
#include <eventsource-cpp/document.hpp>
#include <eventsource-cpp/error.hpp>
#include <eventsource-cpp/value.hpp>

#include <span>
#include <string>
#include <variant>
#include <vector>

namespace eventsource_cpp {

/// Either the replayed document text or the error that stopped the replay.
using ReplayResult = std::variant<std::string, Error>;

/// Parse the base document, apply every instruction of every event in
/// order, and serialize the result.
///
/// The tree is built fresh for each call and never outlives it. The
/// first failing instruction aborts the whole replay; no partial output
/// is returned.
///
/// @code
/// auto doc = Document{.base_document = R"({"a":{"b":1,"c":2}})"};
/// doc.events.push_back(DocumentEvent{.instructions = {
///     {.path = "a.b", .action = ActionType::remove},
/// }});
/// auto state = replay(doc);  // {"a":{"c":2}}
/// @endcode
/// @throws Exception
auto replay(const Document& document, const ReplayConfig& config = {}) -> std::string;

/// Like replay(), but an Exception is returned as an Error instead.
auto try_replay(const Document& document, const ReplayConfig& config = {}) -> ReplayResult;

/// Apply all events of `document` to an already parsed tree.
/// @throws Exception
void apply_events(RootContainer& root, const Document& document, const ReplayConfig& config = {});

/// Replay independent documents concurrently on the shared executor.
///
/// Result `i` belongs to `documents[i]`. Documents share no state, so one
/// document's failure never affects another's.
auto replay_all(std::span<const Document> documents,
                const ReplayConfig& config = {}) -> std::vector<ReplayResult>;

/// Check whether a ReplayResult holds a document.
inline auto succeeded(const ReplayResult& result) -> bool {
    return std::holds_alternative<std::string>(result);
}

}  // namespace eventsource_cpp
