/// @file document.hpp
/// @brief Document: a base snapshot plus the events not yet applied to it.

#pragma once

#include <eventsource-cpp/config.hpp>
#include <eventsource-cpp/event.hpp>

#include <string>
#include <vector>

namespace eventsource_cpp {

/// A snapshot and the events, in the order they were posted, that
/// produce the entity's current state.
///
/// @code
/// auto doc = Document{};
/// doc.base_document = "{}";
/// doc.events.push_back(DocumentEvent{.instructions = {
///     {"customer.name", ActionType::set_or_add, DataType::string, "Ada"},
/// }});
/// auto state = doc.current_state();  // {"customer":{"name":"Ada"}}
/// @endcode
struct Document {
    std::string entity_id;      ///< Opaque identifier of the entity.
    std::string base_document;  ///< JSON text; top level must be an object or array.
    std::vector<DocumentEvent> events;

    /// Replay every event onto the base document and return the result.
    /// @throws Exception on the first failing instruction.
    auto current_state(const ReplayConfig& config = {}) const -> std::string;

    auto operator==(const Document&) const -> bool = default;
};

}  // namespace eventsource_cpp
