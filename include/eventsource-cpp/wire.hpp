/// @file wire.hpp
/// @brief nlohmann/json serialization of documents, events, instructions
/// and configuration.
///
/// Wire shapes (field names match case-insensitively on input):
/// @code
/// {"Path": "a.b", "ActionType": "SetOrAdd", "DataType": "string", "Value": "x"}
/// {"EventId": "...", "Timestamp": 0, "Instructions": [ ... ]}
/// {"EntityId": "...", "BaseDocument": "{}", "Events": [ ... ]}
/// {"RemoveNonExistentElementIsError": true, "RemoveNonExistentArrayElementIsError": false}
/// @endcode
///
/// An event may also be given as a bare array of instructions.
/// `BaseDocument` may be JSON text in a string or an inline object/array;
/// a `map`/`array` instruction `Value` may likewise be inline JSON.

#pragma once

#include <eventsource-cpp/config.hpp>
#include <eventsource-cpp/document.hpp>
#include <eventsource-cpp/event.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace eventsource_cpp {

// -- ADL serialization --------------------------------------------------------

/// @throws Exception(unknown_action_type, unknown_data_type, parse_error)
void from_json(const nlohmann::json& j, EventInstruction& instruction);
void to_json(nlohmann::json& j, const EventInstruction& instruction);

void from_json(const nlohmann::json& j, DocumentEvent& event);
void to_json(nlohmann::json& j, const DocumentEvent& event);

void from_json(const nlohmann::json& j, Document& document);
void to_json(nlohmann::json& j, const Document& document);

void from_json(const nlohmann::json& j, ReplayConfig& config);
void to_json(nlohmann::json& j, const ReplayConfig& config);

// -- Text helpers -------------------------------------------------------------

/// Decode a Document from its JSON wire form.
/// @throws Exception(parse_error) on malformed JSON or a mistyped field.
auto load_document(std::string_view text) -> Document;

/// Decode an event from its JSON wire form (object or bare instruction array).
auto load_event(std::string_view text) -> DocumentEvent;

/// Decode a ReplayConfig from its JSON wire form.
auto load_config(std::string_view text) -> ReplayConfig;

}  // namespace eventsource_cpp
