#include <eventsource-cpp/wire.hpp>
#include <eventsource-cpp/error.hpp>
#include <eventsource-cpp/value.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace eventsource_cpp {

namespace {

using json = nlohmann::json;

// Field lookup with case-insensitive names; the first spelling that is
// present wins.
auto find_field(const json& j, std::initializer_list<std::string_view> names) -> const json* {
    for (auto name : names) {
        for (const auto& [key, value] : j.items()) {
            if (iequals(key, name)) return &value;
        }
    }
    return nullptr;
}

auto string_field(const json& j, std::string_view name) -> std::string {
    const auto* field = find_field(j, {name});
    if (!field || field->is_null()) return {};
    if (!field->is_string()) {
        throw Exception{ErrorKind::parse_error,
            "field `" + std::string{name} + "` must be a string"};
    }
    return field->get<std::string>();
}

// A string holding JSON text, or inline JSON that is re-rendered as text.
auto text_or_inline_json(const json& j, std::string_view name) -> std::string {
    const auto* field = find_field(j, {name});
    if (!field || field->is_null()) return {};
    if (field->is_string()) return field->get<std::string>();
    return field->dump();
}

void require_object(const json& j, std::string_view what) {
    if (!j.is_object()) {
        throw Exception{ErrorKind::parse_error, std::string{what} + " must be a JSON object"};
    }
}

template <typename T>
auto load(std::string_view text, std::string_view what) -> T {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw Exception{ErrorKind::parse_error, std::string{what} + " is not valid JSON"};
    }
    try {
        return j.get<T>();
    } catch (const json::exception& e) {
        throw Exception{ErrorKind::parse_error, std::string{what} + ": " + e.what()};
    }
}

}  // anonymous namespace

// -- EventInstruction ---------------------------------------------------------

void from_json(const json& j, EventInstruction& instruction) {
    require_object(j, "instruction");
    instruction.path = string_field(j, "Path");

    const auto action = string_field(j, "ActionType");
    const auto parsed_action = action_type_from_string(action);
    if (!parsed_action) {
        throw Exception{ErrorKind::unknown_action_type,
            "unexpected instruction action type `" + action + "`"};
    }
    instruction.action = *parsed_action;

    const auto data_type = string_field(j, "DataType");
    const auto parsed_type = data_type_from_string(data_type);
    if (!parsed_type) {
        throw Exception{ErrorKind::unknown_data_type,
            "unexpected instruction data type `" + data_type + "`"};
    }
    instruction.data_type = *parsed_type;

    instruction.value = text_or_inline_json(j, "Value");
}

void to_json(json& j, const EventInstruction& instruction) {
    j = json{
        {"Path", instruction.path},
        {"ActionType", std::string{to_string_view(instruction.action)}},
        {"DataType", std::string{to_string_view(instruction.data_type)}},
        {"Value", instruction.value},
    };
}

// -- DocumentEvent ------------------------------------------------------------

void from_json(const json& j, DocumentEvent& event) {
    event = DocumentEvent{};
    if (j.is_array()) {
        event.instructions = j.get<std::vector<EventInstruction>>();
        return;
    }
    require_object(j, "event");
    event.event_id = string_field(j, "EventId");
    if (const auto* ts = find_field(j, {"Timestamp"}); ts && !ts->is_null()) {
        if (!ts->is_number_unsigned()) {
            throw Exception{ErrorKind::parse_error, "field `Timestamp` must be an unsigned integer"};
        }
        event.timestamp = ts->get<std::uint64_t>();
    }
    if (const auto* instructions = find_field(j, {"Instructions"}); instructions && !instructions->is_null()) {
        if (!instructions->is_array()) {
            throw Exception{ErrorKind::parse_error, "field `Instructions` must be an array"};
        }
        event.instructions = instructions->get<std::vector<EventInstruction>>();
    }
}

void to_json(json& j, const DocumentEvent& event) {
    j = json{
        {"EventId", event.event_id},
        {"Timestamp", event.timestamp},
        {"Instructions", event.instructions},
    };
}

// -- Document -----------------------------------------------------------------

void from_json(const json& j, Document& document) {
    require_object(j, "document");
    document = Document{};
    document.entity_id = string_field(j, "EntityId");
    document.base_document = text_or_inline_json(j, "BaseDocument");
    if (const auto* events = find_field(j, {"Events"}); events && !events->is_null()) {
        if (!events->is_array()) {
            throw Exception{ErrorKind::parse_error, "field `Events` must be an array"};
        }
        document.events = events->get<std::vector<DocumentEvent>>();
    }
}

void to_json(json& j, const Document& document) {
    j = json{
        {"EntityId", document.entity_id},
        {"BaseDocument", document.base_document},
        {"Events", document.events},
    };
}

// -- ReplayConfig -------------------------------------------------------------

void from_json(const json& j, ReplayConfig& config) {
    require_object(j, "configuration");
    config = ReplayConfig{};
    // Earlier releases spelled "Existent" as "Existant"; accept both.
    if (const auto* f = find_field(j, {"RemoveNonExistentElementIsError", "RemoveNonExistantElementIsError"})) {
        if (!f->is_boolean()) {
            throw Exception{ErrorKind::parse_error, "field `RemoveNonExistentElementIsError` must be a bool"};
        }
        config.remove_nonexistent_element_is_error = f->get<bool>();
    }
    if (const auto* f = find_field(j, {"RemoveNonExistentArrayElementIsError", "RemoveNonExistantArrayElementIsError"})) {
        if (!f->is_boolean()) {
            throw Exception{ErrorKind::parse_error, "field `RemoveNonExistentArrayElementIsError` must be a bool"};
        }
        config.remove_nonexistent_array_element_is_error = f->get<bool>();
    }
}

void to_json(json& j, const ReplayConfig& config) {
    j = json{
        {"RemoveNonExistentElementIsError", config.remove_nonexistent_element_is_error},
        {"RemoveNonExistentArrayElementIsError", config.remove_nonexistent_array_element_is_error},
    };
}

// -- Text helpers -------------------------------------------------------------

auto load_document(std::string_view text) -> Document {
    return load<Document>(text, "document");
}

auto load_event(std::string_view text) -> DocumentEvent {
    return load<DocumentEvent>(text, "event");
}

auto load_config(std::string_view text) -> ReplayConfig {
    return load<ReplayConfig>(text, "configuration");
}

}  // namespace eventsource_cpp
