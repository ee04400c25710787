/// @file event.hpp
/// @brief Instructions and events: the mutations replayed onto a document.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eventsource_cpp {

/// What an instruction does to the node at its path.
enum class ActionType : std::uint8_t {
    set_or_add,  ///< Create the path if needed, then overwrite the value.
    add_only,    ///< Add a value that must not exist yet. Not implemented.
    set_only,    ///< Overwrite an existing value; never create.
    remove,      ///< Delete a property or array element(s).
};

/// The type of an instruction's value.
enum class DataType : std::uint8_t {
    none,     ///< No value (remove instructions).
    string,
    number,   ///< Wire name "float64"; stored as the literal text.
    boolean,  ///< Wire name "bool".
    null,
    array,    ///< The value is a JSON array document.
    map,      ///< The value is a JSON object document.
};

/// Wire name of an action type, e.g. "SetOrAdd".
constexpr auto to_string_view(ActionType type) noexcept -> std::string_view {
    switch (type) {
        case ActionType::set_or_add: return "SetOrAdd";
        case ActionType::add_only:   return "AddOnly";
        case ActionType::set_only:   return "SetOnly";
        case ActionType::remove:     return "Remove";
    }
    return "unknown";
}

/// Wire name of a data type, e.g. "float64".
constexpr auto to_string_view(DataType type) noexcept -> std::string_view {
    switch (type) {
        case DataType::none:    return "";
        case DataType::string:  return "string";
        case DataType::number:  return "float64";
        case DataType::boolean: return "bool";
        case DataType::null:    return "null";
        case DataType::array:   return "array";
        case DataType::map:     return "map";
    }
    return "unknown";
}

/// Parse a wire action name (exact match). nullopt if unrecognized.
auto action_type_from_string(std::string_view name) -> std::optional<ActionType>;

/// Parse a wire data type name (exact match). nullopt if unrecognized.
auto data_type_from_string(std::string_view name) -> std::optional<DataType>;

/// One mutation directive.
///
/// `value` is raw text: the literal for scalars, a nested JSON document
/// for `map` and `array`. Remove ignores `data_type` and `value`.
struct EventInstruction {
    std::string path;
    ActionType action = ActionType::set_or_add;
    DataType data_type = DataType::none;
    std::string value;

    auto operator==(const EventInstruction&) const -> bool = default;
};

/// A single business event, made of instructions applied in order.
struct DocumentEvent {
    std::string event_id;         ///< Opaque identifier, carried but not interpreted.
    std::uint64_t timestamp = 0;  ///< Microseconds since the Unix epoch.
    std::vector<EventInstruction> instructions;

    auto operator==(const DocumentEvent&) const -> bool = default;
};

}  // namespace eventsource_cpp
