#include <eventsource-cpp/event.hpp>

#include <array>

namespace eventsource_cpp {

namespace {

constexpr auto action_types = std::array{
    ActionType::set_or_add, ActionType::add_only, ActionType::set_only, ActionType::remove,
};

constexpr auto data_types = std::array{
    DataType::none, DataType::string, DataType::number, DataType::boolean,
    DataType::null, DataType::array, DataType::map,
};

}  // anonymous namespace

auto action_type_from_string(std::string_view name) -> std::optional<ActionType> {
    for (auto type : action_types) {
        if (to_string_view(type) == name) return type;
    }
    return std::nullopt;
}

auto data_type_from_string(std::string_view name) -> std::optional<DataType> {
    for (auto type : data_types) {
        if (to_string_view(type) == name) return type;
    }
    return std::nullopt;
}

}  // namespace eventsource_cpp
