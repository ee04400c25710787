#include <eventsource-cpp/applier.hpp>
#include <eventsource-cpp/error.hpp>
#include <eventsource-cpp/json.hpp>
#include <eventsource-cpp/path.hpp>

#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>

namespace eventsource_cpp {

namespace {

auto parse_container(std::string_view value, NodeKind expected) -> ValueNode {
    auto node = parse_value(value);
    if (node.kind() != expected) {
        throw Exception{ErrorKind::parse_error,
            std::string{"instruction value must be a JSON "} + std::string{to_string_view(expected)} +
            ", got " + std::string{to_string_view(node.kind())}};
    }
    return node;
}

auto is_json_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// A bare JSON number: stored verbatim, so surrounding whitespace is refused.
auto is_number_literal(std::string_view value) -> bool {
    if (value.empty() || is_json_space(value.front()) || is_json_space(value.back())) return false;
    auto j = nlohmann::json::parse(value, nullptr, false);
    return !j.is_discarded() && j.is_number();
}

void replace_document(RootContainer& root, const EventInstruction& instruction) {
    if (!root.holder().empty()) {
        throw Exception{ErrorKind::non_empty_replace,
            "invalid instruction - can't replace non-empty base document"};
    }
    try {
        auto replacement = parse(instruction.value);
        root = std::move(replacement);
    } catch (const Exception& e) {
        throw Exception{e.kind(), "invalid instruction - new base document is not valid: " + e.error().message};
    }
}

// Parse the instruction path. On an array document every path must start
// with an indexer on the unnamed array; anything else would address the
// synthetic holder object.
auto target_path(const RootContainer& root, const EventInstruction& instruction) -> Path {
    auto path = parse_path(instruction.path);
    if (root.is_array()) {
        const auto& head = path.front();
        if (!head.name.empty() || head.indexers.empty()) {
            throw Exception{ErrorKind::type_mismatch,
                "`" + instruction.path + "` does not address an element of the array document"};
        }
    }
    return path;
}

void remove_element(RootContainer& root, Path parent_path, const EventInstruction& instruction,
                    const ReplayConfig& config) {
    // Strip the last indexer (keeping the array's own name), or else the
    // last property name.
    auto indexer = std::optional<Indexer>{};
    auto name = std::string{};
    if (!parent_path.back().indexers.empty()) {
        indexer = std::move(parent_path.back().indexers.back());
        parent_path.back().indexers.pop_back();
    } else {
        name = std::move(parent_path.back().name);
        parent_path.pop_back();
    }

    ValueNode* parent = nullptr;
    try {
        parent = &resolve(parent_path, false, root.holder());
    } catch (const Exception& e) {
        if (config.remove_nonexistent_element_is_error) throw;
        EVENTSOURCE_DEBUG("remove `{}`: parent not found, ignored ({})", instruction.path, e.what());
        return;
    }

    if (indexer) {
        if (!parent->is_array()) {
            throw Exception{ErrorKind::type_mismatch,
                "`" + to_string(parent_path) + "` is not an array, cannot remove `[" + indexer->token + "]`"};
        }
        auto& elements = parent->elements();
        switch (indexer->kind) {
            case IndexerKind::all:
                elements.clear();
                return;
            case IndexerKind::first:
            case IndexerKind::last:
                if (elements.empty()) {
                    if (config.remove_nonexistent_array_element_is_error) {
                        throw Exception{ErrorKind::empty_array,
                            "attempt to remove array element failed, array was empty"};
                    }
                    EVENTSOURCE_DEBUG("remove `{}`: array is empty, ignored", instruction.path);
                    return;
                }
                if (indexer->kind == IndexerKind::first) {
                    elements.erase(elements.begin());
                } else {
                    elements.pop_back();
                }
                return;
            default:
                throw Exception{ErrorKind::unsupported_indexer,
                    "`" + indexer->token + "` is not a supported array index for the remove action"};
        }
    }

    if (parent->erase(name)) return;
    if (config.remove_nonexistent_element_is_error) {
        throw Exception{ErrorKind::path_not_found,
            "element `" + name + "` not found when trying to remove it"};
    }
    EVENTSOURCE_DEBUG("remove `{}`: element not found, ignored", instruction.path);
}

}  // anonymous namespace

void set_value(ValueNode& node, DataType type, std::string_view value) {
    switch (type) {
        case DataType::string:
            node.assign(NodeKind::string, std::string{value});
            return;
        case DataType::number:
            if (!is_number_literal(value)) {
                throw Exception{ErrorKind::invalid_value,
                    "`" + std::string{value} + "` is not a valid number"};
            }
            node.assign(NodeKind::number, std::string{value});
            return;
        case DataType::boolean:
            if (value != "true" && value != "false") {
                throw Exception{ErrorKind::invalid_value,
                    "`" + std::string{value} + "` is not a valid bool"};
            }
            node.assign(NodeKind::boolean, std::string{value});
            return;
        case DataType::null:
            node.reset(NodeKind::null);
            return;
        case DataType::map:
            node = parse_container(value, NodeKind::object);
            return;
        case DataType::array:
            node = parse_container(value, NodeKind::array);
            return;
        case DataType::none:
            throw Exception{ErrorKind::invalid_value, "a data type is required to set a value"};
    }
    throw Exception{ErrorKind::unknown_data_type,
        "unexpected data type " + std::to_string(static_cast<int>(type))};
}

void apply(RootContainer& root, const EventInstruction& instruction, const ReplayConfig& config) {
    EVENTSOURCE_TRACE("apply {} `{}` ({})", to_string_view(instruction.action),
                      instruction.path, to_string_view(instruction.data_type));

    if (instruction.path.empty() &&
        (instruction.data_type == DataType::map || instruction.data_type == DataType::array) &&
        instruction.action != ActionType::remove) {
        replace_document(root, instruction);
        return;
    }

    switch (instruction.action) {
        case ActionType::set_or_add:
            set_value(resolve(target_path(root, instruction), true, root.holder()),
                      instruction.data_type, instruction.value);
            return;
        case ActionType::set_only:
            set_value(resolve(target_path(root, instruction), false, root.holder()),
                      instruction.data_type, instruction.value);
            return;
        case ActionType::add_only:
            throw Exception{ErrorKind::not_implemented, "addOnly not implemented"};
        case ActionType::remove:
            remove_element(root, target_path(root, instruction), instruction, config);
            return;
    }
    throw Exception{ErrorKind::unknown_action_type,
        "unexpected instruction action type " + std::to_string(static_cast<int>(instruction.action))};
}

}  // namespace eventsource_cpp
