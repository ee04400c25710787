// basic_usage: demonstrates the core eventsource-cpp API
//
// Builds a document from a base snapshot and a few events, replays it,
// inspects the tree directly, and shows how failures and the remove
// policy surface.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <eventsource-cpp/eventsource.hpp>

#include <cstddef>
#include <cstdio>
#include <string>
#include <variant>
#include <vector>

namespace es = eventsource_cpp;

int main() {
    auto doc = es::Document{
        .entity_id = "hotel-42",
        .base_document = R"({"hotelName":"Grand","rooms":[{"number":101}]})",
    };

    // -- Events: instructions applied in order --------------------------------
    doc.events.push_back(es::DocumentEvent{.event_id = "renamed", .timestamp = 1, .instructions = {
        {"hotelName", es::ActionType::set_only, es::DataType::string, "Grand Plaza"},
        {"address.city", es::ActionType::set_or_add, es::DataType::string, "Lisbon"},
    }});
    doc.events.push_back(es::DocumentEvent{.event_id = "room-added", .timestamp = 2, .instructions = {
        {"rooms[new]", es::ActionType::set_or_add, es::DataType::map, R"({"number":102})"},
        {"rooms[first].refurbished", es::ActionType::set_or_add, es::DataType::boolean, "true"},
    }});

    // -- Replay -----------------------------------------------------------------
    auto state = doc.current_state();
    std::printf("Current state: %s\n", state.c_str());

    // -- Work with the tree directly ---------------------------------------------
    auto root = es::parse(state);
    auto& rooms = es::resolve("ROOMS", false, root.holder());
    std::printf("Rooms: %zu\n", rooms.size());
    if (const auto* city = root.holder().find("address")) {
        std::printf("Address: %s\n", es::serialize(*city).c_str());
    }

    // -- Failures are returned as data by try_replay ------------------------------
    doc.events.push_back(es::DocumentEvent{.event_id = "bad", .instructions = {
        {"manager.name", es::ActionType::set_only, es::DataType::string, "Ada"},
    }});
    auto result = es::try_replay(doc);
    if (const auto* error = std::get_if<es::Error>(&result)) {
        std::printf("Replay failed (%s): %s\n",
                    std::string{es::to_string_view(error->kind)}.c_str(), error->message.c_str());
    }

    // -- Remove policy ------------------------------------------------------------
    auto removal = es::Document{.base_document = R"({"a":1})"};
    removal.events.push_back(es::DocumentEvent{.instructions = {
        {.path = "b", .action = es::ActionType::remove},
    }});
    auto lenient = es::ReplayConfig{.remove_nonexistent_element_is_error = false};
    std::printf("Strict remove succeeded: %s\n", es::succeeded(es::try_replay(removal)) ? "yes" : "no");
    std::printf("Lenient remove result: %s\n", es::replay(removal, lenient).c_str());

    // -- Batch replay --------------------------------------------------------------
    auto batch = std::vector<es::Document>{doc, removal};
    auto results = es::replay_all(batch, lenient);
    for (std::size_t i = 0; i < results.size(); ++i) {
        std::printf("Batch[%zu]: %s\n", i, es::succeeded(results[i]) ? "ok" : "failed");
    }

    std::printf("Done.\n");
    return 0;
}
