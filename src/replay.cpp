#include <eventsource-cpp/replay.hpp>
#include <eventsource-cpp/applier.hpp>
#include <eventsource-cpp/json.hpp>

#include "logger.hpp"

#include <taskflow/taskflow.hpp>

#include <cstddef>
#include <utility>

namespace eventsource_cpp {

namespace {

// Shared by every replay_all() call; workers are started on first use and
// joined at exit.
auto batch_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // anonymous namespace

void apply_events(RootContainer& root, const Document& document, const ReplayConfig& config) {
    for (std::size_t e = 0; e < document.events.size(); ++e) {
        const auto& event = document.events[e];
        for (std::size_t i = 0; i < event.instructions.size(); ++i) {
            try {
                apply(root, event.instructions[i], config);
            } catch (const Exception& ex) {
                EVENTSOURCE_WARN("entity `{}`: event {} instruction {} ({} `{}`) failed: {}",
                                 document.entity_id, e, i,
                                 to_string_view(event.instructions[i].action),
                                 event.instructions[i].path, ex.what());
                throw;
            }
        }
    }
}

auto replay(const Document& document, const ReplayConfig& config) -> std::string {
    EVENTSOURCE_DEBUG("entity `{}`: replaying {} event(s)", document.entity_id, document.events.size());
    auto root = RootContainer{};
    try {
        root = parse(document.base_document);
    } catch (const Exception& e) {
        EVENTSOURCE_WARN("entity `{}`: base document rejected: {}", document.entity_id, e.what());
        throw;
    }
    apply_events(root, document, config);
    auto result = serialize(root);
    EVENTSOURCE_DEBUG("entity `{}`: replay produced {} byte(s)", document.entity_id, result.size());
    return result;
}

auto try_replay(const Document& document, const ReplayConfig& config) -> ReplayResult {
    try {
        return replay(document, config);
    } catch (const Exception& e) {
        return e.error();
    }
}

auto replay_all(std::span<const Document> documents, const ReplayConfig& config)
    -> std::vector<ReplayResult> {
    auto results = std::vector<ReplayResult>(documents.size());
    if (documents.empty()) return results;

    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, documents.size(), std::size_t{1},
        [&](std::size_t i) { results[i] = try_replay(documents[i], config); });
    batch_executor().run(taskflow).wait();
    return results;
}

// -- Document -----------------------------------------------------------------

auto Document::current_state(const ReplayConfig& config) const -> std::string {
    return replay(*this, config);
}

}  // namespace eventsource_cpp
