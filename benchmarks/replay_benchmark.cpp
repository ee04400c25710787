// eventsource-cpp benchmarks: throughput of parsing, path resolution and replay.

#include <eventsource-cpp/eventsource.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace eventsource_cpp;

// A flat object with `n` string members and an array of `n` small objects.
static auto make_base(std::int64_t n) -> std::string {
    auto w = JsonWriter{};
    w.begin_object();
    for (std::int64_t i = 0; i < n; ++i) {
        w.key("field" + std::to_string(i));
        w.string("value-" + std::to_string(i));
    }
    w.key("items");
    w.begin_array();
    for (std::int64_t i = 0; i < n; ++i) {
        w.begin_object();
        w.key("id");
        w.literal(std::to_string(i));
        w.key("name");
        w.string("item-" + std::to_string(i));
        w.end_object();
    }
    w.end_array();
    w.end_object();
    return w.take();
}

// `n` events touching existing fields, new nested fields and the array.
static auto make_document(std::int64_t n) -> Document {
    auto doc = Document{.entity_id = "bench", .base_document = make_base(n)};
    for (std::int64_t i = 0; i < n; ++i) {
        const auto s = std::to_string(i);
        doc.events.push_back(DocumentEvent{.event_id = s, .instructions = {
            {"field" + s, ActionType::set_only, DataType::string, "updated-" + s},
            {"nested.level" + s + ".value", ActionType::set_or_add, DataType::number, s},
            {"items[new]", ActionType::set_or_add, DataType::map, R"({"id":)" + s + "}"},
            {.path = "items[first]", .action = ActionType::remove},
        }});
    }
    return doc;
}

// =============================================================================
// Parse / Serialize
// =============================================================================

static void bm_parse(benchmark::State& state) {
    const auto text = make_base(state.range(0));
    for (auto _ : state) {
        auto root = parse(text);
        benchmark::DoNotOptimize(root);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse)->Range(8, 4096);

static void bm_serialize(benchmark::State& state) {
    const auto root = parse(make_base(state.range(0)));
    for (auto _ : state) {
        auto text = serialize(root);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_serialize)->Range(8, 4096);

// =============================================================================
// Path resolution
// =============================================================================

static void bm_parse_path(benchmark::State& state) {
    for (auto _ : state) {
        auto path = parse_path("orders[first].lines[new].product.sku");
        benchmark::DoNotOptimize(path);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_path);

// Case-insensitive lookup is a linear scan; measure it against member count.
static void bm_resolve_wide_object(benchmark::State& state) {
    const auto n = state.range(0);
    auto root = parse(make_base(n));
    const auto path = parse_path("FIELD" + std::to_string(n - 1));
    for (auto _ : state) {
        auto& node = resolve(path, false, root.holder());
        benchmark::DoNotOptimize(node);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_resolve_wide_object)->Range(8, 4096);

// =============================================================================
// Replay
// =============================================================================

static void bm_replay(benchmark::State& state) {
    const auto doc = make_document(state.range(0));
    for (auto _ : state) {
        auto out = replay(doc);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * doc.events.size()));
}
BENCHMARK(bm_replay)->Range(8, 512);

static void bm_replay_all(benchmark::State& state) {
    const auto documents = std::vector<Document>(static_cast<std::size_t>(state.range(0)), make_document(64));
    for (auto _ : state) {
        auto results = replay_all(documents);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * documents.size()));
}
BENCHMARK(bm_replay_all)->Range(1, 256)->UseRealTime();

static void bm_load_document(benchmark::State& state) {
    const auto text = nlohmann::json(make_document(state.range(0))).dump();
    for (auto _ : state) {
        auto doc = load_document(text);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_load_document)->Range(8, 512);
