// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, only a corpus generator.

#include <eventsource-cpp/eventsource.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    using namespace eventsource_cpp;

    const auto parse_dir = std::string{"fuzz/corpus/parse"};
    const auto path_dir = std::string{"fuzz/corpus/path"};
    const auto replay_dir = std::string{"fuzz/corpus/replay"};
    for (const auto& dir : {parse_dir, path_dir, replay_dir}) {
        fs::create_directories(dir);
    }

    // Parser seeds: one per node kind, plus nesting and escapes.
    write_seed(parse_dir + "/seed_empty_object.json", "{}");
    write_seed(parse_dir + "/seed_array_root.json", R"([1,"two",true,null,{"x":[]}])");
    write_seed(parse_dir + "/seed_numbers.json", R"({"i":-7,"f":1.50,"e":2E-2})");
    write_seed(parse_dir + "/seed_escapes.json", R"({"s":"a\"b\\cé\n"})");
    write_seed(parse_dir + "/seed_nested.json", R"({"a":{"b":{"c":[[{"d":null}]]}}})");

    // Path seeds: every indexer form.
    write_seed(path_dir + "/seed_dotted.txt", "a.b.c");
    write_seed(path_dir + "/seed_first.txt", "a.b[first].c");
    write_seed(path_dir + "/seed_new.txt", "list[new][new]");
    write_seed(path_dir + "/seed_root_array.txt", "[new].id");
    write_seed(path_dir + "/seed_other.txt", "a[id=1]");

    // Replay seeds: wire-form documents with events of every action.
    {
        auto doc = Document{.entity_id = "seed", .base_document = R"({"a":{"b":1,"c":[]}})"};
        doc.events.push_back(DocumentEvent{.event_id = "1", .timestamp = 1, .instructions = {
            {"a.b", ActionType::set_only, DataType::number, "2"},
            {"a.c[new]", ActionType::set_or_add, DataType::map, R"({"id":0})"},
            {"a.d", ActionType::set_or_add, DataType::boolean, "true"},
        }});
        doc.events.push_back(DocumentEvent{.event_id = "2", .timestamp = 2, .instructions = {
            {.path = "a.c[first]", .action = ActionType::remove},
            {.path = "a.b", .action = ActionType::remove},
        }});
        write_seed(replay_dir + "/seed_all_actions.json", nlohmann::json(doc).dump());
    }
    {
        auto doc = Document{.base_document = "{}"};
        doc.events.push_back(DocumentEvent{.instructions = {
            {"", ActionType::set_or_add, DataType::array, R"(["x","y"])"},
        }});
        write_seed(replay_dir + "/seed_replace.json", nlohmann::json(doc).dump());
    }

    return 0;
}
