// replay_file: replays a document stored in wire form and prints its state
//
// Usage: replay_file <document.json> [config.json] [--verbose]
//
// The document file holds {"EntityId", "BaseDocument", "Events"}; the
// optional config file holds the remove policy flags. The replayed state is
// written to stdout; errors go to stderr with a non-zero exit code.
//
// Build: cmake --build build
// Run:   ./build/examples/replay_file doc.json

#include <eventsource-cpp/eventsource.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace es = eventsource_cpp;

static auto read_file(const std::string& path) -> std::optional<std::string> {
    auto ifs = std::ifstream{path, std::ios::binary};
    if (!ifs) return std::nullopt;
    return std::string{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};
}

int main(int argc, char** argv) {
    auto files = std::vector<std::string>{};
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--verbose") {
            es::set_log_level(es::LogLevel::debug);
        } else {
            files.emplace_back(arg);
        }
    }
    if (files.empty() || files.size() > 2) {
        std::fprintf(stderr, "usage: %s <document.json> [config.json] [--verbose]\n", argv[0]);
        return 2;
    }

    auto document_text = read_file(files[0]);
    if (!document_text) {
        std::fprintf(stderr, "cannot read %s\n", files[0].c_str());
        return 1;
    }

    try {
        auto config = es::ReplayConfig{};
        if (files.size() == 2) {
            auto config_text = read_file(files[1]);
            if (!config_text) {
                std::fprintf(stderr, "cannot read %s\n", files[1].c_str());
                return 1;
            }
            config = es::load_config(*config_text);
        }

        auto document = es::load_document(*document_text);
        std::printf("%s\n", es::replay(document, config).c_str());
    } catch (const es::Exception& e) {
        std::fprintf(stderr, "%s: %s\n", std::string{es::to_string_view(e.kind())}.c_str(), e.what());
        return 1;
    }
    return 0;
}
