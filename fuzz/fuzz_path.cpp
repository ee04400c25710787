// Fuzz target for parse_path() and resolve() with creation enabled.

#include <eventsource-cpp/eventsource.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        const auto path = eventsource_cpp::parse_path(text);
        // Printing a parsed path must give back the input.
        if (eventsource_cpp::to_string(path) != text) std::abort();

        auto root = eventsource_cpp::parse(R"({"a":{"b":[{"c":1}]},"n":null,"s":"x"})");
        (void)eventsource_cpp::resolve(path, true, root.holder());
        (void)eventsource_cpp::serialize(root);
    } catch (const eventsource_cpp::Exception&) {
        // Rejected path.
    }
    return 0;
}
