// Fuzz target for parse(): exercises the SAX tree builder and serializer.
// Any accepted document must serialize, and re-parsing that output must
// reproduce it exactly.

#include <eventsource-cpp/eventsource.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        const auto root = eventsource_cpp::parse(text);
        const auto once = eventsource_cpp::serialize(root);
        const auto twice = eventsource_cpp::serialize(eventsource_cpp::parse(once));
        if (once != twice) std::abort();
    } catch (const eventsource_cpp::Exception&) {
        // Rejected input.
    }
    return 0;
}
