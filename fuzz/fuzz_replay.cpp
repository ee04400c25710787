// Fuzz target for load_document() + replay(): the full stack from wire
// form to replayed state, under both remove policies.

#include <eventsource-cpp/eventsource.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        const auto doc = eventsource_cpp::load_document(text);
        (void)eventsource_cpp::try_replay(doc);
        (void)eventsource_cpp::try_replay(doc, eventsource_cpp::ReplayConfig{false, true});
    } catch (const eventsource_cpp::Exception&) {
        // Rejected document.
    }
    return 0;
}
