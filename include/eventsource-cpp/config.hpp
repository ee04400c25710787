/// @file config.hpp
/// @brief Per-call replay configuration.

#pragma once

namespace eventsource_cpp {

/// Policy for remove instructions whose target does not exist.
///
/// Passed by value into every replay; nothing is stored globally, so
/// independent replays with different policies can run concurrently.
struct ReplayConfig {
    /// Fail when the property (or its parent path) to remove is missing.
    bool remove_nonexistent_element_is_error = true;
    /// Fail when `[first]`/`[last]` is removed from an empty array.
    bool remove_nonexistent_array_element_is_error = false;

    auto operator==(const ReplayConfig&) const -> bool = default;
};

}  // namespace eventsource_cpp
