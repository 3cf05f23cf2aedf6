/// @file options.hpp
/// @brief Engine configuration.

#pragma once

#include <coedit-cpp/error.hpp>
#include <coedit-cpp/operation_log.hpp>
#include <coedit-cpp/types.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace coedit_cpp {

/// Tunables for a CollaborationEngine.
///
/// Every field has a working default, so `EngineOptions{}` is a valid
/// configuration. Options can also be read from JSON with from_json()
/// (see json.hpp) or from a file with load_options().
///
/// @code
/// {
///   "default_settings": {"max_members": 4, "allow_guests": false},
///   "log_capacity": 200,
///   "log_retain": 100,
///   "delivery_threads": 2,
///   "log_level": "debug"
/// }
/// @endcode
struct EngineOptions {
    /// Settings applied when create_session() is called without any.
    SessionSettings default_settings{};

    /// Pending-operation log bounds, per session. The log never holds more
    /// than log_capacity entries and trims to the newest log_retain
    /// (clamped to log_capacity) when it overflows.
    std::size_t log_capacity{OperationLog::default_capacity};
    std::size_t log_retain{OperationLog::default_retain};

    /// Events queued per connection before the oldest is dropped.
    std::size_t outbound_queue_capacity{256};

    /// Worker threads for event delivery. 0 = deliver inline on the
    /// calling thread (no executor).
    unsigned int delivery_threads{1};

    /// Member colors in allocation order. Empty = default_palette.
    std::vector<std::string> palette{};

    /// spdlog level name: trace, debug, info, warn, error, critical, off.
    std::string log_level{"info"};

    auto operator==(const EngineOptions&) const -> bool = default;
};

/// Read EngineOptions from a JSON file. Missing keys keep their defaults.
/// @return The options, or invalid_message if the file cannot be read or parsed.
auto load_options(const std::filesystem::path& path) -> Result<EngineOptions>;

}  // namespace coedit_cpp
