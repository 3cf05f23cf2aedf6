#pragma once

// Internal header — not installed.
// The library's spdlog logger. Embedders can register their own logger
// named "coedit" before the first engine is created to redirect output.

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace coedit_cpp::detail {

inline constexpr auto logger_name = "coedit";

inline auto logger() -> const std::shared_ptr<spdlog::logger>& {
    static const auto instance = [] {
        if (auto existing = spdlog::get(logger_name)) return existing;
        return spdlog::stdout_color_mt(logger_name);
    }();
    return instance;
}

// Unknown names fall back to "off" inside spdlog, so map them to info.
inline void set_log_level(std::string_view name) {
    auto level = spdlog::level::from_str(std::string{name});
    if (level == spdlog::level::off && name != "off") {
        level = spdlog::level::info;
    }
    logger()->set_level(level);
}

}  // namespace coedit_cpp::detail
