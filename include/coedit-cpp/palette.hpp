/// @file palette.hpp
/// @brief Participant color allocation.

#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace coedit_cpp {

/// The fixed palette colors are drawn from, in allocation order.
inline constexpr std::array<std::string_view, 10> default_palette = {
    "#FF6B6B", "#4ECDC4", "#45B7D1", "#F9CA24", "#6C5CE7",
    "#A8E6CF", "#FFD93D", "#FCB1A6", "#B2DFDB", "#D4A5A5",
};

/// Pick the color for the member joining at `index` (the session's
/// member count before the join). Round-robin over `palette`; falls back
/// to the default palette when `palette` is empty.
inline auto color_for_index(std::size_t index,
                            std::span<const std::string> palette) -> std::string {
    if (palette.empty()) {
        return std::string{default_palette[index % default_palette.size()]};
    }
    return palette[index % palette.size()];
}

}  // namespace coedit_cpp
