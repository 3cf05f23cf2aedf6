/// @file edit.hpp
/// @brief Edit type: a single text operation submitted by a participant.

#pragma once

#include <coedit-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace coedit_cpp {

/// The kind of text mutation an edit represents.
enum class EditKind : std::uint8_t {
    insert,   ///< Insert content at position.
    del,      ///< Delete length bytes starting at position.
    replace,  ///< Delete length bytes at position, then insert content there.
};

/// Convert an EditKind to its string representation.
constexpr auto to_string_view(EditKind kind) noexcept -> std::string_view {
    switch (kind) {
        case EditKind::insert:  return "insert";
        case EditKind::del:     return "delete";
        case EditKind::replace: return "replace";
    }
    return "unknown";
}

/// A single edit against a session's document.
///
/// Positions and lengths are byte offsets into the UTF-8 document.
/// The caller fills kind, position, content/length, author_id and
/// base_version; id and version are assigned by the engine when the
/// edit is accepted. Accepted edits are immutable.
struct Edit {
    std::string id{};               ///< Assigned by the engine.
    EditKind kind{EditKind::insert};
    std::size_t position{0};
    std::string content{};          ///< Text inserted by insert/replace.
    std::size_t length{0};          ///< Bytes removed by del/replace.
    UserId author_id{};
    /// Lowest session version the author had not yet seen when the edit
    /// was produced. Every logged edit at or above it is concurrent.
    std::uint64_t base_version{0};
    std::uint64_t version{0};       ///< Assigned by the engine.

    /// Number of bytes this edit adds to the document.
    auto inserted_length() const -> std::size_t {
        return kind == EditKind::del ? 0 : content.size();
    }

    /// Number of bytes this edit removes from the document.
    auto removed_length() const -> std::size_t {
        return kind == EditKind::insert ? 0 : length;
    }

    auto operator==(const Edit&) const -> bool = default;
};

/// Create an insert edit.
inline auto make_insert(std::size_t position, std::string content,
                        UserId author, std::uint64_t base_version = 0) -> Edit {
    return Edit{
        .kind = EditKind::insert,
        .position = position,
        .content = std::move(content),
        .author_id = std::move(author),
        .base_version = base_version,
    };
}

/// Create a delete edit.
inline auto make_delete(std::size_t position, std::size_t length,
                        UserId author, std::uint64_t base_version = 0) -> Edit {
    return Edit{
        .kind = EditKind::del,
        .position = position,
        .length = length,
        .author_id = std::move(author),
        .base_version = base_version,
    };
}

/// Create a replace edit.
inline auto make_replace(std::size_t position, std::size_t length, std::string content,
                         UserId author, std::uint64_t base_version = 0) -> Edit {
    return Edit{
        .kind = EditKind::replace,
        .position = position,
        .content = std::move(content),
        .length = length,
        .author_id = std::move(author),
        .base_version = base_version,
    };
}

}  // namespace coedit_cpp
