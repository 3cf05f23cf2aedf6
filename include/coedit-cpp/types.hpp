/// @file types.hpp
/// @brief Participant and session types: User, SessionSettings, Session.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace coedit_cpp {

/// Identifies an authenticated participant. Issued by the embedding system.
using UserId = std::string;

/// Identifies a collaboration session. Issued by the engine's IdGenerator.
using SessionId = std::string;

/// Wall-clock instant attached to sessions, events and chat messages.
using Timestamp = std::chrono::system_clock::time_point;

/// A participant's caret position in the editor.
struct CursorPosition {
    std::int64_t x{0};  ///< Column.
    std::int64_t y{0};  ///< Line.

    auto operator==(const CursorPosition&) const -> bool = default;
};

/// A participant's selected range, as byte offsets [start, end).
struct SelectionRange {
    std::size_t start{0};
    std::size_t end{0};

    auto operator==(const SelectionRange&) const -> bool = default;
};

/// A participant in a session.
///
/// Identity fields (id, display_name, email, avatar) come from the caller.
/// The color is assigned by the session when the user becomes a member;
/// cursor and selection are transient presence state, last write wins.
struct User {
    UserId id;
    std::string display_name;
    std::string email;
    std::optional<std::string> avatar{};
    std::string color{};
    std::optional<CursorPosition> cursor{};
    std::optional<SelectionRange> selection{};

    auto operator==(const User&) const -> bool = default;
};

/// Per-session limits and permissions.
struct SessionSettings {
    std::size_t max_members{10};
    bool allow_guests{true};
    bool read_only{false};
    /// Users allowed to join when allow_guests is false. The owner is
    /// always allowed.
    std::set<UserId> authorized_users{};

    auto operator==(const SessionSettings&) const -> bool = default;
};

/// A snapshot of one collaboration session.
///
/// Sessions handed out by the engine are copies; mutating one has no
/// effect on the engine's state.
struct Session {
    SessionId id;
    std::string document_id;
    std::map<UserId, User> members;
    UserId owner_id;
    Timestamp created_at{};
    SessionSettings settings{};

    auto has_member(const UserId& user_id) const -> bool {
        return members.contains(user_id);
    }

    auto operator==(const Session&) const -> bool = default;
};

}  // namespace coedit_cpp
