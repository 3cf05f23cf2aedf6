/// @file event.hpp
/// @brief SessionEvent: the unit handed to the transport for delivery.

#pragma once

#include <coedit-cpp/edit.hpp>
#include <coedit-cpp/error.hpp>
#include <coedit-cpp/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace coedit_cpp {

/// What happened in a session.
enum class EventType : std::uint8_t {
    join,               ///< A user joined. Payload: User.
    leave,              ///< A user left. Payload: LeaveNotice.
    cursor_moved,       ///< Payload: CursorPosition.
    selection_changed,  ///< Payload: SelectionRange.
    edit_applied,       ///< Payload: the transformed, versioned Edit.
    chat_message,       ///< Payload: ChatMessage.
    sync,               ///< Sent to a joiner only. Payload: SyncRequest.
    error,              ///< Sent to the originating connection only. Payload: ErrorNotice.
};

/// Convert an EventType to its wire name.
constexpr auto to_string_view(EventType type) noexcept -> std::string_view {
    switch (type) {
        case EventType::join:              return "join";
        case EventType::leave:             return "leave";
        case EventType::cursor_moved:      return "cursor";
        case EventType::selection_changed: return "selection";
        case EventType::edit_applied:      return "edit";
        case EventType::chat_message:      return "chat";
        case EventType::sync:              return "sync";
        case EventType::error:             return "error";
    }
    return "unknown";
}

/// Payload of a leave event.
struct LeaveNotice {
    UserId user_id;
    auto operator==(const LeaveNotice&) const -> bool = default;
};

/// A chat line relayed to the other members of a session.
struct ChatMessage {
    std::string id;
    UserId author_id;
    std::string author_name;
    std::optional<std::string> author_avatar{};
    std::string text;
    Timestamp timestamp{};
    auto operator==(const ChatMessage&) const -> bool = default;
};

/// The authoritative document state handed to a joining user.
struct SyncRequest {
    std::uint64_t version{0};  ///< Version of the latest applied edit (0 if none).
    std::string content;       ///< Document content at that version.
    auto operator==(const SyncRequest&) const -> bool = default;
};

/// Payload of an error event.
struct ErrorNotice {
    ErrorKind kind;
    std::string message;
    auto operator==(const ErrorNotice&) const -> bool = default;
};

/// Type-dependent event payload.
using EventPayload = std::variant<
    User,
    LeaveNotice,
    CursorPosition,
    SelectionRange,
    Edit,
    ChatMessage,
    SyncRequest,
    ErrorNotice
>;

/// One event emitted by a session, addressed by the dispatcher to members.
struct SessionEvent {
    EventType type;
    UserId author_id;
    SessionId session_id;
    EventPayload payload;
    Timestamp timestamp{};

    auto operator==(const SessionEvent&) const -> bool = default;
};

/// Helper for std::visit with multiple lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Edit& e) { ... },
///     [](const auto&) { ... },
/// }, event.payload);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

/// @cond DEDUCTION_GUIDE
template <typename... Ts>
overload(Ts...) -> overload<Ts...>;
/// @endcond

}  // namespace coedit_cpp
