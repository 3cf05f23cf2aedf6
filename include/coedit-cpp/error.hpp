/// @file error.hpp
/// @brief Error types for the coedit-cpp library.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace coedit_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    session_not_found,    ///< The session id is unknown or the session was destroyed.
    session_full,         ///< The session already holds max_members members.
    guest_not_allowed,    ///< Guests are disabled and the user is not pre-authorized.
    read_only_violation,  ///< A non-owner tried to edit a read-only session.
    invalid_message,      ///< A malformed inbound payload or edit.
    member_not_found,     ///< The user is not a member of the session.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::session_not_found:   return "session_not_found";
        case ErrorKind::session_full:        return "session_full";
        case ErrorKind::guest_not_allowed:   return "guest_not_allowed";
        case ErrorKind::read_only_violation: return "read_only_violation";
        case ErrorKind::invalid_message:     return "invalid_message";
        case ErrorKind::member_not_found:    return "member_not_found";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The value of a fallible operation, or the Error that prevented it.
template <typename T>
using Result = std::expected<T, Error>;

/// Outcome of a fallible operation with no value.
using Status = Result<void>;

/// Shorthand for returning an error from a function yielding Result<T>.
inline auto fail(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected<Error>{Error{kind, std::move(message)}};
}

}  // namespace coedit_cpp
