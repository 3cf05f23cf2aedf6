/// @file protocol.hpp
/// @brief Client wire protocol: inbound frame decoding, outbound encoding.

#pragma once

#include <coedit-cpp/edit.hpp>
#include <coedit-cpp/error.hpp>
#include <coedit-cpp/event.hpp>
#include <coedit-cpp/types.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace coedit_cpp {

/// `{"type":"join","sessionId":..,"user":{..}}`
struct JoinRequest {
    SessionId session_id;
    User user;
    auto operator==(const JoinRequest&) const -> bool = default;
};

/// `{"type":"leave","sessionId":..}`
struct LeaveRequest {
    SessionId session_id;
    auto operator==(const LeaveRequest&) const -> bool = default;
};

/// `{"type":"cursor","sessionId":..,"cursor":{"x":..,"y":..}}`
struct CursorUpdate {
    SessionId session_id;
    CursorPosition cursor;
    auto operator==(const CursorUpdate&) const -> bool = default;
};

/// `{"type":"selection","sessionId":..,"selection":{"start":..,"end":..}}`
struct SelectionUpdate {
    SessionId session_id;
    SelectionRange selection;
    auto operator==(const SelectionUpdate&) const -> bool = default;
};

/// `{"type":"edit","sessionId":..,"edit":{"operation":..,"position":..,..}}`
struct EditRequest {
    SessionId session_id;
    Edit edit;
    auto operator==(const EditRequest&) const -> bool = default;
};

/// `{"type":"chat","sessionId":..,"message":".."}`
struct ChatRequest {
    SessionId session_id;
    std::string text;
    auto operator==(const ChatRequest&) const -> bool = default;
};

/// Any frame a client may send.
using ClientMessage = std::variant<
    JoinRequest,
    LeaveRequest,
    CursorUpdate,
    SelectionUpdate,
    EditRequest,
    ChatRequest
>;

/// Decode one inbound text frame.
/// @return The message, or invalid_message if the frame is not valid JSON,
///   has an unknown type, or is missing required fields.
auto decode_client_message(std::string_view frame) -> Result<ClientMessage>;

/// Encode an outbound event as a JSON text frame.
auto encode_event(const SessionEvent& event) -> std::string;

}  // namespace coedit_cpp
