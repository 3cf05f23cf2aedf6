/// @file json.hpp
/// @brief nlohmann/json interoperability for coedit-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the public types.
/// Wire objects use camelCase keys; EngineOptions uses the snake_case
/// keys of its field names.

#pragma once

#include <coedit-cpp/edit.hpp>
#include <coedit-cpp/error.hpp>
#include <coedit-cpp/event.hpp>
#include <coedit-cpp/options.hpp>
#include <coedit-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>

namespace coedit_cpp {

// -- Timestamps (milliseconds since the Unix epoch) ---------------------------

auto to_millis(Timestamp t) -> std::int64_t;
auto from_millis(std::int64_t millis) -> Timestamp;

// -- Enums (wire names) -------------------------------------------------------

void to_json(nlohmann::json& j, EditKind kind);
void from_json(const nlohmann::json& j, EditKind& kind);

void to_json(nlohmann::json& j, EventType type);
void from_json(const nlohmann::json& j, EventType& type);

void to_json(nlohmann::json& j, ErrorKind kind);
void from_json(const nlohmann::json& j, ErrorKind& kind);

// -- Participants and sessions ------------------------------------------------

void to_json(nlohmann::json& j, const CursorPosition& c);
void from_json(const nlohmann::json& j, CursorPosition& c);

void to_json(nlohmann::json& j, const SelectionRange& s);
void from_json(const nlohmann::json& j, SelectionRange& s);

void to_json(nlohmann::json& j, const User& u);
void from_json(const nlohmann::json& j, User& u);

void to_json(nlohmann::json& j, const SessionSettings& s);
void from_json(const nlohmann::json& j, SessionSettings& s);

void to_json(nlohmann::json& j, const Session& s);

// -- Edits ----------------------------------------------------------------------

/// Decoding accepts "baseVersion" (the lowest version the client has not
/// seen). When it is absent, "version" is read as the last version the
/// client has applied, as carried by the sync event, and the base version
/// becomes "version" + 1.
void to_json(nlohmann::json& j, const Edit& e);
void from_json(const nlohmann::json& j, Edit& e);

// -- Events -----------------------------------------------------------------------

void to_json(nlohmann::json& j, const LeaveNotice& n);
void to_json(nlohmann::json& j, const ChatMessage& m);
void to_json(nlohmann::json& j, const SyncRequest& s);
void to_json(nlohmann::json& j, const ErrorNotice& e);

/// `{"type", "userId", "sessionId", "data", "timestamp"}`.
void to_json(nlohmann::json& j, const SessionEvent& e);

// -- Configuration ----------------------------------------------------------------

/// Missing keys keep the defaults of EngineOptions{}.
void to_json(nlohmann::json& j, const EngineOptions& o);
void from_json(const nlohmann::json& j, EngineOptions& o);

}  // namespace coedit_cpp
