/// @file engine.hpp
/// @brief CollaborationEngine -- the primary API for coedit-cpp.

#pragma once

#include <coedit-cpp/dispatcher.hpp>
#include <coedit-cpp/edit.hpp>
#include <coedit-cpp/error.hpp>
#include <coedit-cpp/event.hpp>
#include <coedit-cpp/options.hpp>
#include <coedit-cpp/transport.hpp>
#include <coedit-cpp/types.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace coedit_cpp {

namespace detail {
struct SessionState;
struct LockedSession;
}  // namespace detail

/// Hosts collaborative editing sessions for one authoritative process.
///
/// The engine owns the session registry, each session's pending-operation
/// log and document content, and the dispatcher that fans events out to
/// connected users. Every mutating call on a session runs under that
/// session's lock, so edits are versioned in a single total order per
/// session. Calls on different sessions run in parallel.
///
/// Read accessors return snapshots by value and are safe from any thread.
///
/// @code
/// auto engine = CollaborationEngine{};
/// engine.connect("alice", alice_transport);
/// auto session = engine.create_session("component-42", alice);
/// engine.connect("bob", bob_transport);
/// engine.join_session(session.id, bob);
/// auto applied = engine.apply_edit(session.id, make_insert(0, "hello", "alice"));
/// @endcode
class CollaborationEngine {
public:
    /// Construct with random UUID session ids and default options.
    CollaborationEngine();

    /// Construct with random UUID session ids.
    explicit CollaborationEngine(EngineOptions options);

    /// Construct with an explicit id generator.
    /// @param ids Source of session, edit and chat message ids. Must not be null.
    CollaborationEngine(std::shared_ptr<IdGenerator> ids, EngineOptions options);

    /// Runs close().
    ~CollaborationEngine();

    CollaborationEngine(const CollaborationEngine&) = delete;
    auto operator=(const CollaborationEngine&) -> CollaborationEngine& = delete;
    CollaborationEngine(CollaborationEngine&&) = delete;
    auto operator=(CollaborationEngine&&) -> CollaborationEngine& = delete;

    // -- Connections ----------------------------------------------------------

    /// Register the transport that receives events addressed to `user_id`.
    void connect(const UserId& user_id, std::shared_ptr<Transport> transport);

    /// Unregister the user's transport and leave every session the user
    /// belongs to. Call this when the user's connection closes.
    void disconnect(const UserId& user_id);

    /// Decode and execute one inbound JSON frame from `user_id`.
    ///
    /// The connection's user id is authoritative: ids carried in the frame
    /// are ignored. On failure the error is also delivered to `user_id`
    /// alone as an error event.
    auto handle_message(const UserId& user_id, std::string_view frame) -> Status;

    // -- Session registry -----------------------------------------------------

    /// Create a session with `owner` as its only member.
    /// @param settings Overrides EngineOptions::default_settings when given.
    /// @param initial_content Document content at version 0.
    auto create_session(std::string document_id, User owner,
                        std::optional<SessionSettings> settings = std::nullopt,
                        std::string initial_content = {}) -> Session;

    /// Add `user` to a session and assign its color.
    ///
    /// Existing members receive a join event; the joiner receives a sync
    /// event carrying the current document and version. Joining again
    /// while already a member refreshes the profile and re-sends the sync.
    /// @return The session after the join, or session_not_found,
    ///   session_full, guest_not_allowed.
    auto join_session(const SessionId& session_id, User user) -> Result<Session>;

    /// Remove a member. Destroys the session when it becomes empty.
    /// Unknown sessions and non-members are ignored.
    void leave_session(const SessionId& session_id, const UserId& user_id);

    // -- Presence -------------------------------------------------------------

    /// Record a member's cursor and tell the other members.
    auto update_cursor(const SessionId& session_id, const UserId& user_id,
                       CursorPosition cursor) -> Status;

    /// Record a member's selection and tell the other members.
    auto update_selection(const SessionId& session_id, const UserId& user_id,
                          SelectionRange selection) -> Status;

    // -- Editing --------------------------------------------------------------

    /// Transform an edit against every logged edit at or above its
    /// base_version, assign it the next version, apply it to the session
    /// document and broadcast it to the other members.
    ///
    /// The caller's id and version fields are ignored.
    /// @return The edit as applied, or session_not_found, member_not_found,
    ///   read_only_violation, invalid_message.
    auto apply_edit(const SessionId& session_id, Edit edit) -> Result<Edit>;

    // -- Chat -----------------------------------------------------------------

    /// Relay a chat line to every member except the author.
    auto send_chat_message(const SessionId& session_id, const UserId& author_id,
                           std::string text) -> Result<ChatMessage>;

    // -- Reading --------------------------------------------------------------

    /// Snapshot of a session, or nullopt if it does not exist.
    auto get_session(const SessionId& session_id) const -> std::optional<Session>;

    /// Members of a session ordered by user id. Empty if the session does
    /// not exist.
    auto get_active_members(const SessionId& session_id) const -> std::vector<User>;

    /// Snapshots of every session `user_id` belongs to.
    auto get_user_sessions(const UserId& user_id) const -> std::vector<Session>;

    /// Current document content and version of a session.
    auto get_document(const SessionId& session_id) const -> std::optional<SyncRequest>;

    /// Number of live sessions.
    auto session_count() const -> std::size_t;

    // -- Lifecycle ------------------------------------------------------------

    /// Deliver queued events, then destroy every session. Later calls see
    /// no sessions. Idempotent.
    void close();

    /// Block until queued events have been handed to their transports.
    void flush();

    auto options() const -> const EngineOptions& { return options_; }

private:
    auto find_session(const SessionId& session_id) const
        -> std::shared_ptr<detail::SessionState>;

    /// Look up a live session and lock it.
    auto acquire(const SessionId& session_id) const -> Result<detail::LockedSession>;

    /// Like acquire(), and also require `user_id` to be a member.
    auto acquire_member(const SessionId& session_id, const UserId& user_id) const
        -> Result<detail::LockedSession>;

    void send_error(const UserId& user_id, const SessionId& session_id, const Error& error);

    EngineOptions options_;
    std::shared_ptr<IdGenerator> ids_;
    Dispatcher dispatcher_;

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<SessionId, std::shared_ptr<detail::SessionState>> sessions_;
    std::unordered_map<UserId, std::set<SessionId>> user_sessions_;
};

}  // namespace coedit_cpp
