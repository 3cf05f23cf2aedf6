#include <coedit-cpp/engine.hpp>
#include <coedit-cpp/palette.hpp>
#include <coedit-cpp/transform.hpp>

#include "logging.hpp"
#include "session_state.hpp"
#include "text_buffer.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <utility>

namespace coedit_cpp {

namespace {

auto make_event(EventType type, UserId author, SessionId session,
                EventPayload payload) -> SessionEvent {
    return SessionEvent{
        .type = type,
        .author_id = std::move(author),
        .session_id = std::move(session),
        .payload = std::move(payload),
        .timestamp = std::chrono::system_clock::now(),
    };
}

auto validate(const Edit& edit) -> Status {
    switch (edit.kind) {
        case EditKind::insert:
            if (edit.content.empty()) {
                return fail(ErrorKind::invalid_message, "insert without content");
            }
            break;
        case EditKind::del:
            if (edit.length == 0) {
                return fail(ErrorKind::invalid_message, "delete without length");
            }
            break;
        case EditKind::replace:
            if (edit.length == 0 && edit.content.empty()) {
                return fail(ErrorKind::invalid_message, "replace without content or length");
            }
            break;
    }
    return {};
}

}  // anonymous namespace

CollaborationEngine::CollaborationEngine()
    : CollaborationEngine{EngineOptions{}} {}

CollaborationEngine::CollaborationEngine(EngineOptions options)
    : CollaborationEngine{std::make_shared<UuidGenerator>(), std::move(options)} {}

CollaborationEngine::CollaborationEngine(std::shared_ptr<IdGenerator> ids, EngineOptions options)
    : options_{std::move(options)},
      ids_{ids ? std::move(ids) : std::make_shared<UuidGenerator>()},
      dispatcher_{options_.outbound_queue_capacity, options_.delivery_threads} {
    detail::set_log_level(options_.log_level);
}

CollaborationEngine::~CollaborationEngine() {
    close();
}

// -- Connections ----------------------------------------------------------------

void CollaborationEngine::connect(const UserId& user_id, std::shared_ptr<Transport> transport) {
    dispatcher_.connect(user_id, std::move(transport));
}

void CollaborationEngine::disconnect(const UserId& user_id) {
    dispatcher_.disconnect(user_id);

    auto session_ids = std::set<SessionId>{};
    {
        auto lock = std::shared_lock{registry_mutex_};
        if (auto it = user_sessions_.find(user_id); it != user_sessions_.end()) {
            session_ids = it->second;
        }
    }
    for (const auto& session_id : session_ids) {
        leave_session(session_id, user_id);
    }
    detail::logger()->info("user disconnected: user={} sessions_left={}",
                           user_id, session_ids.size());
}

// -- Lookup ---------------------------------------------------------------------

auto CollaborationEngine::find_session(const SessionId& session_id) const
    -> std::shared_ptr<detail::SessionState> {
    auto lock = std::shared_lock{registry_mutex_};
    auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second : nullptr;
}

auto CollaborationEngine::acquire(const SessionId& session_id) const
    -> Result<detail::LockedSession> {
    auto state = find_session(session_id);
    if (!state) {
        return fail(ErrorKind::session_not_found, "session not found: " + session_id);
    }
    auto lock = std::unique_lock{state->mutex};
    // The last member may have left between the lookup and the lock.
    if (state->destroyed) {
        return fail(ErrorKind::session_not_found, "session not found: " + session_id);
    }
    return detail::LockedSession{std::move(state), std::move(lock)};
}

auto CollaborationEngine::acquire_member(const SessionId& session_id, const UserId& user_id) const
    -> Result<detail::LockedSession> {
    auto locked = acquire(session_id);
    if (!locked) return locked;
    if (!(*locked)->session.has_member(user_id)) {
        return fail(ErrorKind::member_not_found,
                    "user " + user_id + " is not a member of session " + session_id);
    }
    return locked;
}

// -- Session registry -----------------------------------------------------------

auto CollaborationEngine::create_session(std::string document_id, User owner,
                                         std::optional<SessionSettings> settings,
                                         std::string initial_content) -> Session {
    auto state = std::make_shared<detail::SessionState>(options_.log_capacity,
                                                        options_.log_retain);
    auto session_id = ids_->next_id();
    const auto owner_id = owner.id;

    owner.color = color_for_index(0, options_.palette);
    owner.cursor.reset();
    owner.selection.reset();

    state->session = Session{
        .id = session_id,
        .document_id = std::move(document_id),
        .members = {},
        .owner_id = owner_id,
        .created_at = std::chrono::system_clock::now(),
        .settings = settings.value_or(options_.default_settings),
    };
    // The owner always occupies one seat.
    auto& max_members = state->session.settings.max_members;
    max_members = std::max<std::size_t>(max_members, 1);
    state->session.members.emplace(owner_id, std::move(owner));
    state->document.content = std::move(initial_content);
    auto snapshot = state->session;

    {
        auto lock = std::unique_lock{registry_mutex_};
        sessions_.emplace(session_id, std::move(state));
        user_sessions_[owner_id].insert(session_id);
    }

    detail::logger()->info("session created: session={} document={} owner={}",
                           session_id, snapshot.document_id, owner_id);
    return snapshot;
}

auto CollaborationEngine::join_session(const SessionId& session_id, User user) -> Result<Session> {
    auto locked = acquire(session_id);
    if (!locked) return std::unexpected{locked.error()};
    auto& state = *locked->state;
    auto& session = state.session;

    if (auto it = session.members.find(user.id); it != session.members.end()) {
        it->second.display_name = std::move(user.display_name);
        it->second.email = std::move(user.email);
        it->second.avatar = std::move(user.avatar);
        dispatcher_.send(it->first, make_event(EventType::sync, it->first, session_id,
                                               state.sync_request()));
        detail::logger()->debug("member rejoined: session={} user={}", session_id, it->first);
        return session;
    }

    if (session.members.size() >= session.settings.max_members) {
        return fail(ErrorKind::session_full, "session is full: " + session_id);
    }
    if (!session.settings.allow_guests && !state.is_authorized(user.id)) {
        return fail(ErrorKind::guest_not_allowed,
                    "guests are not allowed in session " + session_id);
    }

    user.color = color_for_index(session.members.size(), options_.palette);
    user.cursor.reset();
    user.selection.reset();

    const auto user_id = user.id;
    auto join_event = make_event(EventType::join, user_id, session_id, user);
    session.members.emplace(user_id, std::move(user));

    {
        auto lock = std::unique_lock{registry_mutex_};
        user_sessions_[user_id].insert(session_id);
    }

    const auto recipients = state.member_ids();
    dispatcher_.broadcast(recipients, join_event, user_id);
    dispatcher_.send(user_id, make_event(EventType::sync, user_id, session_id,
                                         state.sync_request()));

    detail::logger()->info("user joined session: session={} user={} members={}",
                           session_id, user_id, session.members.size());
    return session;
}

void CollaborationEngine::leave_session(const SessionId& session_id, const UserId& user_id) {
    auto locked = acquire(session_id);
    if (!locked) return;
    auto& state = *locked->state;
    auto& members = state.session.members;

    auto it = members.find(user_id);
    if (it == members.end()) return;
    members.erase(it);

    const auto now_empty = members.empty();
    {
        auto lock = std::unique_lock{registry_mutex_};
        if (auto us = user_sessions_.find(user_id); us != user_sessions_.end()) {
            us->second.erase(session_id);
            if (us->second.empty()) user_sessions_.erase(us);
        }
        if (now_empty) sessions_.erase(session_id);
    }

    if (now_empty) {
        state.destroyed = true;
        detail::logger()->info("session ended (no members): session={} version={}",
                               session_id, state.version);
        return;
    }

    const auto recipients = state.member_ids();
    dispatcher_.broadcast(recipients, make_event(EventType::leave, user_id, session_id,
                                                 LeaveNotice{.user_id = user_id}));
    detail::logger()->info("user left session: session={} user={} members={}",
                           session_id, user_id, members.size());
}

// -- Presence -------------------------------------------------------------------

auto CollaborationEngine::update_cursor(const SessionId& session_id, const UserId& user_id,
                                        CursorPosition cursor) -> Status {
    auto locked = acquire_member(session_id, user_id);
    if (!locked) return std::unexpected{locked.error()};
    auto& state = *locked->state;

    state.session.members.at(user_id).cursor = cursor;
    dispatcher_.broadcast(state.member_ids(),
                          make_event(EventType::cursor_moved, user_id, session_id, cursor),
                          user_id);
    return {};
}

auto CollaborationEngine::update_selection(const SessionId& session_id, const UserId& user_id,
                                           SelectionRange selection) -> Status {
    auto locked = acquire_member(session_id, user_id);
    if (!locked) return std::unexpected{locked.error()};
    auto& state = *locked->state;

    state.session.members.at(user_id).selection = selection;
    dispatcher_.broadcast(state.member_ids(),
                          make_event(EventType::selection_changed, user_id, session_id, selection),
                          user_id);
    return {};
}

// -- Editing --------------------------------------------------------------------

auto CollaborationEngine::apply_edit(const SessionId& session_id, Edit edit) -> Result<Edit> {
    auto locked = acquire_member(session_id, edit.author_id);
    if (!locked) return std::unexpected{locked.error()};
    auto& state = *locked->state;
    const auto& session = state.session;

    if (session.settings.read_only && edit.author_id != session.owner_id) {
        return fail(ErrorKind::read_only_violation,
                    "session " + session_id + " is read-only");
    }
    if (auto valid = validate(edit); !valid) {
        return std::unexpected{valid.error()};
    }
    if (edit.base_version > state.version + 1) {
        return fail(ErrorKind::invalid_message,
                    "base version " + std::to_string(edit.base_version) +
                    " is ahead of session version " + std::to_string(state.version));
    }

    // Versions in [max(base, 1), oldest) were concurrent but have been
    // trimmed from the log; the edit is transformed against what is left.
    if (auto oldest = state.log.oldest_version();
        oldest && *oldest > std::max<std::uint64_t>(edit.base_version, 1)) {
        detail::logger()->warn(
            "stale edit: session={} author={} base_version={} oldest_logged={}",
            session_id, edit.author_id, edit.base_version, *oldest);
    }

    const auto concurrent = state.log.since(edit.base_version);
    auto applied = transform_against(std::move(edit), concurrent);
    applied = detail::clamp_to_document(std::move(applied), state.document.size());
    applied.id = ids_->next_id();
    applied.version = ++state.version;

    state.document.apply(applied);
    state.log.append(applied);

    dispatcher_.broadcast(state.member_ids(),
                          make_event(EventType::edit_applied, applied.author_id, session_id, applied),
                          applied.author_id);

    detail::logger()->debug("edit applied: session={} author={} kind={} position={} version={}",
                            session_id, applied.author_id, to_string_view(applied.kind),
                            applied.position, applied.version);
    return applied;
}

// -- Chat -----------------------------------------------------------------------

auto CollaborationEngine::send_chat_message(const SessionId& session_id, const UserId& author_id,
                                            std::string text) -> Result<ChatMessage> {
    auto locked = acquire_member(session_id, author_id);
    if (!locked) return std::unexpected{locked.error()};
    auto& state = *locked->state;
    const auto& author = state.session.members.at(author_id);

    auto message = ChatMessage{
        .id = ids_->next_id(),
        .author_id = author_id,
        .author_name = author.display_name,
        .author_avatar = author.avatar,
        .text = std::move(text),
        .timestamp = std::chrono::system_clock::now(),
    };
    dispatcher_.broadcast(state.member_ids(),
                          make_event(EventType::chat_message, author_id, session_id, message),
                          author_id);
    return message;
}

// -- Reading --------------------------------------------------------------------

auto CollaborationEngine::get_session(const SessionId& session_id) const -> std::optional<Session> {
    auto locked = acquire(session_id);
    if (!locked) return std::nullopt;
    return (*locked)->session;
}

auto CollaborationEngine::get_active_members(const SessionId& session_id) const
    -> std::vector<User> {
    auto locked = acquire(session_id);
    if (!locked) return {};
    auto users = std::vector<User>{};
    users.reserve((*locked)->session.members.size());
    for (const auto& [_, user] : (*locked)->session.members) {
        users.push_back(user);
    }
    return users;
}

auto CollaborationEngine::get_user_sessions(const UserId& user_id) const -> std::vector<Session> {
    auto states = std::vector<std::shared_ptr<detail::SessionState>>{};
    {
        auto lock = std::shared_lock{registry_mutex_};
        auto it = user_sessions_.find(user_id);
        if (it == user_sessions_.end()) return {};
        for (const auto& session_id : it->second) {
            if (auto s = sessions_.find(session_id); s != sessions_.end()) {
                states.push_back(s->second);
            }
        }
    }

    auto result = std::vector<Session>{};
    result.reserve(states.size());
    for (const auto& state : states) {
        auto lock = std::scoped_lock{state->mutex};
        if (!state->destroyed && state->session.has_member(user_id)) {
            result.push_back(state->session);
        }
    }
    return result;
}

auto CollaborationEngine::get_document(const SessionId& session_id) const
    -> std::optional<SyncRequest> {
    auto locked = acquire(session_id);
    if (!locked) return std::nullopt;
    return (*locked)->sync_request();
}

auto CollaborationEngine::session_count() const -> std::size_t {
    auto lock = std::shared_lock{registry_mutex_};
    return sessions_.size();
}

// -- Lifecycle ------------------------------------------------------------------

void CollaborationEngine::flush() {
    dispatcher_.flush();
}

void CollaborationEngine::close() {
    dispatcher_.flush();

    auto states = std::vector<std::shared_ptr<detail::SessionState>>{};
    {
        auto lock = std::unique_lock{registry_mutex_};
        states.reserve(sessions_.size());
        for (auto& [_, state] : sessions_) {
            states.push_back(std::move(state));
        }
        sessions_.clear();
        user_sessions_.clear();
    }
    for (const auto& state : states) {
        auto lock = std::scoped_lock{state->mutex};
        state->destroyed = true;
    }
    if (!states.empty()) {
        detail::logger()->info("engine closed: sessions_destroyed={}", states.size());
    }
}

}  // namespace coedit_cpp
