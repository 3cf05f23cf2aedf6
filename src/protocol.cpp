#include <coedit-cpp/protocol.hpp>
#include <coedit-cpp/engine.hpp>
#include <coedit-cpp/json.hpp>

#include "logging.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace coedit_cpp {

namespace {

auto decode_json(const nlohmann::json& j) -> ClientMessage {
    const auto type = j.at("type").get<std::string>();
    auto session_id = j.at("sessionId").get<std::string>();

    if (type == "join") {
        return JoinRequest{std::move(session_id), j.at("user").get<User>()};
    }
    if (type == "leave") {
        return LeaveRequest{std::move(session_id)};
    }
    if (type == "cursor") {
        return CursorUpdate{std::move(session_id), j.at("cursor").get<CursorPosition>()};
    }
    if (type == "selection") {
        return SelectionUpdate{std::move(session_id), j.at("selection").get<SelectionRange>()};
    }
    if (type == "edit") {
        return EditRequest{std::move(session_id), j.at("edit").get<Edit>()};
    }
    if (type == "chat") {
        return ChatRequest{std::move(session_id), j.at("message").get<std::string>()};
    }
    throw std::runtime_error{"unknown message type: " + type};
}

}  // anonymous namespace

auto decode_client_message(std::string_view frame) -> Result<ClientMessage> {
    auto j = nlohmann::json::parse(frame, nullptr, false);
    if (j.is_discarded()) {
        return fail(ErrorKind::invalid_message, "frame is not valid JSON");
    }
    if (!j.is_object()) {
        return fail(ErrorKind::invalid_message, "frame is not a JSON object");
    }
    try {
        return decode_json(j);
    } catch (const nlohmann::json::exception& e) {
        return fail(ErrorKind::invalid_message, std::string{"invalid message: "} + e.what());
    } catch (const std::runtime_error& e) {
        return fail(ErrorKind::invalid_message, std::string{"invalid message: "} + e.what());
    }
}

auto encode_event(const SessionEvent& event) -> std::string {
    return nlohmann::json(event).dump();
}

// -- CollaborationEngine: inbound routing ---------------------------------------

auto CollaborationEngine::handle_message(const UserId& user_id, std::string_view frame) -> Status {
    auto message = decode_client_message(frame);
    if (!message) {
        detail::logger()->warn("rejected frame: user={} error={}", user_id, message.error().message);
        send_error(user_id, {}, message.error());
        return std::unexpected{message.error()};
    }

    auto session_id = SessionId{};
    auto status = std::visit(overload{
        [&](JoinRequest& m) -> Status {
            session_id = m.session_id;
            m.user.id = user_id;
            auto joined = join_session(m.session_id, std::move(m.user));
            if (!joined) return std::unexpected{joined.error()};
            return {};
        },
        [&](LeaveRequest& m) -> Status {
            session_id = m.session_id;
            leave_session(m.session_id, user_id);
            return {};
        },
        [&](CursorUpdate& m) -> Status {
            session_id = m.session_id;
            return update_cursor(m.session_id, user_id, m.cursor);
        },
        [&](SelectionUpdate& m) -> Status {
            session_id = m.session_id;
            return update_selection(m.session_id, user_id, m.selection);
        },
        [&](EditRequest& m) -> Status {
            session_id = m.session_id;
            m.edit.author_id = user_id;
            auto applied = apply_edit(m.session_id, std::move(m.edit));
            if (!applied) return std::unexpected{applied.error()};
            return {};
        },
        [&](ChatRequest& m) -> Status {
            session_id = m.session_id;
            auto sent = send_chat_message(m.session_id, user_id, std::move(m.text));
            if (!sent) return std::unexpected{sent.error()};
            return {};
        },
    }, *message);

    if (!status) {
        detail::logger()->info("request failed: user={} session={} error={} ({})",
                               user_id, session_id, to_string_view(status.error().kind),
                               status.error().message);
        send_error(user_id, session_id, status.error());
    }
    return status;
}

void CollaborationEngine::send_error(const UserId& user_id, const SessionId& session_id,
                                     const Error& error) {
    dispatcher_.send(user_id, SessionEvent{
        .type = EventType::error,
        .author_id = user_id,
        .session_id = session_id,
        .payload = ErrorNotice{.kind = error.kind, .message = error.message},
        .timestamp = std::chrono::system_clock::now(),
    });
}

}  // namespace coedit_cpp
