#pragma once

// Internal header — not installed. Implementation detail of CollaborationEngine.

#include <coedit-cpp/event.hpp>
#include <coedit-cpp/operation_log.hpp>
#include <coedit-cpp/types.hpp>

#include "text_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace coedit_cpp::detail {

// The mutable state of one session. Every field is guarded by `mutex`,
// which is the session's single serialization point.
struct SessionState {
    std::mutex mutex;
    Session session;
    std::uint64_t version = 0;  // version of the latest applied edit
    OperationLog log;
    TextBuffer document;
    bool destroyed = false;     // set once the last member leaves

    SessionState(std::size_t log_capacity, std::size_t log_retain)
        : log{log_capacity, log_retain} {}

    auto member_ids() const -> std::vector<UserId> {
        auto ids = std::vector<UserId>{};
        ids.reserve(session.members.size());
        for (const auto& [id, _] : session.members) {
            ids.push_back(id);
        }
        return ids;
    }

    auto sync_request() const -> SyncRequest {
        return SyncRequest{.version = version, .content = document.content};
    }

    auto is_authorized(const UserId& user_id) const -> bool {
        return user_id == session.owner_id ||
               session.settings.authorized_users.contains(user_id);
    }
};

// A session whose mutex is held by the caller.
struct LockedSession {
    std::shared_ptr<SessionState> state;
    std::unique_lock<std::mutex> lock;

    auto operator->() const -> SessionState* { return state.get(); }
};

}  // namespace coedit_cpp::detail
