#pragma once

// Test helper: a Transport that records every delivered event.

#include <coedit-cpp/event.hpp>
#include <coedit-cpp/transport.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace coedit_cpp::test_support {

class RecordingTransport : public Transport {
public:
    void deliver(const UserId& recipient, const SessionEvent& event) override {
        auto lock = std::scoped_lock{mutex_};
        recipients_.push_back(recipient);
        events_.push_back(event);
    }

    auto events() const -> std::vector<SessionEvent> {
        auto lock = std::scoped_lock{mutex_};
        return events_;
    }

    auto events_of(EventType type) const -> std::vector<SessionEvent> {
        auto lock = std::scoped_lock{mutex_};
        auto result = std::vector<SessionEvent>{};
        std::ranges::copy_if(events_, std::back_inserter(result),
            [type](const SessionEvent& e) { return e.type == type; });
        return result;
    }

    auto count() const -> std::size_t {
        auto lock = std::scoped_lock{mutex_};
        return events_.size();
    }

    auto recipients() const -> std::vector<UserId> {
        auto lock = std::scoped_lock{mutex_};
        return recipients_;
    }

    void clear() {
        auto lock = std::scoped_lock{mutex_};
        events_.clear();
        recipients_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<UserId> recipients_;
    std::vector<SessionEvent> events_;
};

inline auto make_user(UserId id, std::string name = {}) -> User {
    auto display = name.empty() ? id : std::move(name);
    return User{.id = id, .display_name = std::move(display), .email = id + "@example.com"};
}

}  // namespace coedit_cpp::test_support
