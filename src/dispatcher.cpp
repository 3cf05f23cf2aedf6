#include <coedit-cpp/dispatcher.hpp>

#include "executor.hpp"
#include "logging.hpp"

#include <exception>
#include <vector>

namespace coedit_cpp {

Dispatcher::Dispatcher(std::size_t queue_capacity, unsigned int delivery_threads)
    : queue_capacity_{queue_capacity == 0 ? 1 : queue_capacity},
      executor_{detail::make_executor(delivery_threads)} {}

Dispatcher::~Dispatcher() {
    flush();
}

void Dispatcher::connect(const UserId& user_id, std::shared_ptr<Transport> transport) {
    auto lock = std::scoped_lock{mutex_};
    auto conn = std::make_shared<Connection>();
    conn->user_id = user_id;
    conn->transport = std::move(transport);
    if (auto it = connections_.find(user_id); it != connections_.end()) {
        // A drain in flight keeps the old connection alive until it sees
        // the empty queue.
        it->second->queue.clear();
        it->second = std::move(conn);
    } else {
        connections_.emplace(user_id, std::move(conn));
    }
    detail::logger()->debug("connection registered: user={}", user_id);
}

void Dispatcher::disconnect(const UserId& user_id) {
    auto lock = std::scoped_lock{mutex_};
    auto it = connections_.find(user_id);
    if (it == connections_.end()) return;
    it->second->queue.clear();
    connections_.erase(it);
    detail::logger()->debug("connection unregistered: user={}", user_id);
}

auto Dispatcher::is_connected(const UserId& user_id) const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return connections_.contains(user_id);
}

auto Dispatcher::enqueue_locked(const UserId& recipient, const SessionEvent& event)
    -> std::shared_ptr<Connection> {
    auto it = connections_.find(recipient);
    if (it == connections_.end()) return nullptr;

    auto& conn = it->second;
    if (conn->queue.size() >= queue_capacity_) {
        conn->queue.pop_front();
        ++dropped_;
        detail::logger()->warn("outbound queue full, dropped oldest event: user={}", recipient);
    }
    conn->queue.push_back(event);

    if (conn->draining) return nullptr;
    conn->draining = true;
    ++active_drains_;
    return conn;
}

void Dispatcher::send(const UserId& recipient, const SessionEvent& event) {
    auto to_start = std::shared_ptr<Connection>{};
    {
        auto lock = std::scoped_lock{mutex_};
        to_start = enqueue_locked(recipient, event);
    }
    if (to_start) start_drain(std::move(to_start));
}

void Dispatcher::broadcast(std::span<const UserId> recipients, const SessionEvent& event,
                           const std::optional<UserId>& exclude) {
    auto to_start = std::vector<std::shared_ptr<Connection>>{};
    {
        auto lock = std::scoped_lock{mutex_};
        for (const auto& recipient : recipients) {
            if (exclude && recipient == *exclude) continue;
            if (auto conn = enqueue_locked(recipient, event)) {
                to_start.push_back(std::move(conn));
            }
        }
    }
    for (auto& conn : to_start) {
        start_drain(std::move(conn));
    }
}

void Dispatcher::start_drain(std::shared_ptr<Connection> conn) {
    if (!executor_) {
        drain(conn);
        return;
    }
    executor_->silent_async([this, conn = std::move(conn)]() { drain(conn); });
}

void Dispatcher::drain(const std::shared_ptr<Connection>& conn) {
    while (true) {
        auto event = std::optional<SessionEvent>{};
        {
            auto lock = std::scoped_lock{mutex_};
            if (conn->queue.empty()) {
                conn->draining = false;
                --active_drains_;
                idle_cv_.notify_all();
                return;
            }
            event = std::move(conn->queue.front());
            conn->queue.pop_front();
        }
        try {
            conn->transport->deliver(conn->user_id, *event);
        } catch (const std::exception& e) {
            detail::logger()->warn("transport delivery failed: user={} type={} error={}",
                                   conn->user_id, to_string_view(event->type), e.what());
        } catch (...) {
            detail::logger()->warn("transport delivery failed: user={} type={} error=unknown",
                                   conn->user_id, to_string_view(event->type));
        }
    }
}

void Dispatcher::flush() {
    auto lock = std::unique_lock{mutex_};
    idle_cv_.wait(lock, [this] { return active_drains_ == 0; });
}

auto Dispatcher::dropped_events() const -> std::uint64_t {
    auto lock = std::scoped_lock{mutex_};
    return dropped_;
}

}  // namespace coedit_cpp
