/// @file dispatcher.hpp
/// @brief Fan-out of session events to connected users.

#pragma once

#include <coedit-cpp/event.hpp>
#include <coedit-cpp/transport.hpp>
#include <coedit-cpp/types.hpp>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>

namespace tf {
class Executor;
}  // namespace tf

namespace coedit_cpp {

/// Routes events to per-connection transports.
///
/// Each connected user owns a bounded outbound queue. Enqueueing never
/// blocks on a transport: queues are drained by tasks on an internal
/// Taskflow executor, one task per connection at a time, so events
/// reach each user in the order they were enqueued. When a queue is
/// full the oldest queued event is dropped.
///
/// With zero delivery threads, events are delivered on the enqueueing
/// thread instead. Transports must then not call back into the engine.
///
/// Events addressed to users without a registered connection are
/// discarded.
class Dispatcher {
public:
    /// @param queue_capacity Events buffered per connection.
    /// @param delivery_threads Executor size. 0 = deliver inline.
    explicit Dispatcher(std::size_t queue_capacity = 256, unsigned int delivery_threads = 1);

    /// Waits for queued deliveries to finish.
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    auto operator=(const Dispatcher&) -> Dispatcher& = delete;
    Dispatcher(Dispatcher&&) = delete;
    auto operator=(Dispatcher&&) -> Dispatcher& = delete;

    /// Register the transport for a user, replacing any previous one.
    void connect(const UserId& user_id, std::shared_ptr<Transport> transport);

    /// Unregister a user's transport and discard its undelivered events.
    void disconnect(const UserId& user_id);

    auto is_connected(const UserId& user_id) const -> bool;

    /// Queue an event for a single user.
    void send(const UserId& recipient, const SessionEvent& event);

    /// Queue an event for every recipient except `exclude`.
    void broadcast(std::span<const UserId> recipients, const SessionEvent& event,
                   const std::optional<UserId>& exclude = std::nullopt);

    /// Block until every queued event has been handed to its transport.
    void flush();

    /// Number of events dropped because a queue was full.
    auto dropped_events() const -> std::uint64_t;

private:
    struct Connection {
        UserId user_id;
        std::shared_ptr<Transport> transport;
        std::deque<SessionEvent> queue;
        bool draining{false};
    };

    // Queue under mutex_. Returns the connection if the caller must
    // start a drain for it.
    auto enqueue_locked(const UserId& recipient, const SessionEvent& event)
        -> std::shared_ptr<Connection>;

    void start_drain(std::shared_ptr<Connection> conn);
    void drain(const std::shared_ptr<Connection>& conn);

    std::size_t queue_capacity_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::size_t active_drains_{0};
    std::uint64_t dropped_{0};
    std::unordered_map<UserId, std::shared_ptr<Connection>> connections_;
    std::unique_ptr<tf::Executor> executor_;
};

}  // namespace coedit_cpp
