/// @file transport.hpp
/// @brief Interfaces supplied by the embedding system: Transport, IdGenerator.

#pragma once

#include <coedit-cpp/event.hpp>
#include <coedit-cpp/types.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace coedit_cpp {

/// Delivers events to one connected user.
///
/// Implemented by the embedding system, typically over a WebSocket or
/// another long-lived connection. Delivery is fire-and-forget: a
/// transport reports or drops its own failures. Exceptions escaping
/// deliver() are logged by the dispatcher and otherwise ignored.
/// deliver() is never called concurrently for the same connection.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void deliver(const UserId& recipient, const SessionEvent& event) = 0;
};

/// Transport adapter over a callable.
///
/// @code
/// auto transport = std::make_shared<CallbackTransport>(
///     [&](const UserId& to, const SessionEvent& ev) { socket.send(to, ev); });
/// @endcode
class CallbackTransport : public Transport {
public:
    using Callback = std::function<void(const UserId&, const SessionEvent&)>;

    explicit CallbackTransport(Callback callback) : callback_{std::move(callback)} {}

    void deliver(const UserId& recipient, const SessionEvent& event) override {
        callback_(recipient, event);
    }

private:
    Callback callback_;
};

/// Source of unique ids for sessions, edits and chat messages.
/// Implementations must be safe to call from multiple threads.
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    virtual auto next_id() -> std::string = 0;
};

/// Random (version 4) UUIDs in canonical lowercase form, via libuuid.
class UuidGenerator : public IdGenerator {
public:
    auto next_id() -> std::string override;
};

/// Deterministic ids "<prefix>1", "<prefix>2", ...
class SequentialIdGenerator : public IdGenerator {
public:
    explicit SequentialIdGenerator(std::string prefix = "id-") : prefix_{std::move(prefix)} {}

    auto next_id() -> std::string override;

private:
    std::string prefix_;
    std::atomic<std::uint64_t> counter_{0};
};

}  // namespace coedit_cpp
