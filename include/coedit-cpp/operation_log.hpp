/// @file operation_log.hpp
/// @brief Bounded history of recently applied edits for one session.

#pragma once

#include <coedit-cpp/edit.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace coedit_cpp {

/// Ordered, bounded log of applied edits used as the transform basis.
///
/// Entries are kept in ascending version order. When an append pushes
/// the log past `capacity` entries it is cut down to the newest
/// `retain` entries, so the log never holds more than `capacity`.
/// The log lives in memory only.
class OperationLog {
public:
    static constexpr std::size_t default_capacity = 100;
    static constexpr std::size_t default_retain = 50;

    OperationLog() = default;

    /// Construct with explicit bounds. `retain` is clamped to `capacity`.
    OperationLog(std::size_t capacity, std::size_t retain);

    /// Push an applied edit to the tail, trimming if over capacity.
    void append(Edit edit);

    /// All entries with version >= `version`, oldest first.
    auto since(std::uint64_t version) const -> std::span<const Edit>;

    /// Version of the oldest retained entry, or nullopt if empty.
    auto oldest_version() const -> std::optional<std::uint64_t>;

    /// Version of the newest entry, or nullopt if empty.
    auto latest_version() const -> std::optional<std::uint64_t>;

    auto entries() const -> std::span<const Edit> { return entries_; }
    auto size() const -> std::size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }
    auto capacity() const -> std::size_t { return capacity_; }
    auto retain() const -> std::size_t { return retain_; }

private:
    std::size_t capacity_{default_capacity};
    std::size_t retain_{default_retain};
    std::vector<Edit> entries_;
};

}  // namespace coedit_cpp
