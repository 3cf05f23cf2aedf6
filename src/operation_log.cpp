#include <coedit-cpp/operation_log.hpp>

#include <algorithm>
#include <iterator>
#include <ranges>

namespace coedit_cpp {

OperationLog::OperationLog(std::size_t capacity, std::size_t retain)
    : capacity_{capacity}, retain_{std::min(retain, capacity)} {
    entries_.reserve(capacity_ + 1);
}

void OperationLog::append(Edit edit) {
    entries_.push_back(std::move(edit));
    if (entries_.size() > capacity_) {
        const auto drop = entries_.size() - retain_;
        entries_.erase(entries_.begin(),
                       entries_.begin() + static_cast<std::ptrdiff_t>(drop));
    }
}

auto OperationLog::since(std::uint64_t version) const -> std::span<const Edit> {
    // Versions are strictly increasing, so a binary search finds the cut.
    auto it = std::ranges::lower_bound(entries_, version, {}, &Edit::version);
    const auto offset = static_cast<std::size_t>(std::distance(entries_.begin(), it));
    return std::span<const Edit>{entries_}.subspan(offset);
}

auto OperationLog::oldest_version() const -> std::optional<std::uint64_t> {
    if (entries_.empty()) return std::nullopt;
    return entries_.front().version;
}

auto OperationLog::latest_version() const -> std::optional<std::uint64_t> {
    if (entries_.empty()) return std::nullopt;
    return entries_.back().version;
}

}  // namespace coedit_cpp
