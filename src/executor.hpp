#pragma once

// Delivery executor via Taskflow.
//
// Event delivery runs on a tf::Executor owned by the Dispatcher, so
// transports never run on a session's serialization point. A thread
// count of 0 means no executor: the dispatcher delivers inline.
//
// Internal header — not installed.

#include <taskflow/taskflow.hpp>

#include <memory>

namespace coedit_cpp::detail {

inline auto make_executor(unsigned int num_threads) -> std::unique_ptr<tf::Executor> {
    if (num_threads == 0) return nullptr;
    return std::make_unique<tf::Executor>(num_threads);
}

}  // namespace coedit_cpp::detail
