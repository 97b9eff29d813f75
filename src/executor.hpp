#pragma once

// Global work-stealing executor via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(). Subscriber callback delivery is
// submitted through this executor unless a Broadcaster is configured with
// its own thread count.
//
// Internal header — not installed.

#include <taskflow/taskflow.hpp>

namespace issuehub_cpp::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace issuehub_cpp::detail
