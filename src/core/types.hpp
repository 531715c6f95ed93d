/**
 * @file types.hpp
 * @brief Fundamental types used throughout DynamicScheduler.
 * @author Dimitris Kafetzis
 *
 * Defines TaskId, TaskState, clock aliases, and other shared vocabulary types.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace dynamic_scheduler {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Task State
// ─────────────────────────────────────────────

/**
 * @brief Lifecycle state of a task.
 *
 * Pending → Ready → Running → {Completed, Failed, Blocked}
 * Blocked → Pending (once every awaited dependency has completed)
 */
enum class TaskState : uint8_t {
    Pending,       ///< Registered, waiting for dependencies
    Ready,         ///< All dependencies met, awaiting dispatch
    Running,       ///< Executor is running on a worker
    Blocked,       ///< Suspended by wait_for, parked until resumed
    Completed,     ///< Finished successfully (terminal)
    Failed         ///< Execution failed (terminal)
};

[[nodiscard]] constexpr std::string_view to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:    return "pending";
        case TaskState::Ready:      return "ready";
        case TaskState::Running:    return "running";
        case TaskState::Blocked:    return "blocked";
        case TaskState::Completed:  return "completed";
        case TaskState::Failed:     return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(TaskState state) noexcept {
    return state == TaskState::Completed || state == TaskState::Failed;
}

/**
 * @brief Whether the graph accepts a transition from one state to another.
 */
[[nodiscard]] constexpr bool is_valid_transition(TaskState from, TaskState to) noexcept {
    switch (from) {
        case TaskState::Pending:
            return to == TaskState::Ready || to == TaskState::Failed;
        case TaskState::Ready:
            return to == TaskState::Running || to == TaskState::Failed;
        case TaskState::Running:
            return to == TaskState::Completed || to == TaskState::Failed
                || to == TaskState::Blocked;
        case TaskState::Blocked:
            return to == TaskState::Pending || to == TaskState::Failed;
        case TaskState::Completed:
        case TaskState::Failed:
            return false;
    }
    return false;
}

// ─────────────────────────────────────────────
// Failure Policy
// ─────────────────────────────────────────────

/**
 * @brief What happens to dependents when a task fails.
 */
enum class FailurePolicy : uint8_t {
    LeaveBlocked,  ///< Dependents stay waiting and are reported as stuck
    Cascade        ///< Dependents are failed transitively
};

[[nodiscard]] constexpr std::string_view to_string(FailurePolicy policy) noexcept {
    switch (policy) {
        case FailurePolicy::LeaveBlocked: return "leave_blocked";
        case FailurePolicy::Cascade:      return "cascade";
    }
    return "unknown";
}

}  // namespace dynamic_scheduler
