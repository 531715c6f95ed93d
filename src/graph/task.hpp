/**
 * @file task.hpp
 * @brief Task entity and the tagged executor outcome.
 * @author Dimitris Kafetzis
 *
 * A Task is plain data owned by the DependencyGraph. Executors report how a
 * run ended through TaskOutcome rather than by throwing control-flow signals:
 * Completed carries the result, Blocked names the dependency the task is now
 * waiting on, Failed carries the error.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <variant>

namespace dynamic_scheduler {

class TaskContext;

// ─────────────────────────────────────────────
// Executor Outcome
// ─────────────────────────────────────────────

struct Completed {
    std::string result;
};

struct Blocked {
    TaskId dependency;
};

struct Failed {
    Error error;
};

using TaskOutcome = std::variant<Completed, Blocked, Failed>;

/**
 * @brief Task body. Invoked from the start on every dispatch, including
 *        re-dispatch after a suspension; use TaskContext::checkpoint_state()
 *        to skip work already done.
 */
using TaskExecutor = std::function<TaskOutcome(TaskContext&)>;

// ─────────────────────────────────────────────
// Task
// ─────────────────────────────────────────────

/**
 * @brief A single schedulable unit of work and its bookkeeping.
 */
struct Task {
    TaskId id;
    std::string description;
    TaskExecutor executor;
    TaskState state = TaskState::Pending;
    int priority = 0;

    std::set<TaskId> dependencies;   ///< Tasks this one waits on
    std::set<TaskId> dependents;     ///< Tasks waiting on this one

    double progress = 0.0;           ///< [0.0, 1.0]
    std::string checkpoint;          ///< Opaque state kept across re-entries
    std::string result;
    std::optional<Error> error;

    Timestamp created_at = std::chrono::system_clock::now();
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;

    std::optional<TaskId> parent_id;
    uint32_t attempts = 0;           ///< Number of dispatches so far

    /// Wall time between first dispatch and completion, if both happened.
    [[nodiscard]] std::optional<Duration> duration() const {
        if (!started_at || !completed_at) return std::nullopt;
        return std::chrono::duration_cast<Duration>(*completed_at - *started_at);
    }
};

}  // namespace dynamic_scheduler
