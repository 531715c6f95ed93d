/**
 * @file task_context.hpp
 * @brief Capability object handed to a running executor.
 * @author Dimitris Kafetzis
 *
 * The context is the only channel through which task code talks to the
 * scheduler: it spawns subtasks, declares waits, checkpoints and reports
 * progress. A wait does not park the worker thread. wait_for() records the
 * edge and arms a Blocked outcome; the executor returns, the worker is freed,
 * and the task is dispatched again from the start once the dependency has
 * completed.
 *
 * Usage:
 * @code
 *   TaskOutcome body(TaskContext& ctx) {
 *       if (auto child = ctx.checkpoint_state(); !child.empty()) {
 *           return Completed{"saw " + ctx.result_of(child).value_or("")};
 *       }
 *       auto child = ctx.spawn_subtask("fetch input", fetch);
 *       if (!child) return Failed{child.error()};
 *       ctx.checkpoint(*child);
 *       return ctx.wait_for(*child);
 *   }
 * @endcode
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/dependency_graph.hpp"
#include "graph/task.hpp"

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>

namespace dynamic_scheduler {

class TaskContext {
public:
    TaskContext(DependencyGraph& graph,
                TaskId task_id,
                std::string checkpoint,
                uint32_t attempt,
                std::stop_token stop = {},
                Logger* logger = nullptr);

    TaskContext(const TaskContext&) = delete;
    TaskContext& operator=(const TaskContext&) = delete;

    /// Register a new task whose parent is the current one. With `wait`, the
    /// current task is suspended on it exactly as wait_for() would.
    Result<TaskId> spawn_subtask(std::string description, TaskExecutor executor,
                                 bool wait = false);

    /// Add the edge current → `task_id` and suspend the current task.
    /// Returns Blocked on success, or Failed when the id is unknown or the
    /// wait would close a cycle. Either way the outcome is armed: the task ends
    /// up in that state whatever the executor returns afterwards.
    TaskOutcome wait_for(const TaskId& task_id);

    /// Save opaque state for the next re-entry.
    void checkpoint(std::string state);
    [[nodiscard]] const std::string& checkpoint_state() const noexcept { return checkpoint_; }

    void progress(double fraction);

    /// Result of a completed task, nullopt otherwise.
    [[nodiscard]] std::optional<std::string> result_of(const TaskId& task_id) const;

    [[nodiscard]] bool stop_requested() const noexcept { return stop_.stop_requested(); }
    [[nodiscard]] const TaskId& task_id() const noexcept { return task_id_; }
    [[nodiscard]] uint32_t attempt() const noexcept { return attempt_; }
    [[nodiscard]] Logger* logger() const noexcept { return logger_; }

    /// Outcome forced by wait_for / spawn_subtask(wait=true), if any.
    [[nodiscard]] const std::optional<TaskOutcome>& armed_outcome() const noexcept {
        return armed_;
    }

private:
    void arm(TaskOutcome outcome);

    DependencyGraph& graph_;
    TaskId task_id_;
    std::string checkpoint_;
    uint32_t attempt_;
    std::stop_token stop_;
    Logger* logger_;
    std::optional<TaskOutcome> armed_;
};

}  // namespace dynamic_scheduler
