/**
 * @file dependency_graph.hpp
 * @brief Mutable dependency graph of tasks, the single source of truth for
 *        readiness and cycles.
 * @author Dimitris Kafetzis
 *
 * Tasks and both directions of every edge live here. Edges only change
 * through add_dependency / remove_dependency / mark_completed, each of which
 * updates the dependency and dependent sides under one lock acquisition.
 * Every public operation takes the same recursive mutex, so the graph can be
 * shared between the scheduler's control thread and task code running on
 * worker threads.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/snapshot.hpp"
#include "graph/task.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dynamic_scheduler {

/**
 * @brief Number of tasks per state at one instant.
 */
struct StateCounts {
    size_t pending = 0;
    size_t ready = 0;
    size_t running = 0;
    size_t blocked = 0;
    size_t completed = 0;
    size_t failed = 0;

    [[nodiscard]] size_t total() const noexcept {
        return pending + ready + running + blocked + completed + failed;
    }
    [[nodiscard]] size_t non_terminal() const noexcept {
        return pending + ready + running + blocked;
    }
};

/**
 * @brief Acyclic, mutable graph of tasks and dependency edges.
 */
class DependencyGraph {
public:
    DependencyGraph() = default;

    DependencyGraph(const DependencyGraph&) = delete;
    DependencyGraph& operator=(const DependencyGraph&) = delete;

    // ── Construction ──────────────────────────

    /// Register a task; its declared dependencies must already exist.
    Result<TaskId> add_task(Task task);

    /// `task_id` now waits on `dep_id`. Rejects unknown ids, cycles, and a
    /// dependent that is already Running or terminal.
    Result<void> add_dependency(const TaskId& task_id, const TaskId& dep_id);

    /// Same as add_dependency, but a Running dependent is accepted: the edge
    /// is a running task's own wait and takes effect once it blocks.
    Result<void> add_wait_edge(const TaskId& task_id, const TaskId& dep_id);
    Result<void> remove_dependency(const TaskId& task_id, const TaskId& dep_id);

    /// Produce an id of the form `<prefix><n>` not yet used in the graph.
    [[nodiscard]] TaskId generate_id(std::string_view prefix);

    // ── Readiness ─────────────────────────────
    [[nodiscard]] bool is_ready(const TaskId& id) const;

    /// Pending tasks whose dependencies are all completed, moved to Ready.
    /// Higher priority first, then insertion order.
    std::vector<TaskId> get_ready_tasks();

    /// Every task currently Ready, in dispatch order.
    [[nodiscard]] std::vector<TaskId> ready_queue() const;

    /// Pending or Blocked tasks with at least one unmet dependency.
    [[nodiscard]] std::vector<TaskId> get_blocked_tasks() const;

    // ── State Updates ─────────────────────────

    /// Returns the dependents whose dependency set became empty.
    Result<std::vector<TaskId>> mark_completed(const TaskId& id, std::string result);

    /// Returns the dependents failed by cascade (empty for LeaveBlocked).
    Result<std::vector<TaskId>> mark_failed(const TaskId& id, Error error,
                                            FailurePolicy policy = FailurePolicy::LeaveBlocked);

    Result<void> mark_running(const TaskId& id);
    Result<void> mark_blocked(const TaskId& id);
    Result<void> mark_pending(const TaskId& id);

    Result<void> set_checkpoint(const TaskId& id, std::string state);
    Result<void> set_progress(const TaskId& id, double fraction);

    // ── Queries ───────────────────────────────
    [[nodiscard]] Result<std::vector<TaskId>> topological_order() const;
    [[nodiscard]] std::optional<Task> get_task(const TaskId& id) const;
    [[nodiscard]] std::optional<TaskState> state_of(const TaskId& id) const;
    [[nodiscard]] std::optional<std::string> result_of(const TaskId& id) const;
    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] size_t task_count() const;
    [[nodiscard]] std::vector<TaskId> task_ids() const;
    [[nodiscard]] std::vector<TaskId> dependencies(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> dependents(const TaskId& id) const;
    [[nodiscard]] std::vector<Edge> edges() const;
    [[nodiscard]] std::vector<TaskId> tasks_in_state(TaskState state) const;
    [[nodiscard]] StateCounts counts() const;
    [[nodiscard]] bool all_terminal() const;

    // ── Maintenance ───────────────────────────

    /// Remove terminal tasks nobody depends on and for which `policy` holds.
    size_t collect_terminal(const std::function<bool(const Task&)>& policy);

    [[nodiscard]] std::vector<TaskRecord> export_state() const;

    /// Validate every record, then apply all of them or none.
    Result<void> import_state(const std::vector<TaskRecord>& records,
                              const ExecutorResolver& resolver);

private:
    using TaskMap = std::unordered_map<TaskId, Task>;

    /// True if `to` is reachable from `from` following dependency edges.
    static bool reaches(const TaskMap& tasks, const TaskId& from, const TaskId& to);

    /// Kahn's algorithm; nullopt when the graph is cyclic.
    static std::optional<std::vector<TaskId>> kahn_order(const TaskMap& tasks,
                                                         const std::vector<TaskId>& order);

    Result<void> transition(const TaskId& id, TaskState to);

    /// Edge insertion shared by add_dependency and add_wait_edge; caller holds the lock.
    Result<void> insert_edge(const TaskId& task_id, const TaskId& dep_id, bool allow_running);

    mutable std::recursive_mutex mutex_;
    TaskMap tasks_;
    std::vector<TaskId> order_;          // insertion order
    uint64_t next_id_ = 1;
};

}  // namespace dynamic_scheduler
