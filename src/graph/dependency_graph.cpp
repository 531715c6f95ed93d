/**
 * @file dependency_graph.cpp
 * @brief DependencyGraph implementation.
 * @author Dimitris Kafetzis
 *
 * Cycle checks are an iterative DFS along dependency edges; ordering uses
 * Kahn's algorithm with insertion order as the tie-break. All algorithms are
 * O(V+E) over the task map.
 */

#include "graph/dependency_graph.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <stack>
#include <unordered_set>

namespace dynamic_scheduler {

namespace {

Error unknown_task(const TaskId& id) {
    return Error{ErrorCode::UnknownTask, "Unknown task: " + id};
}

}  // namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<TaskId> DependencyGraph::add_task(Task task) {
    std::lock_guard lock(mutex_);

    if (task.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Task id must not be empty"};
    }
    if (tasks_.contains(task.id)) {
        return Error{ErrorCode::DuplicateTask, "Task already exists: " + task.id};
    }
    for (const auto& dep_id : task.dependencies) {
        if (dep_id == task.id) {
            return Error{ErrorCode::CircularDependency,
                         "Task " + task.id + " cannot depend on itself"};
        }
        if (!tasks_.contains(dep_id)) {
            return Error{ErrorCode::UnknownDependency,
                         "Task " + task.id + " depends on unknown task " + dep_id};
        }
    }

    // A new node has no dependents, so declared edges cannot close a cycle.
    task.state = TaskState::Pending;
    task.dependents.clear();
    std::erase_if(task.dependencies, [this](const TaskId& dep_id) {
        return tasks_.at(dep_id).state == TaskState::Completed;
    });
    TaskId id = task.id;
    for (const auto& dep_id : task.dependencies) {
        tasks_.at(dep_id).dependents.insert(id);
    }
    tasks_.emplace(id, std::move(task));
    order_.push_back(id);
    return id;
}

Result<void> DependencyGraph::add_dependency(const TaskId& task_id, const TaskId& dep_id) {
    std::lock_guard lock(mutex_);
    return insert_edge(task_id, dep_id, false);
}

Result<void> DependencyGraph::add_wait_edge(const TaskId& task_id, const TaskId& dep_id) {
    std::lock_guard lock(mutex_);
    return insert_edge(task_id, dep_id, true);
}

Result<void> DependencyGraph::insert_edge(const TaskId& task_id, const TaskId& dep_id,
                                          bool allow_running) {
    auto task_it = tasks_.find(task_id);
    if (task_it == tasks_.end()) {
        return Error{ErrorCode::UnknownDependency, "Unknown task: " + task_id};
    }
    auto dep_it = tasks_.find(dep_id);
    if (dep_it == tasks_.end()) {
        return Error{ErrorCode::UnknownDependency,
                     "Task " + task_id + " cannot depend on unknown task " + dep_id};
    }
    if (task_id == dep_id) {
        return Error{ErrorCode::CircularDependency,
                     "Task " + task_id + " cannot depend on itself"};
    }
    const auto state = task_it->second.state;
    if (is_terminal(state) || (state == TaskState::Running && !allow_running)) {
        return Error{ErrorCode::InvalidTransition,
                     "Task " + task_id + " is " + std::string{to_string(state)}
                     + " and cannot gain dependencies"};
    }
    // Edges are only kept while unmet; a completed dependency is already satisfied.
    if (task_it->second.dependencies.contains(dep_id)
        || dep_it->second.state == TaskState::Completed) {
        return {};
    }
    if (reaches(tasks_, dep_id, task_id)) {
        return Error{ErrorCode::CircularDependency,
                     "Dependency " + task_id + " -> " + dep_id + " would create a cycle"};
    }

    task_it->second.dependencies.insert(dep_id);
    dep_it->second.dependents.insert(task_id);

    // A task queued for dispatch must not run ahead of its new dependency.
    if (state == TaskState::Ready) {
        task_it->second.state = TaskState::Pending;
    }
    return {};
}

Result<void> DependencyGraph::remove_dependency(const TaskId& task_id, const TaskId& dep_id) {
    std::lock_guard lock(mutex_);

    auto task_it = tasks_.find(task_id);
    if (task_it == tasks_.end()) return unknown_task(task_id);
    auto dep_it = tasks_.find(dep_id);
    if (dep_it == tasks_.end()) return unknown_task(dep_id);

    task_it->second.dependencies.erase(dep_id);
    dep_it->second.dependents.erase(task_id);
    return {};
}

TaskId DependencyGraph::generate_id(std::string_view prefix) {
    std::lock_guard lock(mutex_);
    TaskId id;
    do {
        id = std::string{prefix} + std::to_string(next_id_++);
    } while (tasks_.contains(id));
    return id;
}

// ─────────────────────────────────────────────
// Readiness
// ─────────────────────────────────────────────

bool DependencyGraph::is_ready(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return false;

    return std::all_of(it->second.dependencies.begin(), it->second.dependencies.end(),
        [this](const TaskId& dep_id) {
            auto dep_it = tasks_.find(dep_id);
            return dep_it != tasks_.end() && dep_it->second.state == TaskState::Completed;
        });
}

std::vector<TaskId> DependencyGraph::get_ready_tasks() {
    std::lock_guard lock(mutex_);

    std::vector<TaskId> ready;
    for (const auto& id : order_) {
        auto& task = tasks_.at(id);
        if (task.state == TaskState::Pending && is_ready(id)) {
            task.state = TaskState::Ready;
            ready.push_back(id);
        }
    }

    std::stable_sort(ready.begin(), ready.end(), [this](const TaskId& a, const TaskId& b) {
        return tasks_.at(a).priority > tasks_.at(b).priority;
    });
    return ready;
}

std::vector<TaskId> DependencyGraph::ready_queue() const {
    std::lock_guard lock(mutex_);

    std::vector<TaskId> queue;
    for (const auto& id : order_) {
        if (tasks_.at(id).state == TaskState::Ready) queue.push_back(id);
    }
    std::stable_sort(queue.begin(), queue.end(), [this](const TaskId& a, const TaskId& b) {
        return tasks_.at(a).priority > tasks_.at(b).priority;
    });
    return queue;
}

std::vector<TaskId> DependencyGraph::get_blocked_tasks() const {
    std::lock_guard lock(mutex_);

    std::vector<TaskId> blocked;
    for (const auto& id : order_) {
        const auto& task = tasks_.at(id);
        if ((task.state == TaskState::Pending || task.state == TaskState::Blocked)
            && !is_ready(id)) {
            blocked.push_back(id);
        }
    }
    return blocked;
}

// ─────────────────────────────────────────────
// State Updates
// ─────────────────────────────────────────────

Result<void> DependencyGraph::transition(const TaskId& id, TaskState to) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return unknown_task(id);

    auto from = it->second.state;
    if (!is_valid_transition(from, to)) {
        return Error{ErrorCode::InvalidTransition,
                     "Task " + id + " cannot move from " + std::string{to_string(from)}
                     + " to " + std::string{to_string(to)}};
    }
    it->second.state = to;
    return {};
}

Result<std::vector<TaskId>> DependencyGraph::mark_completed(const TaskId& id, std::string result) {
    std::lock_guard lock(mutex_);

    if (auto moved = transition(id, TaskState::Completed); !moved) {
        return moved.error();
    }

    auto& task = tasks_.at(id);
    task.result = std::move(result);
    task.progress = 1.0;
    task.completed_at = std::chrono::system_clock::now();

    std::vector<TaskId> unblocked;
    for (const auto& dependent_id : task.dependents) {
        auto& dependent = tasks_.at(dependent_id);
        dependent.dependencies.erase(id);
        if (dependent.dependencies.empty()) {
            unblocked.push_back(dependent_id);
        }
    }
    task.dependents.clear();
    return unblocked;
}

Result<std::vector<TaskId>> DependencyGraph::mark_failed(const TaskId& id, Error error,
                                                         FailurePolicy policy) {
    std::lock_guard lock(mutex_);

    if (auto moved = transition(id, TaskState::Failed); !moved) {
        return moved.error();
    }

    auto now = std::chrono::system_clock::now();
    auto& task = tasks_.at(id);
    task.error = std::move(error);
    task.completed_at = now;

    std::vector<TaskId> cascaded;
    if (policy != FailurePolicy::Cascade) return cascaded;

    // Breadth-first over dependents, so cascaded ids come out nearest first.
    std::queue<TaskId> frontier;
    frontier.push(id);
    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();

        for (const auto& dependent_id : tasks_.at(current).dependents) {
            auto& dependent = tasks_.at(dependent_id);
            if (is_terminal(dependent.state)) continue;

            dependent.state = TaskState::Failed;
            dependent.error = Error{ErrorCode::DependencyFailed,
                                    "Dependency " + current + " failed"};
            dependent.completed_at = now;
            cascaded.push_back(dependent_id);
            frontier.push(dependent_id);
        }
    }
    return cascaded;
}

Result<void> DependencyGraph::mark_running(const TaskId& id) {
    std::lock_guard lock(mutex_);
    if (auto moved = transition(id, TaskState::Running); !moved) {
        return moved;
    }
    auto& task = tasks_.at(id);
    if (!task.started_at) {
        task.started_at = std::chrono::system_clock::now();
    }
    ++task.attempts;
    return {};
}

Result<void> DependencyGraph::mark_blocked(const TaskId& id) {
    std::lock_guard lock(mutex_);
    return transition(id, TaskState::Blocked);
}

Result<void> DependencyGraph::mark_pending(const TaskId& id) {
    std::lock_guard lock(mutex_);
    return transition(id, TaskState::Pending);
}

Result<void> DependencyGraph::set_checkpoint(const TaskId& id, std::string state) {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return unknown_task(id);
    it->second.checkpoint = std::move(state);
    return {};
}

Result<void> DependencyGraph::set_progress(const TaskId& id, double fraction) {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return unknown_task(id);
    it->second.progress = std::clamp(fraction, 0.0, 1.0);
    return {};
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

std::optional<std::vector<TaskId>> DependencyGraph::kahn_order(
    const TaskMap& tasks, const std::vector<TaskId>& order) {
    std::unordered_map<TaskId, size_t> position;
    std::unordered_map<TaskId, size_t> in_degree;
    for (size_t i = 0; i < order.size(); ++i) {
        position[order[i]] = i;
        in_degree[order[i]] = tasks.at(order[i]).dependencies.size();
    }

    // Min-heap on insertion position keeps the order deterministic.
    std::priority_queue<size_t, std::vector<size_t>, std::greater<>> zero_in;
    for (const auto& [id, deg] : in_degree) {
        if (deg == 0) zero_in.push(position[id]);
    }

    std::vector<TaskId> sorted;
    sorted.reserve(order.size());
    while (!zero_in.empty()) {
        const auto& current = order[zero_in.top()];
        zero_in.pop();
        sorted.push_back(current);

        for (const auto& dependent : tasks.at(current).dependents) {
            if (--in_degree[dependent] == 0) {
                zero_in.push(position[dependent]);
            }
        }
    }

    if (sorted.size() != order.size()) return std::nullopt;
    return sorted;
}

Result<std::vector<TaskId>> DependencyGraph::topological_order() const {
    std::lock_guard lock(mutex_);
    auto sorted = kahn_order(tasks_, order_);
    if (!sorted) {
        return Error{ErrorCode::CycleDetected, "Dependency graph contains a cycle"};
    }
    return *sorted;
}

// ─────────────────────────────────────────────
// Cycle Detection
// ─────────────────────────────────────────────

bool DependencyGraph::reaches(const TaskMap& tasks, const TaskId& from, const TaskId& to) {
    std::unordered_set<TaskId> visited;
    std::stack<TaskId> dfs_stack;
    dfs_stack.push(from);

    while (!dfs_stack.empty()) {
        auto node = dfs_stack.top();
        dfs_stack.pop();
        if (node == to) return true;
        if (!visited.insert(node).second) continue;

        auto it = tasks.find(node);
        if (it == tasks.end()) continue;
        for (const auto& next : it->second.dependencies) {
            if (!visited.contains(next)) dfs_stack.push(next);
        }
    }
    return false;
}

// ─────────────────────────────────────────────
// Query Methods
// ─────────────────────────────────────────────

std::optional<Task> DependencyGraph::get_task(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::optional<TaskState> DependencyGraph::state_of(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second.state;
}

std::optional<std::string> DependencyGraph::result_of(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() || it->second.state != TaskState::Completed) return std::nullopt;
    return it->second.result;
}

bool DependencyGraph::contains(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    return tasks_.contains(id);
}

size_t DependencyGraph::task_count() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

std::vector<TaskId> DependencyGraph::task_ids() const {
    std::lock_guard lock(mutex_);
    return order_;
}

std::vector<TaskId> DependencyGraph::dependencies(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return {};
    return {it->second.dependencies.begin(), it->second.dependencies.end()};
}

std::vector<TaskId> DependencyGraph::dependents(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return {};
    return {it->second.dependents.begin(), it->second.dependents.end()};
}

std::vector<Edge> DependencyGraph::edges() const {
    std::lock_guard lock(mutex_);
    std::vector<Edge> result;
    for (const auto& [id, task] : tasks_) {
        for (const auto& dep_id : task.dependencies) {
            result.push_back(Edge{id, dep_id});
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<TaskId> DependencyGraph::tasks_in_state(TaskState state) const {
    std::lock_guard lock(mutex_);
    std::vector<TaskId> result;
    for (const auto& id : order_) {
        if (tasks_.at(id).state == state) result.push_back(id);
    }
    return result;
}

StateCounts DependencyGraph::counts() const {
    std::lock_guard lock(mutex_);
    StateCounts c;
    for (const auto& [id, task] : tasks_) {
        switch (task.state) {
            case TaskState::Pending:   ++c.pending; break;
            case TaskState::Ready:     ++c.ready; break;
            case TaskState::Running:   ++c.running; break;
            case TaskState::Blocked:   ++c.blocked; break;
            case TaskState::Completed: ++c.completed; break;
            case TaskState::Failed:    ++c.failed; break;
        }
    }
    return c;
}

bool DependencyGraph::all_terminal() const {
    std::lock_guard lock(mutex_);
    return std::all_of(tasks_.begin(), tasks_.end(),
                       [](const auto& entry) { return is_terminal(entry.second.state); });
}

// ─────────────────────────────────────────────
// Maintenance
// ─────────────────────────────────────────────

size_t DependencyGraph::collect_terminal(const std::function<bool(const Task&)>& policy) {
    std::lock_guard lock(mutex_);

    std::vector<TaskId> doomed;
    for (const auto& id : order_) {
        const auto& task = tasks_.at(id);
        if (is_terminal(task.state) && task.dependents.empty() && policy(task)) {
            doomed.push_back(id);
        }
    }

    for (const auto& id : doomed) {
        for (const auto& dep_id : tasks_.at(id).dependencies) {
            if (auto dep_it = tasks_.find(dep_id); dep_it != tasks_.end()) {
                dep_it->second.dependents.erase(id);
            }
        }
        tasks_.erase(id);
    }

    std::unordered_set<TaskId> removed(doomed.begin(), doomed.end());
    std::erase_if(order_, [&removed](const TaskId& id) { return removed.contains(id); });
    return doomed.size();
}

std::vector<TaskRecord> DependencyGraph::export_state() const {
    std::lock_guard lock(mutex_);

    std::vector<TaskRecord> records;
    records.reserve(order_.size());
    for (const auto& id : order_) {
        const auto& task = tasks_.at(id);
        records.push_back(TaskRecord{
            .id = task.id,
            .description = task.description,
            .parent_id = task.parent_id,
            .priority = task.priority,
            .dependencies = {task.dependencies.begin(), task.dependencies.end()},
            .state = task.state,
            .progress = task.progress,
            .checkpoint = task.checkpoint,
            .result = task.result,
            .error = task.error,
            .created_at = task.created_at,
            .started_at = task.started_at,
            .completed_at = task.completed_at,
            .attempts = task.attempts
        });
    }
    return records;
}

Result<void> DependencyGraph::import_state(const std::vector<TaskRecord>& records,
                                           const ExecutorResolver& resolver) {
    std::lock_guard lock(mutex_);

    // Stage into copies so a bad snapshot leaves the live graph untouched.
    TaskMap staged = tasks_;
    std::vector<TaskId> staged_order = order_;

    for (const auto& record : records) {
        if (record.id.empty()) {
            return Error{ErrorCode::InvalidArgument, "Snapshot contains a task without id"};
        }
        if (staged.contains(record.id)) {
            return Error{ErrorCode::DuplicateTask, "Task already exists: " + record.id};
        }

        Task task;
        task.id = record.id;
        task.description = record.description;
        task.executor = resolver ? resolver(record) : TaskExecutor{};
        // Work that was in flight when the snapshot was taken is re-run from its checkpoint.
        task.state = is_terminal(record.state) ? record.state : TaskState::Pending;
        task.priority = record.priority;
        task.progress = record.progress;
        task.checkpoint = record.checkpoint;
        task.result = record.result;
        task.error = record.error;
        task.created_at = record.created_at;
        task.started_at = record.started_at;
        task.completed_at = record.completed_at;
        task.parent_id = record.parent_id;
        task.attempts = record.attempts;

        staged.emplace(task.id, std::move(task));
        staged_order.push_back(record.id);
    }

    for (const auto& record : records) {
        for (const auto& dep_id : record.dependencies) {
            auto dep_it = staged.find(dep_id);
            if (dep_it == staged.end()) {
                return Error{ErrorCode::UnknownDependency,
                             "Task " + record.id + " depends on unknown task " + dep_id};
            }
            if (dep_id == record.id) {
                return Error{ErrorCode::CircularDependency,
                             "Task " + record.id + " cannot depend on itself"};
            }
            if (dep_it->second.state == TaskState::Completed) continue;
            staged.at(record.id).dependencies.insert(dep_id);
            dep_it->second.dependents.insert(record.id);
        }
    }

    if (!kahn_order(staged, staged_order)) {
        return Error{ErrorCode::CircularDependency, "Snapshot dependencies contain a cycle"};
    }

    tasks_.swap(staged);
    order_.swap(staged_order);
    return {};
}

}  // namespace dynamic_scheduler
