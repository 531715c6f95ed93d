/**
 * @file snapshot.hpp
 * @brief Serializable view of a task for crash-recovery snapshots.
 * @author Dimitris Kafetzis
 *
 * The scheduler core only produces and consumes these records; how they are
 * stored is up to the caller.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/task.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dynamic_scheduler {

struct TaskRecord {
    TaskId id;
    std::string description;
    std::optional<TaskId> parent_id;
    int priority = 0;
    std::vector<TaskId> dependencies;
    TaskState state = TaskState::Pending;
    double progress = 0.0;
    std::string checkpoint;
    std::string result;
    std::optional<Error> error;
    Timestamp created_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    uint32_t attempts = 0;
};

/**
 * @brief Supplies the executor for an imported record. Executors are code and
 *        never part of a snapshot.
 */
using ExecutorResolver = std::function<TaskExecutor(const TaskRecord&)>;

/**
 * @brief Directed edge: `task` cannot run until `dependency` has completed.
 */
struct Edge {
    TaskId task;
    TaskId dependency;

    auto operator<=>(const Edge&) const = default;
};

}  // namespace dynamic_scheduler
