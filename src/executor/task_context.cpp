/**
 * @file task_context.cpp
 * @brief TaskContext implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/task_context.hpp"

#include <utility>

namespace dynamic_scheduler {

TaskContext::TaskContext(DependencyGraph& graph,
                         TaskId task_id,
                         std::string checkpoint,
                         uint32_t attempt,
                         std::stop_token stop,
                         Logger* logger)
    : graph_(graph)
    , task_id_(std::move(task_id))
    , checkpoint_(std::move(checkpoint))
    , attempt_(attempt)
    , stop_(std::move(stop))
    , logger_(logger) {}

Result<TaskId> TaskContext::spawn_subtask(std::string description, TaskExecutor executor,
                                          bool wait) {
    Task child;
    child.id = graph_.generate_id(task_id_ + ".sub-");
    child.description = std::move(description);
    child.executor = std::move(executor);
    child.parent_id = task_id_;

    auto added = graph_.add_task(std::move(child));
    if (!added) return added.error();

    if (logger_) {
        logger_->debug("Task " + task_id_ + " spawned subtask " + *added);
    }

    if (wait) {
        auto outcome = wait_for(*added);
        if (auto* failed = std::get_if<Failed>(&outcome)) {
            return failed->error;
        }
    }
    return *added;
}

TaskOutcome TaskContext::wait_for(const TaskId& task_id) {
    if (!graph_.contains(task_id)) {
        Failed failed{Error{ErrorCode::MissingDependency,
                            "Task " + task_id_ + " waits on missing task " + task_id}};
        arm(failed);
        return failed;
    }

    auto edge = graph_.add_wait_edge(task_id_, task_id);
    if (!edge) {
        Failed failed{edge.error()};
        arm(failed);
        return failed;
    }

    Blocked blocked{task_id};
    arm(blocked);
    return blocked;
}

void TaskContext::arm(TaskOutcome outcome) {
    // The first failure wins; otherwise keep the first wait, later waits
    // only add edges.
    if (!armed_ || (std::holds_alternative<Failed>(outcome)
                    && !std::holds_alternative<Failed>(*armed_))) {
        armed_ = std::move(outcome);
    }
}

void TaskContext::checkpoint(std::string state) {
    checkpoint_ = state;
    // The task is registered for the lifetime of its run, so this cannot miss.
    if (auto saved = graph_.set_checkpoint(task_id_, std::move(state)); !saved && logger_) {
        logger_->warn("Checkpoint for " + task_id_ + " dropped: " + saved.error().message);
    }
}

void TaskContext::progress(double fraction) {
    if (auto updated = graph_.set_progress(task_id_, fraction); !updated && logger_) {
        logger_->warn("Progress for " + task_id_ + " dropped: " + updated.error().message);
        return;
    }
    if (logger_ && logger_->enabled(LogLevel::Debug)) {
        logger_->debug("Task " + task_id_ + " progress "
                       + std::to_string(static_cast<int>(fraction * 100)) + "%");
    }
}

std::optional<std::string> TaskContext::result_of(const TaskId& task_id) const {
    return graph_.result_of(task_id);
}

}  // namespace dynamic_scheduler
