/**
 * @file task_runner.cpp
 * @brief TaskRunner implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/task_runner.hpp"

#include "executor/task_context.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace dynamic_scheduler {

ExecutionResult TaskRunner::execute(const Task& task,
                                    DependencyGraph& graph,
                                    std::stop_token stop,
                                    Logger* logger) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
    };

    if (!task.executor) {
        return ExecutionResult{
            .task_id = task.id,
            .outcome = Failed{Error{ErrorCode::TaskExecution,
                                    "Task " + task.id + " has no executor"}},
            .actual_duration = Duration{0},
            .attempt = task.attempts
        };
    }

    TaskContext ctx(graph, task.id, task.checkpoint, task.attempts, std::move(stop), logger);

    TaskOutcome outcome;
    try {
        outcome = task.executor(ctx);
    } catch (const std::exception& e) {
        outcome = Failed{Error{ErrorCode::TaskExecution, e.what()}};
    } catch (...) {
        outcome = Failed{Error{ErrorCode::TaskExecution,
                               "Task " + task.id + " threw a non-standard exception"}};
    }

    // Once a wait is armed the task is suspended (or failed) no matter
    // what the executor returned afterwards.
    if (const auto& armed = ctx.armed_outcome()) {
        outcome = *armed;
    }

    return ExecutionResult{
        .task_id = task.id,
        .outcome = std::move(outcome),
        .actual_duration = elapsed(),
        .attempt = task.attempts
    };
}

}  // namespace dynamic_scheduler
