/**
 * @file task_runner.hpp
 * @brief Worker-side execution of a single task dispatch.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "graph/dependency_graph.hpp"
#include "graph/task.hpp"

#include <cstdint>
#include <stop_token>

namespace dynamic_scheduler {

struct ExecutionResult {
    TaskId task_id;
    TaskOutcome outcome;
    Duration actual_duration;
    uint32_t attempt;
};

/**
 * @brief Runs one dispatch of a task on a worker thread.
 *
 * Builds the TaskContext, invokes the executor and folds everything that can
 * happen into a TaskOutcome: an armed wait overrides the return value, and an
 * exception escaping the executor becomes Failed{TaskExecution}. The runner
 * never changes task state; the scheduler applies the outcome.
 */
class TaskRunner {
public:
    ExecutionResult execute(const Task& task,
                            DependencyGraph& graph,
                            std::stop_token stop,
                            Logger* logger = nullptr);
};

}  // namespace dynamic_scheduler
