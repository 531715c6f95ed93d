/**
 * @file report.hpp
 * @brief Human-readable views of a graph: progress board and run summary.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "graph/dependency_graph.hpp"
#include "scheduler/scheduler.hpp"

#include <optional>
#include <string>

namespace dynamic_scheduler {

/**
 * @brief Progress board grouped by state.
 *
 * @code
 *   === TASK PROGRESS ===
 *   Progress: 2/4 completed (50.0%)
 *   Running: 1, Ready: 0, Blocked: 1, Pending: 0, Failed: 0
 *
 *   BLOCKED:
 *     ~ report (waits on: fetch.sub-1)
 *   COMPLETED:
 *     + fetch [0.012s]
 * @endcode
 */
[[nodiscard]] std::string render_progress(const DependencyGraph& graph);

/**
 * @brief Totals and one line per task with status, result or error, and
 *        duration. Includes the run outcome when a report is given.
 */
[[nodiscard]] std::string summarize(const DependencyGraph& graph,
                                    const std::optional<RunReport>& report = std::nullopt);

}  // namespace dynamic_scheduler
