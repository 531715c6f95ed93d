/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "scheduler/scheduler.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace dynamic_scheduler {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * attach() subscribes to the scheduler's hooks; every task state change then
 * becomes one `task_state_change` line.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void attach(Scheduler& scheduler);

    void record_task_event(const TaskId& id, TaskState state, Duration duration,
                           std::string_view detail = {});
    void record_run(const RunReport& report);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace dynamic_scheduler
