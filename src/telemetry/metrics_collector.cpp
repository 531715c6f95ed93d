/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace dynamic_scheduler {

namespace {

/// Time since first dispatch, zero for tasks that never ran.
Duration elapsed_since_start(const Task& task) {
    if (!task.started_at) return Duration{0};
    auto end = task.completed_at.value_or(std::chrono::system_clock::now());
    return std::chrono::duration_cast<Duration>(end - *task.started_at);
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::attach(Scheduler& scheduler) {
    scheduler.on_task_start([this](const Task& task) {
        record_task_event(task.id, TaskState::Running, Duration{0});
    });
    scheduler.on_task_complete([this](const Task& task) {
        record_task_event(task.id, TaskState::Completed, elapsed_since_start(task));
    });
    scheduler.on_task_blocked([this](const Task& task, const TaskId& dependency) {
        record_task_event(task.id, TaskState::Blocked, elapsed_since_start(task), dependency);
    });
    scheduler.on_task_failed([this](const Task& task, const Error& error) {
        record_task_event(task.id, TaskState::Failed, elapsed_since_start(task), error.message);
    });
}

void MetricsCollector::record_task_event(const TaskId& id, TaskState state, Duration duration,
                                         std::string_view detail) {
    std::ostringstream oss;
    oss << R"({"event":"task_state_change")"
        << R"(,"task":")" << json_escape(id) << "\""
        << R"(,"state":")" << to_string(state) << "\""
        << R"(,"duration_us":)" << duration.count();
    if (!detail.empty()) {
        oss << R"(,"detail":")" << json_escape(detail) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_run(const RunReport& report) {
    std::ostringstream oss;
    oss << R"({"outcome":")" << to_string(report.outcome) << "\""
        << R"(,"completed":)" << report.counts.completed
        << R"(,"failed":)" << report.counts.failed
        << R"(,"incomplete":)" << report.incomplete.size()
        << R"(,"dispatched":)" << report.dispatched
        << R"(,"duration_us":)" << report.elapsed.count()
        << "}";
    record_custom("run_complete", oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace dynamic_scheduler
