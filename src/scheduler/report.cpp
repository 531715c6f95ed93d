/**
 * @file report.cpp
 * @brief Progress board and run summary rendering.
 * @author Dimitris Kafetzis
 */

#include "scheduler/report.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <set>
#include <sstream>

namespace dynamic_scheduler {

namespace {

constexpr std::array<TaskState, 6> DISPLAY_ORDER = {
    TaskState::Running, TaskState::Ready, TaskState::Blocked,
    TaskState::Pending, TaskState::Completed, TaskState::Failed
};

char marker(TaskState state) {
    switch (state) {
        case TaskState::Completed: return '+';
        case TaskState::Running:   return '>';
        case TaskState::Blocked:   return '~';
        case TaskState::Failed:    return 'x';
        case TaskState::Pending:
        case TaskState::Ready:     return 'o';
    }
    return '?';
}

std::string upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string seconds(Duration d) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << std::chrono::duration<double>(d).count() << "s";
    return oss.str();
}

std::string join(const std::set<TaskId>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out;
}

}  // anonymous namespace

std::string render_progress(const DependencyGraph& graph) {
    auto counts = graph.counts();
    auto total = counts.total();

    std::ostringstream oss;
    oss << "=== TASK PROGRESS ===\n";
    oss << "Progress: " << counts.completed << "/" << total << " completed (" << std::fixed
        << std::setprecision(1)
        << (total == 0 ? 0.0 : 100.0 * static_cast<double>(counts.completed) / static_cast<double>(total))
        << "%)\n";
    oss << "Running: " << counts.running << ", Ready: " << counts.ready
        << ", Blocked: " << counts.blocked << ", Pending: " << counts.pending
        << ", Failed: " << counts.failed << "\n";

    for (auto state : DISPLAY_ORDER) {
        auto ids = graph.tasks_in_state(state);
        if (ids.empty()) continue;

        oss << "\n" << upper(to_string(state)) << ":\n";
        for (const auto& id : ids) {
            auto task = graph.get_task(id);
            if (!task) continue;
            oss << "  " << marker(state) << " " << id;
            if (!task->dependencies.empty()) {
                oss << " (waits on: " << join(task->dependencies) << ")";
            }
            if (state == TaskState::Running && task->progress > 0.0) {
                oss << " " << static_cast<int>(task->progress * 100) << "%";
            }
            if (auto d = task->duration()) {
                oss << " [" << seconds(*d) << "]";
            }
            oss << "\n";
        }
    }
    return oss.str();
}

std::string summarize(const DependencyGraph& graph, const std::optional<RunReport>& report) {
    auto counts = graph.counts();

    std::ostringstream oss;
    oss << "=== RUN SUMMARY ===\n";
    if (report) {
        oss << "Outcome: " << to_string(report->outcome)
            << " after " << seconds(report->elapsed)
            << " (" << report->dispatched << " dispatches)\n";
    }
    oss << "Total: " << counts.total() << ", Completed: " << counts.completed
        << ", Failed: " << counts.failed << ", Incomplete: " << counts.non_terminal() << "\n";

    for (const auto& id : graph.task_ids()) {
        auto task = graph.get_task(id);
        if (!task) continue;

        oss << "  " << marker(task->state) << " " << id << " [" << to_string(task->state) << "]";
        if (task->state == TaskState::Completed && !task->result.empty()) {
            oss << " result=\"" << task->result << "\"";
        }
        if (task->error) {
            oss << " error=" << to_string(task->error->code) << ": " << task->error->message;
        }
        if (auto d = task->duration()) {
            oss << " " << seconds(*d);
        }
        if (task->attempts > 1) {
            oss << " attempts=" << task->attempts;
        }
        oss << "\n";
    }
    return oss.str();
}

}  // namespace dynamic_scheduler
