/**
 * @file scheduler.hpp
 * @brief Scheduler facade: owns the graph and the worker pool and runs the
 *        dispatch loop.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Registering tasks and edges (explicit or suggested)
 *   2. Running the control loop, blocking or on a background thread
 *   3. Observing progress through status(), hooks and snapshots
 *
 * The control loop is the only writer of the running/blocked bookkeeping.
 * Task bodies reach the graph exclusively through their TaskContext.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/task_runner.hpp"
#include "executor/thread_pool.hpp"
#include "graph/dependency_graph.hpp"
#include "graph/snapshot.hpp"
#include "graph/task.hpp"
#include "suggest/dependency_suggester.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace dynamic_scheduler {

// ─────────────────────────────────────────────
// Run Reporting
// ─────────────────────────────────────────────

enum class RunOutcome : uint8_t {
    AllTerminal,   ///< Every task completed or failed
    Stopped,       ///< stop() was requested; in-flight work drained
    TimedOut,      ///< Wall-clock limit reached; see RunReport::incomplete
    Yielded        ///< Non-blocking pass returned with work outstanding
};

[[nodiscard]] constexpr std::string_view to_string(RunOutcome outcome) noexcept {
    switch (outcome) {
        case RunOutcome::AllTerminal: return "all_terminal";
        case RunOutcome::Stopped:     return "stopped";
        case RunOutcome::TimedOut:    return "timed_out";
        case RunOutcome::Yielded:     return "yielded";
    }
    return "unknown";
}

struct RunReport {
    RunOutcome outcome = RunOutcome::AllTerminal;
    StateCounts counts;
    std::vector<TaskId> incomplete;   ///< Non-terminal tasks, insertion order
    size_t dispatched = 0;            ///< Executor invocations during this run
    Duration elapsed{0};
};

/// Consistent per-state counts. `pending` includes Ready tasks.
struct StatusSnapshot {
    size_t running = 0;
    size_t blocked = 0;
    size_t pending = 0;
    size_t completed = 0;
    size_t failed = 0;
};

struct StuckTask {
    TaskId id;
    TaskState state;
    std::vector<std::pair<TaskId, TaskState>> awaiting;   ///< Unmet dependencies
};

/**
 * @brief Why the last run could not make progress.
 */
struct DeadlockReport {
    std::vector<StuckTask> stuck;

    /// "B (pending) awaits [A (failed)]; C (blocked) awaits [B (pending)]"
    [[nodiscard]] std::string describe() const;
};

struct SchedulerOptions {
    Config config;
    std::unique_ptr<ILogSink> log_sink;   ///< nullptr = discard log output
};

// ─────────────────────────────────────────────
// Scheduler
// ─────────────────────────────────────────────

class Scheduler {
public:
    using TaskHook = std::function<void(const Task&)>;
    using BlockedHook = std::function<void(const Task&, const TaskId& dependency)>;
    using FailedHook = std::function<void(const Task&, const Error&)>;

    Scheduler();
    explicit Scheduler(SchedulerOptions opts);
    explicit Scheduler(SchedulerConfig config);
    ~Scheduler();

    // Non-copyable, non-movable
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // ── Task Submission ──────────────────────

    /// Register a task. An empty id is replaced by a generated "task-<n>".
    /// The installed suggester, if any, runs on the description afterwards.
    Result<TaskId> add_task(TaskId id,
                            std::string description,
                            TaskExecutor executor,
                            std::vector<TaskId> dependencies = {},
                            int priority = 0);

    /// Rejected with InvalidTransition once `task_id` is Running or terminal.
    Result<void> add_dependency(const TaskId& task_id, const TaskId& dep_id);
    Result<void> remove_dependency(const TaskId& task_id, const TaskId& dep_id);

    // ── Lifecycle ────────────────────────────

    /// Run the control loop on the calling thread. With block=false a single
    /// scheduling pass is made. Without an explicit timeout the configured
    /// run_timeout_ms applies (0 = none).
    Result<RunReport> run(bool block = true,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Run the control loop on a background thread; collect with wait().
    Result<void> start(std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    Result<RunReport> wait();

    /// Cooperative: no new dispatch, in-flight executors finish, blocked
    /// tasks stay blocked. Executors can observe it via stop_requested().
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return active_.load(); }

    // ── Observation ──────────────────────────
    [[nodiscard]] StatusSnapshot status() const;
    [[nodiscard]] std::optional<DeadlockReport> last_deadlock() const;

    /// Hooks run synchronously on the control thread. Register them before
    /// running.
    void on_task_start(TaskHook hook) { start_hooks_.push_back(std::move(hook)); }
    void on_task_complete(TaskHook hook) { complete_hooks_.push_back(std::move(hook)); }
    void on_task_blocked(BlockedHook hook) { blocked_hooks_.push_back(std::move(hook)); }
    void on_task_failed(FailedHook hook) { failed_hooks_.push_back(std::move(hook)); }

    // ── Snapshots & Maintenance ──────────────
    [[nodiscard]] std::vector<TaskRecord> export_state() const { return graph_.export_state(); }
    Result<void> import_state(const std::vector<TaskRecord>& records,
                              const ExecutorResolver& resolver);
    size_t collect_terminal(const std::function<bool(const Task&)>& policy);

    void set_suggester(std::unique_ptr<IDependencySuggester> suggester);

    // ── Accessors ────────────────────────────
    DependencyGraph& graph() { return graph_; }
    const DependencyGraph& graph() const { return graph_; }
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }
    [[nodiscard]] size_t capacity() const noexcept { return pool_.thread_count(); }

private:
    Result<RunReport> run_loop(bool block,
                               std::optional<std::chrono::milliseconds> timeout,
                               std::stop_token stop);
    std::stop_token arm_stop_source();

    size_t dispatch(std::stop_token stop);
    bool harvest();
    void drain();
    void apply(const ExecutionResult& result);
    void fail(const TaskId& id, const Error& error);
    void cascade_failed_dependencies();
    void resume_satisfied();
    void resume(const TaskId& id);
    void apply_suggester(const TaskId& id, const std::string& description);

    [[nodiscard]] std::optional<DeadlockReport> find_deadlock() const;
    RunReport make_report(RunOutcome outcome, SteadyTime started, size_t dispatched);

    Config config_;
    Logger logger_;
    DependencyGraph graph_;
    TaskRunner task_runner_;
    std::unique_ptr<IDependencySuggester> suggester_;

    std::vector<TaskHook> start_hooks_;
    std::vector<TaskHook> complete_hooks_;
    std::vector<BlockedHook> blocked_hooks_;
    std::vector<FailedHook> failed_hooks_;

    // Control-thread bookkeeping
    std::map<TaskId, std::future<ExecutionResult>> in_flight_;
    std::map<TaskId, TaskId> blocked_;   ///< task → dependency it suspended on
    std::stop_token run_stop_;           ///< Stop token of the current run

    mutable std::mutex control_mutex_;   ///< Guards stop_source_ and last_deadlock_
    std::stop_source stop_source_;
    std::optional<DeadlockReport> last_deadlock_;
    std::atomic<bool> active_{false};

    // Declared after everything the jobs touch, so workers join first.
    ThreadPool pool_;
    std::future<Result<RunReport>> background_;
    std::jthread control_thread_;
};

}  // namespace dynamic_scheduler
