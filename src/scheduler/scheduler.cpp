/**
 * @file scheduler.cpp
 * @brief Scheduler control loop.
 * @author Dimitris Kafetzis
 *
 * Each pass:
 *   1. Harvest finished futures and apply their outcome to the graph
 *   2. Under the cascade policy, fail tasks that gained an edge to a failed
 *      task; then resume blocked tasks whose dependencies have all completed
 *   3. Promote ready tasks and dispatch them up to pool capacity
 *   4. Detect termination, deadlock or timeout
 *   5. Sleep one tick if nothing moved
 */

#include "scheduler/scheduler.hpp"

#include "suggest/pattern_suggester.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <exception>

namespace dynamic_scheduler {

namespace {

struct ActiveGuard {
    std::atomic<bool>& flag;
    ~ActiveGuard() { flag.store(false); }
};

std::unique_ptr<ILogSink> sink_or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

std::string micros(Duration d) {
    return std::to_string(d.count()) + "us";
}

}  // anonymous namespace

// ── DeadlockReport ───────────────────────────

std::string DeadlockReport::describe() const {
    std::string out;
    for (const auto& task : stuck) {
        if (!out.empty()) out += "; ";
        out += task.id + " (" + std::string{to_string(task.state)} + ") awaits [";
        for (size_t i = 0; i < task.awaiting.size(); ++i) {
            if (i > 0) out += ", ";
            out += task.awaiting[i].first + " ("
                 + std::string{to_string(task.awaiting[i].second)} + ")";
        }
        out += "]";
    }
    return out;
}

// ── Construction ─────────────────────────────

Scheduler::Scheduler() : Scheduler(SchedulerOptions{}) {}

Scheduler::Scheduler(SchedulerConfig config)
    : Scheduler(SchedulerOptions{.config = Config{.scheduler = config}, .log_sink = nullptr}) {}

Scheduler::Scheduler(SchedulerOptions opts)
    : config_(std::move(opts.config))
    , logger_(sink_or_null(std::move(opts.log_sink)), config_.telemetry.log_level)
    , pool_(config_.scheduler.max_workers) {
    if (config_.suggester.enabled) {
        suggester_ = std::make_unique<PatternSuggester>(config_.suggester.similarity_threshold);
    }
    logger_.debug("Scheduler created: workers=" + std::to_string(pool_.thread_count())
                  + " policy=" + std::string{to_string(config_.scheduler.failure_policy)});
}

Scheduler::~Scheduler() {
    stop();
    if (control_thread_.joinable()) {
        control_thread_.join();
    }
}

// ── Task Submission ──────────────────────────

Result<TaskId> Scheduler::add_task(TaskId id,
                                   std::string description,
                                   TaskExecutor executor,
                                   std::vector<TaskId> dependencies,
                                   int priority) {
    Task task;
    task.id = id.empty() ? graph_.generate_id("task-") : std::move(id);
    task.description = description;
    task.executor = std::move(executor);
    task.priority = priority;
    task.dependencies.insert(dependencies.begin(), dependencies.end());

    auto added = graph_.add_task(std::move(task));
    if (!added) {
        logger_.warn("Rejected task: " + added.error().message);
        return added;
    }
    logger_.debug("Task added: " + *added + " \"" + description + "\"");

    if (suggester_) {
        apply_suggester(*added, description);
    }
    return added;
}

Result<void> Scheduler::add_dependency(const TaskId& task_id, const TaskId& dep_id) {
    auto result = graph_.add_dependency(task_id, dep_id);
    if (!result) {
        logger_.warn("Rejected edge " + task_id + " -> " + dep_id + ": " + result.error().message);
    }
    return result;
}

Result<void> Scheduler::remove_dependency(const TaskId& task_id, const TaskId& dep_id) {
    return graph_.remove_dependency(task_id, dep_id);
}

void Scheduler::set_suggester(std::unique_ptr<IDependencySuggester> suggester) {
    suggester_ = std::move(suggester);
}

void Scheduler::apply_suggester(const TaskId& id, const std::string& description) {
    std::vector<KnownTask> known;
    for (const auto& other : graph_.task_ids()) {
        if (other == id) continue;
        if (auto task = graph_.get_task(other)) {
            known.push_back(KnownTask{task->id, task->description});
        }
    }

    auto outcome = apply_suggestions(graph_, suggester_->suggest(id, description, known));
    for (const auto& s : outcome.accepted) {
        logger_.info("Suggested edge " + s.dependent + " -> " + s.dependency
                     + " (" + s.pattern + ", score " + std::to_string(s.score) + ")");
    }
    for (const auto& [s, error] : outcome.rejected) {
        logger_.debug("Suggested edge " + s.dependent + " -> " + s.dependency
                      + " rejected: " + error.message);
    }
}

// ── Lifecycle ────────────────────────────────

std::stop_token Scheduler::arm_stop_source() {
    std::lock_guard lock(control_mutex_);
    // Executors left running by a timed-out run share the source, so a
    // later stop() still reaches them.
    if (stop_source_.stop_requested()) {
        stop_source_ = std::stop_source{};
    }
    last_deadlock_.reset();
    return stop_source_.get_token();
}

Result<RunReport> Scheduler::run(bool block, std::optional<std::chrono::milliseconds> timeout) {
    if (active_.exchange(true)) {
        return Error{ErrorCode::AlreadyRunning, "Scheduler is already running"};
    }
    ActiveGuard guard{active_};
    return run_loop(block, timeout, arm_stop_source());
}

Result<void> Scheduler::start(std::optional<std::chrono::milliseconds> timeout) {
    if (active_.exchange(true)) {
        return Error{ErrorCode::AlreadyRunning, "Scheduler is already running"};
    }
    if (control_thread_.joinable()) {
        control_thread_.join();
    }

    auto token = arm_stop_source();
    std::promise<Result<RunReport>> promise;
    background_ = promise.get_future();

    control_thread_ = std::jthread([this, timeout, token, p = std::move(promise)]() mutable {
        std::optional<Result<RunReport>> result;
        {
            ActiveGuard guard{active_};
            try {
                result.emplace(run_loop(true, timeout, token));
            } catch (const std::exception& e) {
                result.emplace(Error{ErrorCode::Generic,
                                     std::string{"Control loop aborted: "} + e.what()});
            }
        }
        p.set_value(std::move(*result));
    });
    return {};
}

Result<RunReport> Scheduler::wait() {
    if (!background_.valid()) {
        return Error{ErrorCode::InvalidArgument, "Scheduler was not started"};
    }
    auto result = background_.get();
    if (control_thread_.joinable()) {
        control_thread_.join();
    }
    return result;
}

void Scheduler::stop() {
    std::lock_guard lock(control_mutex_);
    stop_source_.request_stop();
}

Result<RunReport> Scheduler::run_loop(bool block,
                                      std::optional<std::chrono::milliseconds> timeout,
                                      std::stop_token stop) {
    const auto started = std::chrono::steady_clock::now();
    if (!timeout && config_.scheduler.run_timeout_ms > 0) {
        timeout = std::chrono::milliseconds(config_.scheduler.run_timeout_ms);
    }
    std::optional<SteadyTime> deadline;
    if (timeout) deadline = started + *timeout;

    run_stop_ = stop;
    const auto tick = std::chrono::milliseconds(std::max<uint32_t>(config_.scheduler.tick_interval_ms, 1));
    size_t dispatched = 0;

    logger_.info("Run started: tasks=" + std::to_string(graph_.task_count())
                 + " workers=" + std::to_string(capacity()));

    for (;;) {
        bool progressed = harvest();

        if (stop.stop_requested()) {
            logger_.info("Stop requested, draining " + std::to_string(in_flight_.size())
                         + " in-flight task(s)");
            drain();
            return make_report(RunOutcome::Stopped, started, dispatched);
        }

        size_t launched = dispatch(stop);
        dispatched += launched;
        progressed = progressed || launched > 0;

        if (in_flight_.empty()) {
            if (graph_.all_terminal()) {
                return make_report(RunOutcome::AllTerminal, started, dispatched);
            }
            if (graph_.ready_queue().empty()) {
                if (auto deadlock = find_deadlock()) {
                    auto message = "Deadlock: " + std::to_string(deadlock->stuck.size())
                                 + " task(s) cannot progress: " + deadlock->describe();
                    logger_.error(message);
                    {
                        std::lock_guard lock(control_mutex_);
                        last_deadlock_ = std::move(deadlock);
                    }
                    return Error{ErrorCode::Deadlock, message};
                }
            }
        }

        if (!block) {
            return make_report(RunOutcome::Yielded, started, dispatched);
        }

        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            auto report = make_report(RunOutcome::TimedOut, started, dispatched);
            logger_.warn("Run timed out with " + std::to_string(report.incomplete.size())
                         + " incomplete task(s)");
            return report;
        }

        if (!progressed) {
            std::this_thread::sleep_for(tick);
        }
    }
}

// ── Dispatch ─────────────────────────────────

size_t Scheduler::dispatch(std::stop_token stop) {
    cascade_failed_dependencies();
    resume_satisfied();
    graph_.get_ready_tasks();

    size_t launched = 0;
    for (const auto& id : graph_.ready_queue()) {
        if (in_flight_.size() >= capacity()) break;

        if (auto running = graph_.mark_running(id); !running) {
            logger_.warn("Cannot dispatch " + id + ": " + running.error().message);
            continue;
        }
        auto task = graph_.get_task(id);
        if (!task) continue;

        logger_.info("Dispatching " + id + " (attempt " + std::to_string(task->attempts) + ")");
        for (const auto& hook : start_hooks_) hook(*task);

        in_flight_.emplace(id, pool_.submit([this, task = std::move(*task), stop]() {
            return task_runner_.execute(task, graph_, stop, &logger_);
        }));
        ++launched;
    }
    return launched;
}

void Scheduler::cascade_failed_dependencies() {
    if (config_.scheduler.failure_policy != FailurePolicy::Cascade) return;
    if (graph_.counts().failed == 0) return;

    // Covers edges added after the failure: declared in add_task, through
    // add_dependency, or by a wait_for inside an executor.
    for (const auto& id : graph_.get_blocked_tasks()) {
        auto state = graph_.state_of(id);
        if (!state || is_terminal(*state)) continue;   // failed earlier in this sweep

        for (const auto& dep : graph_.dependencies(id)) {
            if (graph_.state_of(dep) == TaskState::Failed) {
                fail(id, Error{ErrorCode::DependencyFailed, "Dependency " + dep + " failed"});
                break;
            }
        }
    }
}

void Scheduler::resume_satisfied() {
    for (const auto& id : graph_.tasks_in_state(TaskState::Blocked)) {
        if (graph_.is_ready(id)) {
            resume(id);
        }
    }
}

void Scheduler::resume(const TaskId& id) {
    blocked_.erase(id);
    if (auto pending = graph_.mark_pending(id); !pending) {
        logger_.warn("Cannot resume " + id + ": " + pending.error().message);
        return;
    }
    logger_.info("Task " + id + " resumed");
}

// ── Harvest ──────────────────────────────────

bool Scheduler::harvest() {
    bool progressed = false;
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (it->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }

        ExecutionResult result;
        try {
            result = it->second.get();
        } catch (const std::exception& e) {
            result = ExecutionResult{
                .task_id = it->first,
                .outcome = Failed{Error{ErrorCode::TaskExecution, e.what()}},
                .actual_duration = Duration{0},
                .attempt = 0
            };
        }
        it = in_flight_.erase(it);
        apply(result);
        progressed = true;
    }
    return progressed;
}

void Scheduler::drain() {
    while (!in_flight_.empty()) {
        for (auto& [id, future] : in_flight_) {
            future.wait();
        }
        harvest();
    }
}

void Scheduler::apply(const ExecutionResult& result) {
    const auto& id = result.task_id;
    // After a stop, results are still applied but nothing is resumed; blocked
    // tasks stay blocked until the next run.
    const bool stopping = run_stop_.stop_requested();

    // Cascaded failure can overtake a running task; its late result is void.
    if (graph_.state_of(id) != TaskState::Running) {
        logger_.debug("Dropping result of " + id + ", no longer running");
        return;
    }

    if (const auto* completed = std::get_if<Completed>(&result.outcome)) {
        auto unblocked = graph_.mark_completed(id, completed->result);
        if (!unblocked) {
            logger_.error("Cannot complete " + id + ": " + unblocked.error().message);
            return;
        }
        logger_.info("Task " + id + " completed in " + micros(result.actual_duration));

        for (const auto& dependent : *unblocked) {
            if (!stopping && graph_.state_of(dependent) == TaskState::Blocked) {
                resume(dependent);
            }
        }
        if (auto task = graph_.get_task(id)) {
            for (const auto& hook : complete_hooks_) hook(*task);
        }
        return;
    }

    if (const auto* blocked = std::get_if<Blocked>(&result.outcome)) {
        if (auto marked = graph_.mark_blocked(id); !marked) {
            logger_.error("Cannot block " + id + ": " + marked.error().message);
            return;
        }
        blocked_[id] = blocked->dependency;
        logger_.info("Task " + id + " blocked on " + blocked->dependency);

        if (auto task = graph_.get_task(id)) {
            for (const auto& hook : blocked_hooks_) hook(*task, blocked->dependency);
        }
        // The dependency may have finished while the executor was returning.
        if (!stopping && graph_.is_ready(id)) {
            resume(id);
        }
        return;
    }

    fail(id, std::get<Failed>(result.outcome).error);
}

void Scheduler::fail(const TaskId& id, const Error& error) {
    auto cascaded = graph_.mark_failed(id, error, config_.scheduler.failure_policy);
    if (!cascaded) {
        logger_.error("Cannot fail " + id + ": " + cascaded.error().message);
        return;
    }
    blocked_.erase(id);
    logger_.error("Task " + id + " failed: " + error.message);

    if (auto task = graph_.get_task(id)) {
        for (const auto& hook : failed_hooks_) hook(*task, error);
    }
    for (const auto& dependent : *cascaded) {
        blocked_.erase(dependent);
        auto task = graph_.get_task(dependent);
        if (!task || !task->error) continue;
        logger_.warn("Task " + dependent + " failed by cascade from " + id);
        for (const auto& hook : failed_hooks_) hook(*task, *task->error);
    }
}

// ── Observation ──────────────────────────────

std::optional<DeadlockReport> Scheduler::find_deadlock() const {
    auto stuck_ids = graph_.get_blocked_tasks();
    if (stuck_ids.empty()) return std::nullopt;

    DeadlockReport report;
    for (const auto& id : stuck_ids) {
        StuckTask stuck{.id = id, .state = graph_.state_of(id).value_or(TaskState::Pending),
                        .awaiting = {}};
        for (const auto& dep : graph_.dependencies(id)) {
            auto dep_state = graph_.state_of(dep).value_or(TaskState::Pending);
            if (dep_state != TaskState::Completed) {
                stuck.awaiting.emplace_back(dep, dep_state);
            }
        }
        report.stuck.push_back(std::move(stuck));
    }
    return report;
}

RunReport Scheduler::make_report(RunOutcome outcome, SteadyTime started, size_t dispatched) {
    RunReport report;
    report.outcome = outcome;
    report.counts = graph_.counts();
    report.dispatched = dispatched;
    report.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
    for (const auto& id : graph_.task_ids()) {
        if (auto state = graph_.state_of(id); state && !is_terminal(*state)) {
            report.incomplete.push_back(id);
        }
    }

    logger_.info("Run finished: outcome=" + std::string{to_string(outcome)}
                 + " completed=" + std::to_string(report.counts.completed)
                 + " failed=" + std::to_string(report.counts.failed)
                 + " incomplete=" + std::to_string(report.incomplete.size())
                 + " elapsed=" + micros(report.elapsed));
    return report;
}

StatusSnapshot Scheduler::status() const {
    auto counts = graph_.counts();
    return StatusSnapshot{
        .running = counts.running,
        .blocked = counts.blocked,
        .pending = counts.pending + counts.ready,
        .completed = counts.completed,
        .failed = counts.failed
    };
}

std::optional<DeadlockReport> Scheduler::last_deadlock() const {
    std::lock_guard lock(control_mutex_);
    return last_deadlock_;
}

// ── Snapshots & Maintenance ──────────────────

Result<void> Scheduler::import_state(const std::vector<TaskRecord>& records,
                                     const ExecutorResolver& resolver) {
    if (is_running()) {
        return Error{ErrorCode::AlreadyRunning, "Cannot import while the scheduler is running"};
    }
    auto imported = graph_.import_state(records, resolver);
    if (!imported) {
        logger_.warn("Snapshot rejected: " + imported.error().message);
        return imported;
    }
    logger_.info("Imported " + std::to_string(records.size()) + " task record(s)");
    return imported;
}

size_t Scheduler::collect_terminal(const std::function<bool(const Task&)>& policy) {
    auto removed = graph_.collect_terminal(policy);
    if (removed > 0) {
        logger_.debug("Collected " + std::to_string(removed) + " terminal task(s)");
    }
    return removed;
}

}  // namespace dynamic_scheduler
