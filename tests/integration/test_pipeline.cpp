/**
 * @file test_pipeline.cpp
 * @brief Integration tests exercising config, scheduler, telemetry and
 *        reporting together.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/task_context.hpp"
#include "scheduler/report.hpp"
#include "scheduler/scheduler.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

using namespace dynamic_scheduler;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

// ═══════════════════════════════════════════════
// Pipeline Tests
// ═══════════════════════════════════════════════

class PipelineIntegration : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "ds_test_pipeline";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    size_t line_count(const fs::path& path) const {
        std::ifstream in(path);
        size_t n = 0;
        for (std::string line; std::getline(in, line);) ++n;
        return n;
    }

    fs::path dir_;
};

TEST_F(PipelineIntegration, ConfiguredRunWritesLogsAndMetrics) {
    auto config = parse_config(R"(
        [scheduler]
        max_workers = 3
        tick_interval_ms = 1
        failure_policy = "cascade"

        [suggester]
        enabled = true

        [telemetry]
        log_level = "debug"
        metrics = true
    )");
    ASSERT_TRUE(config) << config.error().message;
    config->telemetry.log_dir = dir_;

    Scheduler scheduler(SchedulerOptions{
        .config = *config,
        .log_sink = std::make_unique<JsonFileSink>(dir_, "scheduler")});
    MetricsCollector metrics(std::make_unique<JsonFileSink>(dir_, "metrics"));
    metrics.attach(scheduler);

    auto quick = [](std::string r) {
        return [r](TaskContext& ctx) -> TaskOutcome {
            ctx.progress(0.5);
            return Completed{r};
        };
    };
    ASSERT_TRUE(scheduler.add_task("extract", "extract rows", quick("rows")));
    ASSERT_TRUE(scheduler.add_task("transform", "transform once extract is done", quick("t")));
    ASSERT_TRUE(scheduler.add_task("load", "load after transform", quick("l")));
    ASSERT_TRUE(scheduler.add_task("audit", "audit trail", [](TaskContext&) -> TaskOutcome {
        return Failed{Error{ErrorCode::TaskExecution, "audit store offline"}};
    }));
    ASSERT_TRUE(scheduler.add_task("notify", "notify after audit", quick("n")));

    EXPECT_EQ(scheduler.graph().dependencies("load"), std::vector<TaskId>{"transform"});

    auto report = scheduler.run();
    ASSERT_TRUE(report) << report.error().message;
    metrics.record_run(*report);
    metrics.flush();
    scheduler.logger().flush();

    EXPECT_EQ(report->outcome, RunOutcome::AllTerminal);
    EXPECT_EQ(report->counts.completed, 3u);
    EXPECT_EQ(report->counts.failed, 2u);
    EXPECT_EQ(scheduler.graph().get_task("notify")->error->code, ErrorCode::DependencyFailed);

    EXPECT_GT(line_count(dir_ / "scheduler.ndjson"), 5u);
    // notify never starts: 4 starts, 5 terminal events, 1 run record.
    EXPECT_EQ(line_count(dir_ / "metrics.ndjson"), 4u + 5u + 1u);

    auto summary = summarize(scheduler.graph(), *report);
    EXPECT_NE(summary.find("Outcome: all_terminal"), std::string::npos);
    EXPECT_NE(summary.find("error=dependency_failed"), std::string::npos);
}

TEST_F(PipelineIntegration, RecursiveSubtasksFanOutAndJoin) {
    Scheduler scheduler(SchedulerConfig{.max_workers = 4, .tick_interval_ms = 1});

    // Each node below depth 3 spawns two children, waits for both, then sums them.
    std::function<TaskOutcome(TaskContext&, int)> node;
    node = [&node](TaskContext& ctx, int depth) -> TaskOutcome {
        if (depth == 3) return Completed{"1"};
        if (const auto& state = ctx.checkpoint_state(); !state.empty()) {
            auto split = state.find('|');
            auto left = ctx.result_of(state.substr(0, split));
            auto right = ctx.result_of(state.substr(split + 1));
            if (!left || !right) return Failed{Error{"child result missing"}};
            return Completed{std::to_string(std::stoi(*left) + std::stoi(*right))};
        }
        auto child = [&node, depth](TaskContext& c) { return node(c, depth + 1); };
        auto left = ctx.spawn_subtask("left", child);
        auto right = ctx.spawn_subtask("right", child);
        if (!left || !right) return Failed{Error{"spawn failed"}};
        ctx.checkpoint(*left + "|" + *right);
        (void)ctx.wait_for(*left);
        return ctx.wait_for(*right);
    };

    ASSERT_TRUE(scheduler.add_task("root", "tree root",
                                   [&node](TaskContext& ctx) { return node(ctx, 0); }));

    auto report = scheduler.run(true, 10s);
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report->outcome, RunOutcome::AllTerminal);
    EXPECT_EQ(scheduler.graph().result_of("root"), "8");
    EXPECT_EQ(scheduler.graph().task_count(), 15u);
    EXPECT_EQ(report->counts.completed, 15u);
}

TEST_F(PipelineIntegration, BackgroundRunWithLiveStatus) {
    Scheduler scheduler(SchedulerConfig{.max_workers = 2, .tick_interval_ms = 1});
    std::atomic<int> finished{0};

    for (int i = 0; i < 12; ++i) {
        std::vector<TaskId> deps;
        if (i >= 2) deps.push_back("job-" + std::to_string(i - 2));
        ASSERT_TRUE(scheduler.add_task("job-" + std::to_string(i), "job",
            [&finished](TaskContext&) -> TaskOutcome {
                std::this_thread::sleep_for(2ms);
                ++finished;
                return Completed{"ok"};
            }, deps));
    }

    ASSERT_TRUE(scheduler.start());
    size_t peak_running = 0;
    while (scheduler.is_running()) {
        auto status = scheduler.status();
        peak_running = std::max(peak_running, status.running);
        EXPECT_EQ(status.running + status.blocked + status.pending + status.completed
                  + status.failed, 12u);
        std::this_thread::sleep_for(1ms);
    }

    auto report = scheduler.wait();
    ASSERT_TRUE(report);
    EXPECT_EQ(report->outcome, RunOutcome::AllTerminal);
    EXPECT_EQ(finished.load(), 12);
    EXPECT_LE(peak_running, 2u);

    auto board = render_progress(scheduler.graph());
    EXPECT_NE(board.find("Progress: 12/12 completed (100.0%)"), std::string::npos);
}

TEST_F(PipelineIntegration, SnapshotSurvivesRestart) {
    std::vector<TaskRecord> snapshot;
    {
        Scheduler scheduler(SchedulerConfig{.max_workers = 1, .tick_interval_ms = 1});
        ASSERT_TRUE(scheduler.add_task("a", "a", [](TaskContext&) -> TaskOutcome {
            return Completed{"A"};
        }));
        ASSERT_TRUE(scheduler.add_task("b", "b", [](TaskContext& ctx) -> TaskOutcome {
            ctx.checkpoint("halfway");
            while (!ctx.stop_requested()) std::this_thread::sleep_for(1ms);
            return Completed{"unreachable"};
        }, {"a"}));
        ASSERT_TRUE(scheduler.add_task("c", "c", [](TaskContext&) -> TaskOutcome {
            return Completed{"C"};
        }, {"b"}));

        ASSERT_TRUE(scheduler.start());
        auto checkpointed = [&scheduler] {
            for (int i = 0; i < 1000; ++i) {
                if (scheduler.graph().get_task("b")->checkpoint == "halfway") return true;
                std::this_thread::sleep_for(1ms);
            }
            return false;
        };
        ASSERT_TRUE(checkpointed());
        snapshot = scheduler.export_state();
        scheduler.stop();
        ASSERT_TRUE(scheduler.wait());
    }

    Scheduler restarted(SchedulerConfig{.max_workers = 1, .tick_interval_ms = 1});
    ASSERT_TRUE(restarted.import_state(snapshot, [](const TaskRecord& r) -> TaskExecutor {
        return [id = r.id](TaskContext& ctx) -> TaskOutcome {
            return Completed{id + " from " + (ctx.checkpoint_state().empty()
                                                  ? std::string{"scratch"}
                                                  : ctx.checkpoint_state())};
        };
    }));

    EXPECT_EQ(restarted.graph().state_of("a"), TaskState::Completed);
    EXPECT_EQ(restarted.graph().state_of("b"), TaskState::Pending);

    auto report = restarted.run();
    ASSERT_TRUE(report);
    EXPECT_EQ(restarted.graph().result_of("a"), "A");
    EXPECT_EQ(restarted.graph().result_of("b"), "b from halfway");
    EXPECT_EQ(restarted.graph().result_of("c"), "c from scratch");
}
