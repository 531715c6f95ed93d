/**
 * @file test_task_context.cpp
 * @brief Unit tests for TaskContext and TaskRunner.
 * @author Dimitris Kafetzis
 */

#include "executor/task_context.hpp"
#include "executor/task_runner.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace dynamic_scheduler;

namespace {

TaskOutcome done(TaskContext&) { return Completed{"done"}; }

}  // namespace

class TaskContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        Task parent;
        parent.id = "parent";
        parent.description = "parent task";
        parent.executor = done;
        ASSERT_TRUE(graph_.add_task(parent));

        Task other;
        other.id = "other";
        other.description = "other task";
        other.executor = done;
        ASSERT_TRUE(graph_.add_task(other));

        graph_.get_ready_tasks();
        ASSERT_TRUE(graph_.mark_running("parent"));
    }

    TaskContext make_context(std::string checkpoint = {}) {
        return TaskContext(graph_, "parent", std::move(checkpoint), 1);
    }

    DependencyGraph graph_;
};

// ─── Subtasks ────────────────────────────────

TEST_F(TaskContextTest, SpawnSubtaskRegistersChildWithParent) {
    auto ctx = make_context();
    auto child = ctx.spawn_subtask("child work", done);
    ASSERT_TRUE(child);

    EXPECT_EQ(child->rfind("parent.sub-", 0), 0u);
    auto task = graph_.get_task(*child);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->parent_id, "parent");
    EXPECT_EQ(task->description, "child work");
    EXPECT_EQ(task->state, TaskState::Pending);

    // Without wait the parent is not suspended.
    EXPECT_FALSE(ctx.armed_outcome().has_value());
    EXPECT_TRUE(graph_.dependencies("parent").empty());
}

TEST_F(TaskContextTest, SpawnSubtaskIdsAreUnique) {
    auto ctx = make_context();
    auto first = ctx.spawn_subtask("one", done);
    auto second = ctx.spawn_subtask("two", done);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_NE(*first, *second);
}

TEST_F(TaskContextTest, SpawnSubtaskWithWaitSuspendsParent) {
    auto ctx = make_context();
    auto child = ctx.spawn_subtask("child work", done, true);
    ASSERT_TRUE(child);

    EXPECT_EQ(graph_.dependencies("parent"), std::vector<TaskId>{*child});
    ASSERT_TRUE(ctx.armed_outcome().has_value());
    const auto* blocked = std::get_if<Blocked>(&*ctx.armed_outcome());
    ASSERT_NE(blocked, nullptr);
    EXPECT_EQ(blocked->dependency, *child);
}

// ─── Waiting ─────────────────────────────────

TEST_F(TaskContextTest, WaitForAddsEdgeAndArmsBlocked) {
    auto ctx = make_context();
    auto outcome = ctx.wait_for("other");

    ASSERT_TRUE(std::holds_alternative<Blocked>(outcome));
    EXPECT_EQ(std::get<Blocked>(outcome).dependency, "other");
    EXPECT_EQ(graph_.dependencies("parent"), std::vector<TaskId>{"other"});
    EXPECT_TRUE(std::holds_alternative<Blocked>(*ctx.armed_outcome()));
}

TEST_F(TaskContextTest, WaitForMissingTaskFails) {
    auto ctx = make_context();
    auto outcome = ctx.wait_for("ghost");

    ASSERT_TRUE(std::holds_alternative<Failed>(outcome));
    EXPECT_EQ(std::get<Failed>(outcome).error.code, ErrorCode::MissingDependency);
    EXPECT_TRUE(std::holds_alternative<Failed>(*ctx.armed_outcome()));
}

TEST_F(TaskContextTest, WaitForSelfIsCircular) {
    auto ctx = make_context();
    auto outcome = ctx.wait_for("parent");

    ASSERT_TRUE(std::holds_alternative<Failed>(outcome));
    EXPECT_EQ(std::get<Failed>(outcome).error.code, ErrorCode::CircularDependency);
}

TEST_F(TaskContextTest, WaitForClosingCycleFails) {
    ASSERT_TRUE(graph_.add_dependency("other", "parent"));
    auto ctx = make_context();

    auto outcome = ctx.wait_for("other");
    ASSERT_TRUE(std::holds_alternative<Failed>(outcome));
    EXPECT_EQ(std::get<Failed>(outcome).error.code, ErrorCode::CircularDependency);
    EXPECT_TRUE(graph_.dependencies("parent").empty());
}

TEST_F(TaskContextTest, FailureOverridesEarlierWait) {
    auto ctx = make_context();
    (void)ctx.wait_for("other");
    (void)ctx.wait_for("ghost");

    ASSERT_TRUE(ctx.armed_outcome().has_value());
    EXPECT_TRUE(std::holds_alternative<Failed>(*ctx.armed_outcome()));
}

TEST_F(TaskContextTest, WaitForCompletedTaskStillArmsBlocked) {
    graph_.get_ready_tasks();
    ASSERT_TRUE(graph_.mark_running("other"));
    ASSERT_TRUE(graph_.mark_completed("other", "value"));

    auto ctx = make_context();
    auto outcome = ctx.wait_for("other");
    EXPECT_TRUE(std::holds_alternative<Blocked>(outcome));
    // The edge is already satisfied, so the task is immediately resumable.
    EXPECT_TRUE(graph_.is_ready("parent"));
    EXPECT_EQ(ctx.result_of("other"), "value");
}

// ─── Checkpoints & Progress ──────────────────

TEST_F(TaskContextTest, CheckpointPersistsToGraph) {
    auto ctx = make_context("step-1");
    EXPECT_EQ(ctx.checkpoint_state(), "step-1");

    ctx.checkpoint("step-2");
    EXPECT_EQ(ctx.checkpoint_state(), "step-2");
    EXPECT_EQ(graph_.get_task("parent")->checkpoint, "step-2");
}

TEST_F(TaskContextTest, ProgressIsClamped) {
    auto ctx = make_context();
    ctx.progress(2.0);
    EXPECT_DOUBLE_EQ(graph_.get_task("parent")->progress, 1.0);
    ctx.progress(0.25);
    EXPECT_DOUBLE_EQ(graph_.get_task("parent")->progress, 0.25);
}

TEST_F(TaskContextTest, ResultOfIncompleteTaskIsEmpty) {
    auto ctx = make_context();
    EXPECT_FALSE(ctx.result_of("other").has_value());
}

TEST_F(TaskContextTest, StopTokenIsVisible) {
    std::stop_source source;
    TaskContext ctx(graph_, "parent", "", 1, source.get_token());
    EXPECT_FALSE(ctx.stop_requested());
    source.request_stop();
    EXPECT_TRUE(ctx.stop_requested());
}

// ─── TaskRunner ──────────────────────────────

class TaskRunnerTest : public TaskContextTest {
protected:
    ExecutionResult run(TaskExecutor executor) {
        auto task = *graph_.get_task("parent");
        task.executor = std::move(executor);
        return runner_.execute(task, graph_, {}, &logger_);
    }

    TaskRunner runner_;
    Logger logger_{std::make_unique<MemorySink>(), LogLevel::Debug};
};

TEST_F(TaskRunnerTest, CompletedOutcomePassesThrough) {
    auto result = run([](TaskContext&) -> TaskOutcome { return Completed{"42"}; });
    EXPECT_EQ(result.task_id, "parent");
    EXPECT_EQ(result.attempt, 1u);
    ASSERT_TRUE(std::holds_alternative<Completed>(result.outcome));
    EXPECT_EQ(std::get<Completed>(result.outcome).result, "42");
}

TEST_F(TaskRunnerTest, ExceptionBecomesTaskExecutionFailure) {
    auto result = run([](TaskContext&) -> TaskOutcome {
        throw std::runtime_error("disk on fire");
    });
    ASSERT_TRUE(std::holds_alternative<Failed>(result.outcome));
    const auto& error = std::get<Failed>(result.outcome).error;
    EXPECT_EQ(error.code, ErrorCode::TaskExecution);
    EXPECT_EQ(error.message, "disk on fire");
}

TEST_F(TaskRunnerTest, NonStandardExceptionIsCaught) {
    auto result = run([](TaskContext&) -> TaskOutcome { throw 7; });
    ASSERT_TRUE(std::holds_alternative<Failed>(result.outcome));
    EXPECT_EQ(std::get<Failed>(result.outcome).error.code, ErrorCode::TaskExecution);
}

TEST_F(TaskRunnerTest, ArmedWaitOverridesReturnValue) {
    auto result = run([](TaskContext& ctx) -> TaskOutcome {
        (void)ctx.wait_for("other");
        return Completed{"ignored"};
    });
    ASSERT_TRUE(std::holds_alternative<Blocked>(result.outcome));
    EXPECT_EQ(std::get<Blocked>(result.outcome).dependency, "other");
}

TEST_F(TaskRunnerTest, ArmedWaitSurvivesException) {
    auto result = run([](TaskContext& ctx) -> TaskOutcome {
        (void)ctx.wait_for("other");
        throw std::runtime_error("late");
    });
    EXPECT_TRUE(std::holds_alternative<Blocked>(result.outcome));
}

TEST_F(TaskRunnerTest, MissingExecutorFails) {
    auto result = run(TaskExecutor{});
    ASSERT_TRUE(std::holds_alternative<Failed>(result.outcome));
    EXPECT_EQ(std::get<Failed>(result.outcome).error.code, ErrorCode::TaskExecution);
}

TEST_F(TaskRunnerTest, RunnerDoesNotChangeState) {
    (void)run([](TaskContext&) -> TaskOutcome { return Completed{"x"}; });
    EXPECT_EQ(graph_.state_of("parent"), TaskState::Running);
}
