/**
 * @file main.cpp
 * @brief DynamicScheduler command-line driver.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into a runnable pipeline:
 *   Config → Logger → Scheduler (graph + pool + suggester) → Telemetry → Report
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/task_context.hpp"
#include "scheduler/report.hpp"
#include "scheduler/scheduler.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace dynamic_scheduler;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║         DynamicScheduler v1.0.0           ║
  ║   Dependency-aware task scheduling with   ║
  ║   runtime suspension and resumption       ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::optional<uint32_t> workers;
    std::optional<uint32_t> timeout_ms;
    std::string log_dir;
    bool demo_mode = false;
};

uint32_t parse_count(const std::string& flag, const std::string& value) {
    try {
        auto parsed = std::stol(value);
        if (parsed < 0) throw std::out_of_range(value);
        return static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        std::cerr << "Invalid value for " << flag << ": " << value << std::endl;
        std::exit(2);
    }
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--workers" && i + 1 < argc) {
            args.workers = parse_count(arg, argv[++i]);
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            args.timeout_ms = parse_count(arg, argv[++i]);
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: dynamic_scheduler [OPTIONS]\n"
                      << "  --config <path>      Configuration file (default: config/default.toml)\n"
                      << "  --workers <n>        Maximum concurrent tasks\n"
                      << "  --timeout-ms <ms>    Wall-clock limit for the run (0 = none)\n"
                      << "  --log-dir <path>     Log output directory\n"
                      << "  --demo               Run the demo pipeline, then exit\n"
                      << "  --help, -h           Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

/**
 * @brief Diamond pipeline plus a runtime-spawned subtask and a suggested edge.
 *
 *        load
 *       /    \
 *    clean  stats
 *       \    /
 *       report ──waits on──▶ report.sub-<n> (spawned at runtime)
 *         ▲
 *      publish  (edge inferred from "after report is done")
 */
Result<void> build_demo(Scheduler& scheduler) {
    auto step = [](std::string result, std::chrono::milliseconds work) {
        return [result = std::move(result), work](TaskContext& ctx) -> TaskOutcome {
            std::this_thread::sleep_for(work / 2);
            ctx.progress(0.5);
            std::this_thread::sleep_for(work / 2);
            return Completed{result};
        };
    };

    auto report = [](TaskContext& ctx) -> TaskOutcome {
        if (const auto& child = ctx.checkpoint_state(); !child.empty()) {
            auto charts = ctx.result_of(child).value_or("no charts");
            return Completed{"report with " + charts};
        }
        auto child = ctx.spawn_subtask("render charts", [](TaskContext&) -> TaskOutcome {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return Completed{"3 charts"};
        });
        if (!child) return Failed{child.error()};
        ctx.checkpoint(*child);
        return ctx.wait_for(*child);
    };

    auto chain = [](Result<TaskId> added) -> Result<void> {
        if (!added) return added.error();
        return {};
    };

    if (auto r = chain(scheduler.add_task("load", "load raw records",
                                          step("1000 rows", std::chrono::milliseconds(30)))); !r)
        return r;
    if (auto r = chain(scheduler.add_task("clean", "clean records",
                                          step("980 rows", std::chrono::milliseconds(40)),
                                          {"load"})); !r)
        return r;
    if (auto r = chain(scheduler.add_task("stats", "compute statistics",
                                          step("mean=4.2", std::chrono::milliseconds(25)),
                                          {"load"}, 1)); !r)
        return r;
    if (auto r = chain(scheduler.add_task("report", "assemble report", report,
                                          {"clean", "stats"})); !r)
        return r;
    return chain(scheduler.add_task("publish", "publish after report is done",
                                    step("published", std::chrono::milliseconds(10))));
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.workers) config.scheduler.max_workers = *args.workers;
    if (args.timeout_ms) config.scheduler.run_timeout_ms = *args.timeout_ms;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (config.scheduler.max_workers == 0) {
        std::cerr << "--workers must be positive" << std::endl;
        return 2;
    }

    if (!args.demo_mode) {
        std::cout << "Configuration: workers=" << config.scheduler.max_workers
                  << " timeout_ms=" << config.scheduler.run_timeout_ms
                  << " failure_policy=" << to_string(config.scheduler.failure_policy) << "\n"
                  << "Nothing to schedule. Use --demo to run the demo pipeline." << std::endl;
        return 0;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "dynamic_scheduler",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }

    config.suggester.enabled = true;
    Scheduler scheduler(SchedulerOptions{.config = config, .log_sink = std::move(log_sink)});
    scheduler.logger().info("DynamicScheduler starting...");

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<MetricsCollector> metrics;
    if (config.telemetry.metrics && !config.telemetry.log_dir.empty()) {
        metrics = std::make_unique<MetricsCollector>(std::make_unique<JsonFileSink>(
            config.telemetry.log_dir, "metrics",
            config.telemetry.max_file_size_mb, config.telemetry.rotate_count));
        metrics->attach(scheduler);
    }

    if (auto built = build_demo(scheduler); !built) {
        std::cerr << "Failed to build demo graph: " << built.error().message << std::endl;
        return 1;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (auto started = scheduler.start(); !started) {
        std::cerr << started.error().message << std::endl;
        return 1;
    }
    while (scheduler.is_running()) {
        if (g_shutdown_requested) {
            scheduler.logger().info("Shutdown requested. Draining...");
            scheduler.stop();
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    auto report = scheduler.wait();

    std::cout << render_progress(scheduler.graph()) << "\n";
    if (!report) {
        std::cout << summarize(scheduler.graph()) << "\n";
        std::cerr << "Run failed: " << report.error().message << std::endl;
        return 1;
    }
    std::cout << summarize(scheduler.graph(), *report) << std::endl;

    if (metrics) {
        metrics->record_run(*report);
        metrics->flush();
    }
    scheduler.logger().info("DynamicScheduler stopped.");
    scheduler.logger().flush();
    return report->outcome == RunOutcome::AllTerminal && report->counts.failed == 0 ? 0 : 1;
}
