/**
 * @file config.hpp
 * @brief Scheduler configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

namespace dynamic_scheduler {

struct SchedulerConfig {
    uint32_t max_workers = 4;
    uint32_t tick_interval_ms = 5;       ///< Sleep between idle passes of the run loop
    uint32_t run_timeout_ms = 0;         ///< 0 = no wall-clock limit
    FailurePolicy failure_policy = FailurePolicy::LeaveBlocked;
};

struct SuggesterConfig {
    bool enabled = false;
    double similarity_threshold = 0.3;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    LogLevel log_level = LogLevel::Info;
    bool metrics = false;                ///< Record task events as NDJSON metrics
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    SchedulerConfig scheduler;
    SuggesterConfig suggester;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Parse a failure policy name ("leave_blocked", "cascade").
 */
Result<FailurePolicy> parse_failure_policy(std::string_view name);

}  // namespace dynamic_scheduler
