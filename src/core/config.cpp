/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace dynamic_scheduler {

namespace {

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [scheduler]
    if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
        auto workers = scheduler["max_workers"].value_or(int64_t{4});
        if (workers <= 0) {
            return Error{ErrorCode::Config,
                         "scheduler.max_workers must be positive, got " + std::to_string(workers)};
        }
        config.scheduler.max_workers = static_cast<uint32_t>(workers);

        auto tick = scheduler["tick_interval_ms"].value_or(int64_t{5});
        if (tick <= 0) {
            return Error{ErrorCode::Config, "scheduler.tick_interval_ms must be positive"};
        }
        config.scheduler.tick_interval_ms = static_cast<uint32_t>(tick);

        auto timeout = scheduler["run_timeout_ms"].value_or(int64_t{0});
        if (timeout < 0) {
            return Error{ErrorCode::Config, "scheduler.run_timeout_ms must not be negative"};
        }
        config.scheduler.run_timeout_ms = static_cast<uint32_t>(timeout);

        auto policy = parse_failure_policy(
            scheduler["failure_policy"].value_or(std::string{"leave_blocked"}));
        if (!policy) return policy.error();
        config.scheduler.failure_policy = *policy;
    }

    // [suggester]
    if (auto suggester = tbl["suggester"]; suggester.is_table()) {
        config.suggester.enabled = suggester["enabled"].value_or(false);
        config.suggester.similarity_threshold =
            suggester["similarity_threshold"].value_or(0.3);
        if (config.suggester.similarity_threshold < 0.0
            || config.suggester.similarity_threshold > 1.0) {
            return Error{ErrorCode::Config,
                         "suggester.similarity_threshold must lie in [0, 1]"};
        }
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
        config.telemetry.max_file_size_mb = static_cast<uint32_t>(
            telemetry["max_file_size_mb"].value_or(int64_t{50}));
        config.telemetry.rotate_count = static_cast<uint32_t>(
            telemetry["rotate_count"].value_or(int64_t{5}));
        config.telemetry.metrics = telemetry["metrics"].value_or(false);

        auto level = parse_log_level(telemetry["log_level"].value_or(std::string{"info"}));
        if (!level) return level.error();
        config.telemetry.log_level = *level;
    }

    return config;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<FailurePolicy> parse_failure_policy(std::string_view name) {
    if (name == "leave_blocked") return FailurePolicy::LeaveBlocked;
    if (name == "cascade") return FailurePolicy::Cascade;
    return Error{ErrorCode::Config, "Unknown failure policy: " + std::string{name}};
}

}  // namespace dynamic_scheduler
