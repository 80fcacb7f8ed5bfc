/**
 * @file config.hpp
 * @brief Dispatcher configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace task_dispatch {

struct CoordinatorConfig {
    uint32_t max_concurrent_agents = 4;
    uint32_t max_retries = 3;
    uint64_t task_timeout_default_ms = 300000;  ///< Scaled by task complexity
    uint64_t retry_backoff_base_ms = 1000;
    uint64_t retry_backoff_max_ms = 60000;
    uint64_t tick_interval_ms = 50;
    uint64_t cancel_grace_period_ms = 30000;
    uint64_t agent_wait_timeout_ms = 600000;    ///< ResourceExhausted after this
};

struct DecomposerConfig {
    bool model_assisted = true;
    uint64_t model_timeout_ms = 60000;
    uint32_t model_max_tokens = 4000;
};

struct ResolverConfig {
    double confidence_threshold = 0.6;
    bool model_refinement = true;
    uint32_t max_model_tasks = 20;
    std::vector<std::string> rules = {
        "artifact_match", "type_ordering", "resource_contention", "keyword_precedence"
    };
};

struct AgentsConfig {
    uint32_t pool_size_per_type = 2;
    std::map<std::string, uint32_t> pool_size;   ///< Per-blueprint overrides
    std::vector<std::string> blueprints = {
        "code_writer", "researcher", "tester", "reviewer", "documenter", "generalist"
    };
};

struct CheckpointConfig {
    bool enabled = true;
    std::filesystem::path dir = "./checkpoints";
    uint32_t interval_seconds = 60;
    uint32_t retention = 5;
};

struct BusConfig {
    uint32_t history_size = 1000;
    uint32_t subscriber_queue_bound = 1024;
    uint32_t max_delivery_attempts = 3;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool stdout_logs = false;
};

/**
 * @brief Top-level dispatcher configuration.
 */
struct Config {
    CoordinatorConfig coordinator;
    DecomposerConfig decomposer;
    ResolverConfig resolver;
    AgentsConfig agents;
    CheckpointConfig checkpoint;
    BusConfig bus;
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
 * @brief Reject out-of-range values (zero concurrency, threshold outside [0,1]).
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace task_dispatch
