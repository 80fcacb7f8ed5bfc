/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <string_view>

namespace task_dispatch {

namespace {

std::vector<std::string> string_array(const toml::node_view<toml::node>& node,
                                      std::vector<std::string> fallback) {
    auto* arr = node.as_array();
    if (!arr) return fallback;
    std::vector<std::string> out;
    for (const auto& elem : *arr) {
        if (auto value = elem.value<std::string>()) {
            out.push_back(*value);
        }
    }
    return out;
}

/// Reads non-negative integer keys; remembers the first out-of-range value.
class CountReader {
public:
    template <typename T>
    void read(toml::node_view<toml::node> section, std::string_view table, std::string_view key, T& target) {
        auto value = section[key].value<int64_t>();
        if (!value) return;
        if (!check(*value, std::numeric_limits<T>::max(), std::format("{}.{}", table, key))) return;
        target = static_cast<T>(*value);
    }

    bool check(int64_t value, uint64_t max, const std::string& name) {
        if (value >= 0 && static_cast<uint64_t>(value) <= max) return true;
        if (!error_) {
            error_ = Error{ErrorCode::Config,
                           std::format("{} must be a non-negative integer no larger than {}, got {}",
                                       name, max, value)};
        }
        return false;
    }

    [[nodiscard]] const std::optional<Error>& error() const { return error_; }

private:
    std::optional<Error> error_;
};

Result<Config> from_table(toml::table& tbl) {
    Config config;
    CountReader counts;

    // [coordinator]
    if (auto coord = tbl["coordinator"]; coord.is_table()) {
        auto& c = config.coordinator;
        counts.read(coord, "coordinator", "max_concurrent_agents", c.max_concurrent_agents);
        counts.read(coord, "coordinator", "max_retries", c.max_retries);
        counts.read(coord, "coordinator", "task_timeout_default_ms", c.task_timeout_default_ms);
        counts.read(coord, "coordinator", "retry_backoff_base_ms", c.retry_backoff_base_ms);
        counts.read(coord, "coordinator", "retry_backoff_max_ms", c.retry_backoff_max_ms);
        counts.read(coord, "coordinator", "tick_interval_ms", c.tick_interval_ms);
        counts.read(coord, "coordinator", "cancel_grace_period_ms", c.cancel_grace_period_ms);
        counts.read(coord, "coordinator", "agent_wait_timeout_ms", c.agent_wait_timeout_ms);
    }

    // [decomposer]
    if (auto dec = tbl["decomposer"]; dec.is_table()) {
        config.decomposer.model_assisted = dec["model_assisted"].value_or(config.decomposer.model_assisted);
        counts.read(dec, "decomposer", "model_timeout_ms", config.decomposer.model_timeout_ms);
        counts.read(dec, "decomposer", "model_max_tokens", config.decomposer.model_max_tokens);
    }

    // [resolver]
    if (auto res = tbl["resolver"]; res.is_table()) {
        config.resolver.confidence_threshold =
            res["confidence_threshold"].value_or(config.resolver.confidence_threshold);
        config.resolver.model_refinement = res["model_refinement"].value_or(config.resolver.model_refinement);
        counts.read(res, "resolver", "max_model_tasks", config.resolver.max_model_tasks);
        config.resolver.rules = string_array(res["rules"], config.resolver.rules);
    }

    // [agents]
    if (auto agents = tbl["agents"]; agents.is_table()) {
        counts.read(agents, "agents", "pool_size_per_type", config.agents.pool_size_per_type);
        config.agents.blueprints = string_array(agents["blueprints"], config.agents.blueprints);

        // [agents.pool_size]
        if (auto* sizes = agents["pool_size"].as_table()) {
            for (const auto& [name, value] : *sizes) {
                auto n = value.value<int64_t>();
                if (!n) continue;
                std::string blueprint{name.str()};
                if (counts.check(*n, std::numeric_limits<uint32_t>::max(), "agents.pool_size." + blueprint)) {
                    config.agents.pool_size[blueprint] = static_cast<uint32_t>(*n);
                }
            }
        }
    }

    // [checkpoint]
    if (auto cp = tbl["checkpoint"]; cp.is_table()) {
        config.checkpoint.enabled = cp["enabled"].value_or(config.checkpoint.enabled);
        config.checkpoint.dir = cp["dir"].value_or(std::string{"./checkpoints"});
        counts.read(cp, "checkpoint", "interval_seconds", config.checkpoint.interval_seconds);
        counts.read(cp, "checkpoint", "retention", config.checkpoint.retention);
    }

    // [bus]
    if (auto bus = tbl["bus"]; bus.is_table()) {
        counts.read(bus, "bus", "history_size", config.bus.history_size);
        counts.read(bus, "bus", "subscriber_queue_bound", config.bus.subscriber_queue_bound);
        counts.read(bus, "bus", "max_delivery_attempts", config.bus.max_delivery_attempts);
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
        counts.read(telemetry, "telemetry", "max_file_size_mb", config.telemetry.max_file_size_mb);
        counts.read(telemetry, "telemetry", "rotate_count", config.telemetry.rotate_count);
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        config.telemetry.stdout_logs = telemetry["stdout"].value_or(false);
    }

    if (counts.error()) return *counts.error();
    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

}  // anonymous namespace

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

Result<void> validate_config(const Config& config) {
    if (config.coordinator.max_concurrent_agents == 0) {
        return Error{ErrorCode::Config, "coordinator.max_concurrent_agents must be positive"};
    }
    if (config.coordinator.task_timeout_default_ms == 0) {
        return Error{ErrorCode::Config, "coordinator.task_timeout_default_ms must be positive"};
    }
    if (config.coordinator.tick_interval_ms == 0) {
        return Error{ErrorCode::Config, "coordinator.tick_interval_ms must be positive"};
    }
    if (config.resolver.confidence_threshold < 0.0 || config.resolver.confidence_threshold > 1.0) {
        return Error{ErrorCode::Config, "resolver.confidence_threshold must lie in [0, 1]"};
    }
    if (config.agents.pool_size_per_type == 0) {
        return Error{ErrorCode::Config, "agents.pool_size_per_type must be positive"};
    }
    if (config.bus.subscriber_queue_bound == 0) {
        return Error{ErrorCode::Config, "bus.subscriber_queue_bound must be positive"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::Config, "telemetry.log_level is not a known level: "
                                        + config.telemetry.log_level};
    }
    return {};
}

Config default_config() {
    return Config{};
}

}  // namespace task_dispatch
