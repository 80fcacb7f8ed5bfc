/**
 * @file metrics_collector.hpp
 * @brief Execution metrics aggregation and structured event emission.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace task_dispatch {

struct TaskMetrics {
    TaskId task_id;
    AgentId agent_id;
    TaskStatus final_status = TaskStatus::Pending;
    Duration duration{0};          ///< Sum of all attempts' running time
    uint32_t attempts = 0;
    uint32_t retries = 0;
};

struct AgentMetrics {
    AgentId agent_id;
    Duration busy_time{0};
    uint32_t tasks_completed = 0;
    uint32_t tasks_failed = 0;
    double utilization = 0.0;      ///< busy_time / session elapsed, [0, 1]
};

struct QueueDepthSample {
    Duration offset{0};            ///< Since session start
    size_t ready = 0;
    size_t running = 0;
};

/**
 * @brief Aggregated view over one dispatch session.
 */
struct ExecutionMetrics {
    size_t total_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t cancelled_tasks = 0;
    size_t skipped_tasks = 0;
    uint32_t total_retries = 0;

    Duration end_to_end_latency{0};
    double average_task_ms = 0.0;

    std::map<TaskId, TaskMetrics> tasks;
    std::map<AgentId, AgentMetrics> agents;
    std::vector<QueueDepthSample> queue_depth;

    [[nodiscard]] double completion_percentage() const noexcept {
        if (total_tasks == 0) return 0.0;
        return 100.0 * static_cast<double>(completed_tasks) / static_cast<double>(total_tasks);
    }

    [[nodiscard]] double success_rate() const noexcept {
        auto finished = completed_tasks + failed_tasks;
        if (finished == 0) return 0.0;
        return 100.0 * static_cast<double>(completed_tasks) / static_cast<double>(finished);
    }
};

/**
 * @brief Collects per-task, per-agent and queue metrics and logs them as NDJSON.
 *
 * Timestamps are passed in by the caller so aggregation stays deterministic
 * under test.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void begin_session(size_t total_tasks, SteadyTime now);
    void end_session(SteadyTime now);

    void record_task_started(const TaskId& id, const AgentId& agent, SteadyTime now);
    void record_task_finished(const TaskId& id, TaskStatus status, SteadyTime now);
    void record_task_terminal(const TaskId& id, TaskStatus status);
    void record_retry(const TaskId& id);
    void record_queue_depth(size_t ready, size_t running, SteadyTime now);
    void record_custom(std::string_view event, std::string_view json_payload);

    /// Re-seed counters from restored task states.
    void restore_task(const TaskId& id, TaskStatus status, uint32_t retries);

    [[nodiscard]] ExecutionMetrics snapshot(SteadyTime now) const;
    [[nodiscard]] ExecutionMetrics snapshot() const;

    void flush();

private:
    void emit(std::string_view json_line);
    void count_terminal(TaskStatus status);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    mutable std::mutex mutex_;
    ExecutionMetrics metrics_;
    std::optional<SteadyTime> session_start_;
    std::optional<SteadyTime> session_end_;
    std::map<TaskId, SteadyTime> running_since_;
};

}  // namespace task_dispatch
