/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace task_dispatch {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::begin_session(size_t total_tasks, SteadyTime now) {
    {
        std::lock_guard lock(mutex_);
        metrics_ = ExecutionMetrics{};
        metrics_.total_tasks = total_tasks;
        session_start_ = now;
        session_end_.reset();
        running_since_.clear();
    }
    std::ostringstream oss;
    oss << R"({"event":"session_started","tasks":)" << total_tasks << "}";
    emit(oss.str());
}

void MetricsCollector::end_session(SteadyTime now) {
    Duration latency{0};
    {
        std::lock_guard lock(mutex_);
        session_end_ = now;
        if (session_start_) {
            latency = std::chrono::duration_cast<Duration>(now - *session_start_);
        }
    }
    std::ostringstream oss;
    oss << R"({"event":"session_finished","latency_ms":)" << latency.count() << "}";
    emit(oss.str());
}

void MetricsCollector::record_task_started(const TaskId& id, const AgentId& agent, SteadyTime now) {
    {
        std::lock_guard lock(mutex_);
        auto& tm = metrics_.tasks[id];
        tm.task_id = id;
        tm.agent_id = agent;
        tm.attempts++;
        running_since_[id] = now;
        auto& am = metrics_.agents[agent];
        am.agent_id = agent;
    }
    std::ostringstream oss;
    oss << R"({"event":"task_started","task":")" << json_escape(id)
        << R"(","agent":")" << json_escape(agent) << R"("})";
    emit(oss.str());
}

void MetricsCollector::record_task_finished(const TaskId& id, TaskStatus status, SteadyTime now) {
    Duration attempt{0};
    {
        std::lock_guard lock(mutex_);
        auto& tm = metrics_.tasks[id];
        tm.task_id = id;
        if (auto it = running_since_.find(id); it != running_since_.end()) {
            attempt = std::chrono::duration_cast<Duration>(now - it->second);
            running_since_.erase(it);
        }
        tm.duration += attempt;
        if (!tm.agent_id.empty()) {
            auto& am = metrics_.agents[tm.agent_id];
            am.busy_time += attempt;
            if (status == TaskStatus::Completed) {
                am.tasks_completed++;
            } else {
                am.tasks_failed++;
            }
        }
    }
    std::ostringstream oss;
    oss << R"({"event":"task_state_change","task":")" << json_escape(id)
        << R"(","state":")" << to_string(status)
        << R"(","duration_ms":)" << attempt.count() << "}";
    emit(oss.str());
}

void MetricsCollector::record_task_terminal(const TaskId& id, TaskStatus status) {
    std::lock_guard lock(mutex_);
    auto& tm = metrics_.tasks[id];
    tm.task_id = id;
    tm.final_status = status;
    count_terminal(status);
}

void MetricsCollector::count_terminal(TaskStatus status) {
    switch (status) {
        case TaskStatus::Completed: metrics_.completed_tasks++; break;
        case TaskStatus::Failed:    metrics_.failed_tasks++; break;
        case TaskStatus::Cancelled: metrics_.cancelled_tasks++; break;
        case TaskStatus::Skipped:   metrics_.skipped_tasks++; break;
        default: break;
    }
}

void MetricsCollector::record_retry(const TaskId& id) {
    std::lock_guard lock(mutex_);
    auto& tm = metrics_.tasks[id];
    tm.task_id = id;
    tm.retries++;
    metrics_.total_retries++;
}

void MetricsCollector::record_queue_depth(size_t ready, size_t running, SteadyTime now) {
    std::lock_guard lock(mutex_);
    QueueDepthSample sample;
    sample.ready = ready;
    sample.running = running;
    if (session_start_) {
        sample.offset = std::chrono::duration_cast<Duration>(now - *session_start_);
    }
    metrics_.queue_depth.push_back(sample);
}

void MetricsCollector::restore_task(const TaskId& id, TaskStatus status, uint32_t retries) {
    std::lock_guard lock(mutex_);
    auto& tm = metrics_.tasks[id];
    tm.task_id = id;
    tm.retries = retries;
    metrics_.total_retries += retries;
    if (is_terminal(status)) {
        tm.final_status = status;
        count_terminal(status);
    }
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

ExecutionMetrics MetricsCollector::snapshot(SteadyTime now) const {
    std::lock_guard lock(mutex_);
    ExecutionMetrics out = metrics_;

    auto end = session_end_.value_or(now);
    if (session_start_) {
        out.end_to_end_latency = std::chrono::duration_cast<Duration>(end - *session_start_);
    }

    int64_t total_ms = 0;
    size_t measured = 0;
    for (const auto& [id, tm] : out.tasks) {
        if (tm.attempts == 0) continue;
        total_ms += tm.duration.count();
        ++measured;
    }
    out.average_task_ms = measured == 0 ? 0.0
        : static_cast<double>(total_ms) / static_cast<double>(measured);

    auto elapsed = out.end_to_end_latency.count();
    for (auto& [id, am] : out.agents) {
        am.utilization = elapsed <= 0 ? 0.0
            : std::min(1.0, static_cast<double>(am.busy_time.count()) / static_cast<double>(elapsed));
    }
    return out;
}

ExecutionMetrics MetricsCollector::snapshot() const {
    return snapshot(std::chrono::steady_clock::now());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace task_dispatch
