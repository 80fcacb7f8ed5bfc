/**
 * @file agent_factory.hpp
 * @brief Pooled, capability-matched agent allocation.
 * @author TaskDispatch contributors
 *
 * One pool per loaded blueprint. Agents are created on demand up to the
 * pool's capacity. acquire() is an atomic check-and-assign so no agent is
 * ever bound to two tasks at once.
 */

#pragma once

#include "agents/agent.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace task_dispatch {

/// Point-in-time view of one agent's lifecycle state.
struct AgentSnapshot {
    AgentId id;
    std::string blueprint;
    AgentStatus status = AgentStatus::Idle;
    TaskId current_task;
};

struct PoolStatus {
    std::string blueprint;
    size_t capacity = 0;
    size_t created = 0;
    size_t idle = 0;
    size_t busy = 0;
    size_t failed = 0;

    [[nodiscard]] double utilization() const noexcept {
        return capacity == 0 ? 0.0 : static_cast<double>(busy) / static_cast<double>(capacity);
    }
};

/// Agent bound to a task by acquire().
struct AgentLease {
    std::shared_ptr<const Agent> agent;
    TaskId task_id;
};

class AgentFactory {
public:
    /// Loads `config.blueprints` from `registry`; failures are logged and excluded.
    AgentFactory(const AgentsConfig& config, const BlueprintRegistry& registry, Logger& logger);

    AgentFactory(const AgentFactory&) = delete;
    AgentFactory& operator=(const AgentFactory&) = delete;

    /**
     * @brief Bind an idle (or newly created) agent able to run `type` to `task_id`.
     * @return nullopt when every matching pool is saturated or shut down.
     */
    [[nodiscard]] std::optional<AgentLease> acquire(TaskType type, const TaskId& task_id);

    /// Busy → Idle.
    Result<void> release(const AgentId& id);

    /// Busy → Failed. The agent stays in the pool until evicted.
    Result<void> mark_failed(const AgentId& id);

    /// Drop an agent from its pool, freeing its slot for a fresh instance.
    Result<void> evict(const AgentId& id);

    /// Some loaded blueprint declares `type`.
    [[nodiscard]] bool can_serve(TaskType type) const;

    [[nodiscard]] std::optional<AgentSnapshot> agent(const AgentId& id) const;
    [[nodiscard]] std::vector<AgentSnapshot> agents() const;
    [[nodiscard]] std::vector<PoolStatus> pool_status() const;
    [[nodiscard]] size_t busy_count() const;
    /// Busy agents over total capacity across pools.
    [[nodiscard]] double utilization() const;

    /// Evict every agent and refuse further acquisitions.
    void shutdown_all();
    [[nodiscard]] bool is_shut_down() const;

    [[nodiscard]] std::vector<std::string> blueprint_names() const;
    [[nodiscard]] const std::vector<PluginLoadFailure>& load_failures() const noexcept {
        return load_failures_;
    }

private:
    struct Slot {
        std::shared_ptr<Agent> agent;
        AgentStatus status = AgentStatus::Idle;
        TaskId current_task;
    };

    struct Pool {
        std::unique_ptr<AgentBlueprint> blueprint;
        size_t capacity = 0;
        size_t next_index = 0;
        std::map<AgentId, Slot> slots;
    };

    Slot* find_slot(const AgentId& id);
    const Slot* find_slot(const AgentId& id) const;

    ComponentLogger log_;
    std::vector<Pool> pools_;   ///< In configured blueprint order
    std::vector<PluginLoadFailure> load_failures_;
    bool shut_down_ = false;
    mutable std::mutex mutex_;
};

}  // namespace task_dispatch
