/**
 * @file agent_factory.cpp
 * @brief AgentFactory implementation.
 * @author TaskDispatch contributors
 */

#include "agents/agent_factory.hpp"

#include <format>

namespace task_dispatch {

AgentFactory::AgentFactory(const AgentsConfig& config, const BlueprintRegistry& registry, Logger& logger)
    : log_(logger, "agent_factory") {
    auto loaded = registry.load(config.blueprints, log_);
    load_failures_ = std::move(loaded.failures);

    for (auto& blueprint : loaded.products) {
        Pool pool;
        std::string name{blueprint->name()};
        auto override_it = config.pool_size.find(name);
        pool.capacity = override_it != config.pool_size.end() ? override_it->second
                                                               : config.pool_size_per_type;
        pool.blueprint = std::move(blueprint);
        log_.debug(std::format("Pool '{}' ready with capacity {}", name, pool.capacity));
        pools_.push_back(std::move(pool));
    }
}

// ─────────────────────────────────────────────
// Acquisition
// ─────────────────────────────────────────────

std::optional<AgentLease> AgentFactory::acquire(TaskType type, const TaskId& task_id) {
    std::lock_guard lock(mutex_);
    if (shut_down_) return std::nullopt;

    for (auto& pool : pools_) {
        if (!pool.blueprint->serves(type)) continue;

        for (auto& [id, slot] : pool.slots) {
            if (slot.status == AgentStatus::Idle) {
                slot.status = AgentStatus::Busy;
                slot.current_task = task_id;
                return AgentLease{slot.agent, task_id};
            }
        }

        if (pool.slots.size() < pool.capacity) {
            auto id = std::format("{}-{}", pool.blueprint->name(), pool.next_index++);
            auto agent = pool.blueprint->instantiate(id);
            auto& slot = pool.slots[id];
            slot.agent = std::move(agent);
            slot.status = AgentStatus::Busy;
            slot.current_task = task_id;
            log_.debug("Created agent " + id);
            return AgentLease{slot.agent, task_id};
        }
    }
    return std::nullopt;
}

Result<void> AgentFactory::release(const AgentId& id) {
    std::lock_guard lock(mutex_);
    auto* slot = find_slot(id);
    if (!slot) return Error{ErrorCode::NotFound, "Unknown agent: " + id};
    if (slot->status != AgentStatus::Busy) {
        return Error{ErrorCode::InvalidTransition,
                     "Agent " + id + " is " + std::string{to_string(slot->status)} + ", not busy"};
    }
    slot->status = AgentStatus::Idle;
    slot->current_task.clear();
    return {};
}

Result<void> AgentFactory::mark_failed(const AgentId& id) {
    std::lock_guard lock(mutex_);
    auto* slot = find_slot(id);
    if (!slot) return Error{ErrorCode::NotFound, "Unknown agent: " + id};
    slot->status = AgentStatus::Failed;
    slot->current_task.clear();
    return {};
}

Result<void> AgentFactory::evict(const AgentId& id) {
    std::lock_guard lock(mutex_);
    for (auto& pool : pools_) {
        if (pool.slots.erase(id) > 0) {
            log_.info("Evicted agent " + id);
            return {};
        }
    }
    return Error{ErrorCode::NotFound, "Unknown agent: " + id};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

bool AgentFactory::can_serve(TaskType type) const {
    std::lock_guard lock(mutex_);
    for (const auto& pool : pools_) {
        if (pool.capacity > 0 && pool.blueprint->serves(type)) return true;
    }
    return false;
}

std::optional<AgentSnapshot> AgentFactory::agent(const AgentId& id) const {
    std::lock_guard lock(mutex_);
    const auto* slot = find_slot(id);
    if (!slot) return std::nullopt;
    return AgentSnapshot{id, slot->agent->blueprint(), slot->status, slot->current_task};
}

std::vector<AgentSnapshot> AgentFactory::agents() const {
    std::lock_guard lock(mutex_);
    std::vector<AgentSnapshot> out;
    for (const auto& pool : pools_) {
        for (const auto& [id, slot] : pool.slots) {
            out.push_back({id, slot.agent->blueprint(), slot.status, slot.current_task});
        }
    }
    return out;
}

std::vector<PoolStatus> AgentFactory::pool_status() const {
    std::lock_guard lock(mutex_);
    std::vector<PoolStatus> out;
    for (const auto& pool : pools_) {
        PoolStatus status{.blueprint = std::string{pool.blueprint->name()},
                          .capacity = pool.capacity,
                          .created = pool.slots.size()};
        for (const auto& [_, slot] : pool.slots) {
            switch (slot.status) {
                case AgentStatus::Idle:   ++status.idle; break;
                case AgentStatus::Busy:   ++status.busy; break;
                case AgentStatus::Failed: ++status.failed; break;
            }
        }
        out.push_back(std::move(status));
    }
    return out;
}

size_t AgentFactory::busy_count() const {
    size_t busy = 0;
    for (const auto& pool : pool_status()) busy += pool.busy;
    return busy;
}

double AgentFactory::utilization() const {
    size_t busy = 0;
    size_t capacity = 0;
    for (const auto& pool : pool_status()) {
        busy += pool.busy;
        capacity += pool.capacity;
    }
    return capacity == 0 ? 0.0 : static_cast<double>(busy) / static_cast<double>(capacity);
}

void AgentFactory::shutdown_all() {
    std::lock_guard lock(mutex_);
    size_t evicted = 0;
    for (auto& pool : pools_) {
        evicted += pool.slots.size();
        pool.slots.clear();
    }
    shut_down_ = true;
    log_.info(std::format("Agent pools shut down ({} agents released)", evicted));
}

bool AgentFactory::is_shut_down() const {
    std::lock_guard lock(mutex_);
    return shut_down_;
}

std::vector<std::string> AgentFactory::blueprint_names() const {
    std::vector<std::string> names;
    for (const auto& pool : pools_) names.emplace_back(pool.blueprint->name());
    return names;
}

AgentFactory::Slot* AgentFactory::find_slot(const AgentId& id) {
    for (auto& pool : pools_) {
        auto it = pool.slots.find(id);
        if (it != pool.slots.end()) return &it->second;
    }
    return nullptr;
}

const AgentFactory::Slot* AgentFactory::find_slot(const AgentId& id) const {
    for (const auto& pool : pools_) {
        auto it = pool.slots.find(id);
        if (it != pool.slots.end()) return &it->second;
    }
    return nullptr;
}

}  // namespace task_dispatch
