/**
 * @file agent.hpp
 * @brief Capability-typed worker contract and blueprints.
 * @author TaskDispatch contributors
 *
 * Worker heterogeneity is a capability set, not a class hierarchy: an Agent
 * is a plain object holding its capabilities and a handler. Blueprints are
 * the registrable recipe from which pooled agents are stamped out.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/registry.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <memory>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace task_dispatch {

enum class AgentStatus : uint8_t {
    Idle,
    Busy,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(AgentStatus status) noexcept {
    switch (status) {
        case AgentStatus::Idle:   return "idle";
        case AgentStatus::Busy:   return "busy";
        case AgentStatus::Failed: return "failed";
    }
    return "unknown";
}

/// Executes one task given its resolved input artifacts.
using AgentHandler = std::function<Result<ArtifactMap>(const Task&, const ArtifactMap&, std::stop_token)>;

// ─────────────────────────────────────────────
// Agent
// ─────────────────────────────────────────────

/**
 * @brief Immutable worker identity plus its handler.
 *
 * Lifecycle state (idle/busy/failed, current task) is owned by the
 * AgentFactory so acquisition can be check-and-assign under one lock.
 */
class Agent {
public:
    Agent(AgentId id, std::string blueprint, std::set<TaskType> capabilities, AgentHandler handler);

    [[nodiscard]] const AgentId& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& blueprint() const noexcept { return blueprint_; }
    [[nodiscard]] const std::set<TaskType>& capabilities() const noexcept { return capabilities_; }
    [[nodiscard]] bool can_handle(TaskType type) const { return capabilities_.contains(type); }

    [[nodiscard]] Result<ArtifactMap> execute(const Task& task,
                                              const ArtifactMap& inputs,
                                              std::stop_token stop) const;

private:
    AgentId id_;
    std::string blueprint_;
    std::set<TaskType> capabilities_;
    AgentHandler handler_;
};

// ─────────────────────────────────────────────
// AgentBlueprint
// ─────────────────────────────────────────────

/**
 * @brief Named recipe for a family of agents sharing one capability set.
 */
class AgentBlueprint {
public:
    using HandlerFactory = std::function<AgentHandler()>;

    AgentBlueprint(std::string name, std::set<TaskType> capabilities, HandlerFactory make_handler);

    [[nodiscard]] std::string_view name() const noexcept { return name_; }
    [[nodiscard]] const std::set<TaskType>& capabilities() const noexcept { return capabilities_; }
    [[nodiscard]] bool serves(TaskType type) const { return capabilities_.contains(type); }

    /// Build an agent with a fresh handler instance.
    [[nodiscard]] std::shared_ptr<Agent> instantiate(AgentId id) const;

private:
    std::string name_;
    std::set<TaskType> capabilities_;
    HandlerFactory make_handler_;
};

using BlueprintRegistry = PluginRegistry<AgentBlueprint>;

/**
 * @brief Wrap a typed behavior into a blueprint; each agent gets its own behavior instance.
 */
template <AgentBehaviorLike Behavior, typename... Args>
[[nodiscard]] std::unique_ptr<AgentBlueprint> make_blueprint(Args... args) {
    auto caps = Behavior::capabilities();
    return std::make_unique<AgentBlueprint>(
        std::string{Behavior::blueprint_name()},
        std::set<TaskType>(caps.begin(), caps.end()),
        [args...]() -> AgentHandler {
            auto behavior = std::make_shared<Behavior>(args...);
            return [behavior](const Task& task, const ArtifactMap& inputs, std::stop_token stop) {
                return behavior->execute(task, inputs, stop);
            };
        });
}

}  // namespace task_dispatch
