/**
 * @file agent.cpp
 * @brief Agent and AgentBlueprint implementation.
 * @author TaskDispatch contributors
 */

#include "agents/agent.hpp"

namespace task_dispatch {

Agent::Agent(AgentId id, std::string blueprint, std::set<TaskType> capabilities, AgentHandler handler)
    : id_(std::move(id))
    , blueprint_(std::move(blueprint))
    , capabilities_(std::move(capabilities))
    , handler_(std::move(handler)) {}

Result<ArtifactMap> Agent::execute(const Task& task,
                                   const ArtifactMap& inputs,
                                   std::stop_token stop) const {
    if (!can_handle(task.type)) {
        return Error{ErrorCode::InvalidArgument,
                     "Agent " + id_ + " cannot handle " + std::string{to_string(task.type)}};
    }
    if (!handler_) {
        return Error{ErrorCode::TaskExecution, "Agent " + id_ + " has no handler"};
    }
    return handler_(task, inputs, std::move(stop));
}

AgentBlueprint::AgentBlueprint(std::string name, std::set<TaskType> capabilities, HandlerFactory make_handler)
    : name_(std::move(name))
    , capabilities_(std::move(capabilities))
    , make_handler_(std::move(make_handler)) {}

std::shared_ptr<Agent> AgentBlueprint::instantiate(AgentId id) const {
    return std::make_shared<Agent>(std::move(id), name_, capabilities_, make_handler_());
}

}  // namespace task_dispatch
