/**
 * @file task_runner.hpp
 * @brief Single task execution on a bound agent.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "agents/agent.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <stop_token>

namespace task_dispatch {

struct TaskOutcome {
    TaskId task_id;
    AgentId agent_id;
    Result<ArtifactMap> artifacts{ArtifactMap{}};
    Duration actual_duration{0};
};

/**
 * @brief Runs an agent's handler against one task and normalizes the outcome.
 *
 * Exceptions escaping the handler become TaskExecution errors, failures
 * observed after a stop request become Cancelled, and a successful run that
 * omits a declared output artifact is reported as a TaskExecution error.
 */
class TaskRunner {
public:
    TaskOutcome execute(const Agent& agent,
                        const Task& task,
                        const ArtifactMap& inputs,
                        std::stop_token stop) const;
};

}  // namespace task_dispatch
