/**
 * @file task_runner.cpp
 * @brief TaskRunner implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/task_runner.hpp"

#include <chrono>

namespace task_dispatch {

namespace {

Result<ArtifactMap> invoke_handler(const Agent& agent,
                                   const Task& task,
                                   const ArtifactMap& inputs,
                                   std::stop_token stop) {
    try {
        return agent.execute(task, inputs, stop);
    } catch (const std::exception& e) {
        return Error{ErrorCode::TaskExecution, "Agent " + agent.id() + " threw: " + e.what()};
    } catch (...) {
        return Error{ErrorCode::TaskExecution, "Agent " + agent.id() + " threw a non-standard exception"};
    }
}

}  // anonymous namespace

TaskOutcome TaskRunner::execute(const Agent& agent,
                                const Task& task,
                                const ArtifactMap& inputs,
                                std::stop_token stop) const {
    auto start = std::chrono::steady_clock::now();

    auto artifacts = invoke_handler(agent, task, inputs, stop);

    if (!artifacts && stop.stop_requested() && artifacts.error().code != ErrorCode::Cancelled) {
        artifacts = Error{ErrorCode::Cancelled,
                          "Task " + task.id + " stopped: " + artifacts.error().message};
    }

    if (artifacts) {
        for (const auto& output : task.outputs) {
            if (!artifacts->contains(output)) {
                artifacts = Error{ErrorCode::TaskExecution,
                                  "Task " + task.id + " did not produce declared artifact '" + output + "'"};
                break;
            }
        }
    }

    auto end = std::chrono::steady_clock::now();
    return TaskOutcome{
        .task_id = task.id,
        .agent_id = agent.id(),
        .artifacts = std::move(artifacts),
        .actual_duration = std::chrono::duration_cast<Duration>(end - start)
    };
}

}  // namespace task_dispatch
