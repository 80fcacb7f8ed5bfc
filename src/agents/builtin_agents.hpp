/**
 * @file builtin_agents.hpp
 * @brief Simulated specialist agents shipped with the engine.
 * @author TaskDispatch contributors
 *
 * Each behavior produces its task's declared output artifacts from the task
 * description and its inputs, after a simulated work period that honors the
 * stop token. They stand in for real specialists in the CLI and in tests.
 */

#pragma once

#include "agents/agent.hpp"
#include "core/concepts.hpp"

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace task_dispatch {

struct SimulationOptions {
    Duration work_per_complexity{0};   ///< Simulated time per complexity point
};

/**
 * @brief Sleep for `duration` in short slices.
 * @return false if a stop was requested before the time elapsed.
 */
bool simulate_work(Duration duration, std::stop_token stop);

/// Shared body of the simulated behaviors.
Result<ArtifactMap> produce_artifacts(const Task& task,
                                      const ArtifactMap& inputs,
                                      std::string_view role,
                                      const SimulationOptions& options,
                                      std::stop_token stop);

// ─────────────────────────────────────────────
// Behaviors
// ─────────────────────────────────────────────

/// Holds the simulation knobs; concrete behaviors add their name and capabilities.
class SimulatedBehavior {
public:
    explicit SimulatedBehavior(SimulationOptions options = {}) : options_(options) {}

protected:
    [[nodiscard]] Result<ArtifactMap> run(const Task& task, const ArtifactMap& inputs,
                                          std::string_view role, std::stop_token stop) const {
        return produce_artifacts(task, inputs, role, options_, std::move(stop));
    }

private:
    SimulationOptions options_;
};

class CodeWriterBehavior : public SimulatedBehavior {
public:
    using SimulatedBehavior::SimulatedBehavior;
    static constexpr std::string_view blueprint_name() { return "code_writer"; }
    static std::vector<TaskType> capabilities() { return {TaskType::CodeWriting, TaskType::Debugging}; }
    Result<ArtifactMap> execute(const Task& task, const ArtifactMap& inputs, std::stop_token stop) {
        return run(task, inputs, blueprint_name(), std::move(stop));
    }
};

class ResearcherBehavior : public SimulatedBehavior {
public:
    using SimulatedBehavior::SimulatedBehavior;
    static constexpr std::string_view blueprint_name() { return "researcher"; }
    static std::vector<TaskType> capabilities() { return {TaskType::Research, TaskType::Analysis}; }
    Result<ArtifactMap> execute(const Task& task, const ArtifactMap& inputs, std::stop_token stop) {
        return run(task, inputs, blueprint_name(), std::move(stop));
    }
};

class TesterBehavior : public SimulatedBehavior {
public:
    using SimulatedBehavior::SimulatedBehavior;
    static constexpr std::string_view blueprint_name() { return "tester"; }
    static std::vector<TaskType> capabilities() { return {TaskType::Testing}; }
    Result<ArtifactMap> execute(const Task& task, const ArtifactMap& inputs, std::stop_token stop) {
        return run(task, inputs, blueprint_name(), std::move(stop));
    }
};

class ReviewerBehavior : public SimulatedBehavior {
public:
    using SimulatedBehavior::SimulatedBehavior;
    static constexpr std::string_view blueprint_name() { return "reviewer"; }
    static std::vector<TaskType> capabilities() { return {TaskType::Review}; }
    Result<ArtifactMap> execute(const Task& task, const ArtifactMap& inputs, std::stop_token stop) {
        return run(task, inputs, blueprint_name(), std::move(stop));
    }
};

class DocumenterBehavior : public SimulatedBehavior {
public:
    using SimulatedBehavior::SimulatedBehavior;
    static constexpr std::string_view blueprint_name() { return "documenter"; }
    static std::vector<TaskType> capabilities() { return {TaskType::Documentation, TaskType::Deployment}; }
    Result<ArtifactMap> execute(const Task& task, const ArtifactMap& inputs, std::stop_token stop) {
        return run(task, inputs, blueprint_name(), std::move(stop));
    }
};

class GeneralistBehavior : public SimulatedBehavior {
public:
    using SimulatedBehavior::SimulatedBehavior;
    static constexpr std::string_view blueprint_name() { return "generalist"; }
    static std::vector<TaskType> capabilities() { return {TaskType::Generic}; }
    Result<ArtifactMap> execute(const Task& task, const ArtifactMap& inputs, std::stop_token stop) {
        return run(task, inputs, blueprint_name(), std::move(stop));
    }
};

static_assert(AgentBehaviorLike<CodeWriterBehavior>);
static_assert(AgentBehaviorLike<GeneralistBehavior>);

/**
 * @brief Register the six simulated blueprints under their canonical names.
 */
Result<void> register_builtin_blueprints(BlueprintRegistry& registry, SimulationOptions options = {});

}  // namespace task_dispatch
