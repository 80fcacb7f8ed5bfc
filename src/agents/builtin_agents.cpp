/**
 * @file builtin_agents.cpp
 * @brief Simulated agent behaviors and their registration.
 * @author TaskDispatch contributors
 */

#include "agents/builtin_agents.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <thread>

namespace task_dispatch {

namespace {

constexpr Duration kWorkSlice{5};

}  // anonymous namespace

bool simulate_work(Duration duration, std::stop_token stop) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop.stop_requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto remaining = std::chrono::duration_cast<Duration>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kWorkSlice));
    }
    return false;
}

Result<ArtifactMap> produce_artifacts(const Task& task,
                                      const ArtifactMap& inputs,
                                      std::string_view role,
                                      const SimulationOptions& options,
                                      std::stop_token stop) {
    auto work = Duration{static_cast<Duration::rep>(
        static_cast<double>(options.work_per_complexity.count()) * clamp_complexity(task.estimated_complexity))};
    if (!simulate_work(work, stop)) {
        return Error{ErrorCode::Cancelled, std::format("{} stopped while working on {}", role, task.id)};
    }

    std::string consumed;
    for (const auto& [name, _] : inputs) {
        if (!consumed.empty()) consumed += ", ";
        consumed += name;
    }
    if (consumed.empty()) consumed = "none";

    ArtifactMap produced;
    if (task.outputs.empty()) {
        produced[task.id + "_result"] = std::format("[{}] {}", role, task.description);
        return produced;
    }
    for (const auto& output : task.outputs) {
        produced[output] = std::format("[{}] {} -> {} (inputs: {})", role, task.description, output, consumed);
    }
    return produced;
}

Result<void> register_builtin_blueprints(BlueprintRegistry& registry, SimulationOptions options) {
    auto add = [&](std::string_view name, BlueprintRegistry::Factory factory) {
        return registry.register_factory(std::string{name}, std::move(factory));
    };

    const std::pair<std::string_view, BlueprintRegistry::Factory> builtins[] = {
        {CodeWriterBehavior::blueprint_name(), [options] { return make_blueprint<CodeWriterBehavior>(options); }},
        {ResearcherBehavior::blueprint_name(), [options] { return make_blueprint<ResearcherBehavior>(options); }},
        {TesterBehavior::blueprint_name(),     [options] { return make_blueprint<TesterBehavior>(options); }},
        {ReviewerBehavior::blueprint_name(),   [options] { return make_blueprint<ReviewerBehavior>(options); }},
        {DocumenterBehavior::blueprint_name(), [options] { return make_blueprint<DocumenterBehavior>(options); }},
        {GeneralistBehavior::blueprint_name(), [options] { return make_blueprint<GeneralistBehavior>(options); }},
    };

    for (const auto& [name, factory] : builtins) {
        auto added = add(name, factory);
        if (!added) return added;
    }
    return {};
}

}  // namespace task_dispatch
