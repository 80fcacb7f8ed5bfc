/**
 * @file dispatch_context.hpp
 * @brief Process-scoped registries and shared services for dispatching.
 * @author TaskDispatch contributors
 *
 * Replaces ambient globals: the rule registry, blueprint registry, message
 * bus, checkpoint store and model client are owned here and handed to the
 * Dispatcher explicitly. Built-in rules are registered on creation; callers
 * register agent blueprints (built-in or their own) before dispatching.
 */

#pragma once

#include "agents/agent.hpp"
#include "coordination/checkpoint_store.hpp"
#include "coordination/message_bus.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "graph/dependency_rules.hpp"
#include "llm/language_model.hpp"

#include <functional>
#include <memory>

namespace task_dispatch {

class DispatchContext {
public:
    using SinkFactory = std::function<std::unique_ptr<ILogSink>()>;

    /**
     * @brief Validate `config` and assemble the shared services.
     * @param model  Optional language-model client for the assisted paths.
     * @param store  Optional checkpoint store; when null and checkpointing is
     *               enabled, a FileCheckpointStore under `checkpoint.dir` is used.
     * @return Config error if validation fails.
     */
    static Result<std::unique_ptr<DispatchContext>> create(
        Config config,
        Logger& logger,
        std::shared_ptr<ILanguageModelClient> model = nullptr,
        std::unique_ptr<ICheckpointStore> store = nullptr);

    DispatchContext(const DispatchContext&) = delete;
    DispatchContext& operator=(const DispatchContext&) = delete;

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] Logger& logger() const noexcept { return logger_; }

    [[nodiscard]] RuleRegistry& rules() noexcept { return rules_; }
    [[nodiscard]] const RuleRegistry& rules() const noexcept { return rules_; }
    [[nodiscard]] BlueprintRegistry& blueprints() noexcept { return blueprints_; }
    [[nodiscard]] const BlueprintRegistry& blueprints() const noexcept { return blueprints_; }

    [[nodiscard]] MessageBus& bus() noexcept { return *bus_; }
    [[nodiscard]] ICheckpointStore* checkpoints() const noexcept { return store_.get(); }
    [[nodiscard]] std::shared_ptr<ILanguageModelClient> model() const { return model_; }

    /// Where each session's metrics events go (NDJSON file under the log dir by default).
    void set_metrics_sink_factory(SinkFactory factory) { metrics_sink_factory_ = std::move(factory); }
    [[nodiscard]] std::unique_ptr<ILogSink> make_metrics_sink() const;

private:
    DispatchContext(Config config, Logger& logger);

    Config config_;
    Logger& logger_;
    RuleRegistry rules_;
    BlueprintRegistry blueprints_;
    std::shared_ptr<ILanguageModelClient> model_;
    std::unique_ptr<ICheckpointStore> store_;
    std::unique_ptr<MessageBus> bus_;
    SinkFactory metrics_sink_factory_;
};

}  // namespace task_dispatch
