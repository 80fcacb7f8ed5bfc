/**
 * @file dispatch_context.cpp
 * @brief DispatchContext assembly.
 * @author TaskDispatch contributors
 */

#include "dispatcher/dispatch_context.hpp"

#include "telemetry/json_sink.hpp"

namespace task_dispatch {

DispatchContext::DispatchContext(Config config, Logger& logger)
    : config_(std::move(config))
    , logger_(logger)
    , bus_(std::make_unique<MessageBus>(config_.bus, logger)) {}

Result<std::unique_ptr<DispatchContext>> DispatchContext::create(
    Config config,
    Logger& logger,
    std::shared_ptr<ILanguageModelClient> model,
    std::unique_ptr<ICheckpointStore> store) {
    auto valid = validate_config(config);
    if (!valid) return valid.error();

    std::unique_ptr<DispatchContext> context(new DispatchContext(std::move(config), logger));

    auto rules = register_builtin_rules(context->rules_);
    if (!rules) return rules.error();

    context->model_ = std::move(model);
    if (store) {
        context->store_ = std::move(store);
    } else if (context->config_.checkpoint.enabled) {
        context->store_ = std::make_unique<FileCheckpointStore>(
            context->config_.checkpoint.dir, context->config_.checkpoint.retention, logger);
    }

    const auto& telemetry = context->config_.telemetry;
    context->metrics_sink_factory_ = [telemetry]() -> std::unique_ptr<ILogSink> {
        return std::make_unique<JsonFileSink>(telemetry.log_dir, "metrics",
                                              telemetry.max_file_size_mb, telemetry.rotate_count);
    };
    return context;
}

std::unique_ptr<ILogSink> DispatchContext::make_metrics_sink() const {
    if (metrics_sink_factory_) {
        if (auto sink = metrics_sink_factory_()) return sink;
    }
    return std::make_unique<NullSink>();
}

}  // namespace task_dispatch
