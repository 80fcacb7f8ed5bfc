/**
 * @file main.cpp
 * @brief task_dispatch command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into one dispatch run:
 *   Config → Logger → DispatchContext → Dispatcher → ExecutionResult (JSON)
 *
 * Agents are the built-in simulated blueprints; no language-model service is
 * attached, so decomposition and dependency resolution are deterministic.
 */

#include "agents/builtin_agents.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/specification.hpp"
#include "dispatcher/dispatch_context.hpp"
#include "dispatcher/dispatcher.hpp"
#include "dispatcher/execution_result.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace task_dispatch;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║           task_dispatch v1.0.0            ║
  ║   Specification → Task Graph → Agents     ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path spec_path;
    std::string resume_id;
    std::string log_dir;
    std::filesystem::path output_path;
    int64_t work_ms = -1;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--spec" && i + 1 < argc) {
            args.spec_path = argv[++i];
        } else if (arg == "--resume" && i + 1 < argc) {
            args.resume_id = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--work-ms" && i + 1 < argc) {
            args.work_ms = std::stoll(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: task_dispatch [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --spec <path>      Specification JSON to dispatch\n"
                      << "  --resume <id>      Resume a checkpointed session instead\n"
                      << "  --log-dir <path>   Log output directory\n"
                      << "  --output <path>    Write the execution result JSON here (default: stdout)\n"
                      << "  --work-ms <ms>     Simulated agent work per complexity point (default: 100)\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

void print_summary(const ExecutionResult& result) {
    std::cout << "Session " << result.session_id << ": " << to_string(result.status) << "\n";
    for (const auto& task : result.tasks) {
        std::cout << "  " << task.id << " [" << to_string(task.type) << "] "
                  << to_string(task.status);
        if (task.retries > 0) std::cout << " (retries: " << task.retries << ")";
        if (!task.reason.empty()) std::cout << " - " << task.reason;
        std::cout << "\n";
    }
    std::cout << "  " << result.phases.size() << " phases, critical path "
              << result.critical_path.tasks.size() << " tasks, "
              << result.metrics.end_to_end_latency.count() << " ms end to end" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);
    if (args.spec_path.empty() && args.resume_id.empty()) {
        std::cerr << "Nothing to do: pass --spec <path> or --resume <checkpoint-id>" << std::endl;
        return 2;
    }

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (config.telemetry.stdout_logs || config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<StdoutSink>();
    } else {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "task_dispatch",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    }
    Logger logger(std::move(log_sink), parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    logger.info("task_dispatch starting...");
    logger.info("Max concurrent agents: " + std::to_string(config.coordinator.max_concurrent_agents));

    // ── Dispatch context ─────────────────────
    auto context_result = DispatchContext::create(config, logger);
    if (!context_result) {
        std::cerr << "Invalid configuration: " << context_result.error().message << std::endl;
        return 2;
    }
    auto context = std::move(*context_result);

    SimulationOptions simulation;
    simulation.work_per_complexity = Duration{args.work_ms >= 0 ? args.work_ms : 100};
    if (auto registered = register_builtin_blueprints(context->blueprints(), simulation); !registered) {
        std::cerr << "Failed to register agents: " << registered.error().message << std::endl;
        return 1;
    }

    Dispatcher dispatcher(*context);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::jthread watcher([&dispatcher, &logger](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                logger.warn("Shutdown requested. Cancelling dispatch...");
                dispatcher.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    // ── Run ──────────────────────────────────
    Result<ExecutionResult> outcome = Error{ErrorCode::Unknown, "not started"};
    if (!args.resume_id.empty()) {
        outcome = dispatcher.resume(args.resume_id);
    } else {
        auto spec = load_specification(args.spec_path);
        if (!spec) {
            std::cerr << "Failed to load specification: " << spec.error().message << std::endl;
            return 1;
        }
        outcome = dispatcher.dispatch(*spec);
    }

    watcher.request_stop();
    watcher.join();

    if (!outcome) {
        std::cerr << "Dispatch failed [" << to_string(outcome.error().code) << "]: "
                  << outcome.error().message << std::endl;
        logger.flush();
        return 1;
    }

    const auto& result = *outcome;
    Json exported = result;
    if (args.output_path.empty()) {
        std::cout << exported.dump(2) << std::endl;
    } else {
        std::ofstream out(args.output_path);
        if (!out) {
            std::cerr << "Cannot write " << args.output_path << std::endl;
            return 1;
        }
        out << exported.dump(2) << '\n';
        print_summary(result);
    }

    logger.info("task_dispatch stopped.");
    logger.flush();

    switch (result.status) {
        case ExecutionStatus::Completed: return 0;
        case ExecutionStatus::Cancelled: return 130;
        default:                         return 1;
    }
}
