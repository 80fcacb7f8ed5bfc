/**
 * @file task_decomposer.cpp
 * @brief Pattern and model decomposers plus validation.
 * @author TaskDispatch contributors
 */

#include "graph/task_decomposer.hpp"

#include "core/serialization.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace task_dispatch {

namespace {

struct TaskTemplate {
    const char* id;
    const char* description;
    TaskType type;
    double complexity;
    int priority;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    const char* subject;
    bool required = true;
    bool best_effort = false;
};

Task instantiate(const TaskTemplate& t) {
    Task task;
    task.id = t.id;
    task.description = t.description;
    task.type = t.type;
    task.estimated_complexity = t.complexity;
    task.priority = t.priority;
    task.inputs = t.inputs;
    task.outputs = t.outputs;
    task.context["subject"] = t.subject;
    task.required = t.required;
    task.best_effort = t.best_effort;
    return task;
}

bool has_any(const std::set<std::string>& tokens, std::initializer_list<const char*> words) {
    return std::any_of(words.begin(), words.end(),
                       [&](const char* w) { return tokens.contains(w); });
}

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string join(const std::vector<std::string>& items) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << items[i];
    }
    return oss.str();
}

// ── Archetype templates ──────────────────────

const std::vector<TaskTemplate>& ui_templates() {
    static const std::vector<TaskTemplate> t = {
        {"ui_design", "Design UI component architecture and wireframes",
         TaskType::CodeWriting, 3, 7, {"research_findings"}, {"ui_wireframes"}, "frontend"},
        {"ui_components", "Implement core UI components and layouts",
         TaskType::CodeWriting, 4, 5, {"ui_wireframes"}, {"ui_components"}, "frontend"},
        {"ui_styling", "Implement responsive styling and theme system",
         TaskType::CodeWriting, 3, 4, {"ui_components"}, {"ui_styles"}, "frontend"},
    };
    return t;
}

const std::vector<TaskTemplate>& backend_templates() {
    static const std::vector<TaskTemplate> t = {
        {"backend_api", "Design and implement core API endpoints",
         TaskType::CodeWriting, 4, 6, {"research_findings"}, {"api_endpoints"}, "backend"},
        {"backend_auth", "Implement authentication and authorization system",
         TaskType::CodeWriting, 4, 6, {}, {"auth_service"}, "backend"},
        {"backend_business_logic", "Implement core business logic and services",
         TaskType::CodeWriting, 5, 5, {"api_endpoints"}, {"business_services"}, "backend"},
    };
    return t;
}

const std::vector<TaskTemplate>& data_templates() {
    static const std::vector<TaskTemplate> t = {
        {"data_schema", "Design and implement database schema",
         TaskType::CodeWriting, 3, 7, {}, {"database_schema"}, "database"},
        {"data_access", "Implement data access layer and repositories",
         TaskType::CodeWriting, 3, 5, {"database_schema"}, {"data_access_layer"}, "database"},
    };
    return t;
}

const std::vector<TaskTemplate>& integration_templates() {
    static const std::vector<TaskTemplate> t = {
        {"integration_research", "Research and evaluate external service integrations",
         TaskType::Research, 2, 6, {}, {"integration_evaluation"}, "integration"},
        {"integration_impl", "Implement external service integrations",
         TaskType::CodeWriting, 4, 5, {"integration_evaluation"}, {"integrations"}, "integration"},
    };
    return t;
}

const TaskTemplate kResearchTemplate{
    "research", "Research technical requirements and architecture patterns",
    TaskType::Research, 2, 8, {}, {"research_findings"}, "general"};

const TaskTemplate kUnitTests{
    "test_unit", "Write comprehensive unit tests for core functionality",
    TaskType::Testing, 3, 4, {}, {"unit_tests"}, "general"};
const TaskTemplate kIntegrationTests{
    "test_integration", "Write integration tests for API endpoints and services",
    TaskType::Testing, 4, 3, {"unit_tests"}, {"integration_tests"}, "general"};
const TaskTemplate kE2eTests{
    "test_e2e", "Write end-to-end tests for critical user workflows",
    TaskType::Testing, 5, 3, {}, {"e2e_tests"}, "general"};

const TaskTemplate kApiDocs{
    "docs_api", "Generate API documentation and examples",
    TaskType::Documentation, 2, 2, {"api_endpoints"}, {"api_docs"}, "general",
    /*required=*/false, /*best_effort=*/true};
const TaskTemplate kUserDocs{
    "docs_user", "Create user documentation and setup guides",
    TaskType::Documentation, 3, 2, {}, {"user_guide"}, "general",
    /*required=*/false, /*best_effort=*/true};

constexpr const char* kComplexFeatures[] = {
    "authentication", "real-time", "scalability", "performance",
    "integration", "api", "database", "security", "testing"
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// Analysis
// ─────────────────────────────────────────────

std::set<std::string> tokenize(std::string_view text) {
    std::set<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else if (!current.empty()) {
            tokens.insert(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.insert(std::move(current));
    return tokens;
}

bool has_words(std::string_view text) {
    // Bytes of multi-byte UTF-8 sequences count as letters in any script.
    return std::any_of(text.begin(), text.end(), [](char c) {
        auto byte = static_cast<unsigned char>(c);
        return byte >= 0x80 || std::isalnum(byte) != 0;
    });
}

SpecAnalysis analyze_specification(const Specification& spec) {
    SpecAnalysis a;
    auto text = spec.full_text();
    auto tokens = tokenize(text);
    auto lowered = lower(text);

    a.complexity_score = 3.0 + std::min(static_cast<double>(spec.requirements.size()) * 0.5, 3.0);
    for (const char* feature : kComplexFeatures) {
        if (lowered.find(feature) != std::string::npos) a.complexity_score += 0.5;
    }
    a.complexity_score = std::min(a.complexity_score, 10.0);

    a.has_ui = has_any(tokens, {"ui", "interface", "frontend", "component", "page", "screen", "form"});
    a.has_backend = has_any(tokens, {"api", "server", "backend", "service", "endpoint", "logic"});
    a.has_data = has_any(tokens, {"database", "data", "storage", "model", "schema"});
    a.has_integrations = has_any(tokens, {"integration", "external", "third", "webhook"})
        || lowered.find("third-party") != std::string::npos;
    a.needs_testing = has_any(tokens, {"test", "tests", "testing", "quality", "qa"});
    a.needs_integration_tests = has_any(tokens, {"api", "integration"});
    a.needs_e2e_tests = has_any(tokens, {"ui", "user", "users"});

    if (a.has_ui) a.domains.insert("frontend");
    if (a.has_backend) a.domains.insert("backend");
    if (a.has_data) a.domains.insert("database");
    if (a.has_integrations) a.domains.insert("integration");
    if (a.needs_testing) a.domains.insert("testing");
    if (has_any(tokens, {"auth", "login", "authentication"})) a.domains.insert("authentication");
    if (has_any(tokens, {"deploy", "deployment", "hosting", "production", "infrastructure"})) {
        a.domains.insert("deployment");
    }
    return a;
}

double refine_complexity(TaskType type, double complexity) noexcept {
    double modifier = 1.0;
    switch (type) {
        case TaskType::Research:      modifier = 0.8; break;
        case TaskType::Testing:       modifier = 0.9; break;
        case TaskType::Review:        modifier = 0.7; break;
        case TaskType::Documentation: modifier = 0.6; break;
        case TaskType::Debugging:     modifier = 1.2; break;
        default: break;
    }
    return clamp_complexity(complexity * modifier);
}

// ─────────────────────────────────────────────
// PatternDecomposer
// ─────────────────────────────────────────────

std::vector<Task> PatternDecomposer::decompose(const Specification& spec) const {
    return decompose(spec, analyze_specification(spec));
}

std::vector<Task> PatternDecomposer::decompose(const Specification& spec,
                                               const SpecAnalysis& analysis) const {
    std::vector<Task> tasks;
    auto append = [&tasks](const std::vector<TaskTemplate>& templates) {
        for (const auto& t : templates) tasks.push_back(instantiate(t));
    };

    if (analysis.any_archetype()) {
        if (analysis.complexity_score > 6.0) tasks.push_back(instantiate(kResearchTemplate));
        if (analysis.has_ui) append(ui_templates());
        if (analysis.has_backend) append(backend_templates());
        if (analysis.has_data) append(data_templates());
        if (analysis.has_integrations) append(integration_templates());

        if (analysis.needs_testing) {
            tasks.push_back(instantiate(kUnitTests));
            if (analysis.needs_integration_tests) tasks.push_back(instantiate(kIntegrationTests));
            if (analysis.needs_e2e_tests) tasks.push_back(instantiate(kE2eTests));
        }

        if (analysis.has_backend) tasks.push_back(instantiate(kApiDocs));
        tasks.push_back(instantiate(kUserDocs));
        return tasks;
    }

    // No archetype matched: one generic task per requirement.
    for (size_t i = 0; i < spec.requirements.size(); ++i) {
        const auto& requirement = spec.requirements[i];
        if (!has_words(requirement)) continue;
        Task task;
        task.id = "requirement_" + std::to_string(i);
        task.type = TaskType::Generic;
        task.description = requirement;
        task.estimated_complexity = 2.0;
        task.context["subject"] = "general";
        task.context["requirement_index"] = std::to_string(i);
        tasks.push_back(std::move(task));
    }

    if (tasks.empty()) {
        Task task;
        task.id = "generic_0";
        task.type = TaskType::Generic;
        task.description = !spec.title.empty() ? spec.title
                         : !spec.description.empty() ? spec.description
                         : "Complete the requested work";
        task.estimated_complexity = 2.0;
        task.context["subject"] = "general";
        tasks.push_back(std::move(task));
    }
    return tasks;
}

// ─────────────────────────────────────────────
// ModelDecomposer
// ─────────────────────────────────────────────

ModelDecomposer::ModelDecomposer(std::shared_ptr<ILanguageModelClient> client,
                                 const DecomposerConfig& config,
                                 ComponentLogger logger)
    : client_(std::move(client)), config_(config), log_(std::move(logger)) {}

std::string ModelDecomposer::build_prompt(const Specification& spec,
                                          const SpecAnalysis& analysis) const {
    std::ostringstream types;
    for (size_t i = 0; i < std::size(kAllTaskTypes); ++i) {
        if (i > 0) types << ", ";
        types << to_string(kAllTaskTypes[i]);
    }

    std::ostringstream domains;
    for (const auto& d : analysis.domains) domains << d << ' ';

    std::ostringstream oss;
    oss << "Decompose the following software specification into atomic tasks.\n\n"
        << "Title: " << spec.title << '\n'
        << "Description: " << spec.description << '\n'
        << "Requirements: " << join(spec.requirements) << '\n'
        << "Constraints: " << join(spec.constraints) << '\n'
        << "Success criteria: " << join(spec.success_criteria) << "\n\n"
        << "Complexity score: " << analysis.complexity_score << "/10\n"
        << "Domains: " << domains.str() << "\n\n"
        << "Each task must be completable by a single specialist. Task types: "
        << types.str() << ". Complexity 1-5, priority 0-10 (10 highest).\n"
        << "Set required to false for tasks whose failure should not fail the project, "
        << "and best_effort to true when dependents can proceed without their output.\n\n"
        << "Respond with JSON only:\n"
        << R"({"tasks": [{"description": "...", "task_type": "...", )"
        << R"("estimated_complexity": 3, "priority": 5, "input_requirements": [], )"
        << R"("output_artifacts": [], "required": true, "best_effort": false, "context": {}}]})" << '\n';
    return oss.str();
}

Result<std::vector<Task>> ModelDecomposer::parse_response(std::string_view response) const {
    auto doc = extract_json_object(response);
    if (!doc) return doc.error();

    auto it = doc->find("tasks");
    if (it == doc->end() || !it->is_array()) {
        return Error{ErrorCode::ExternalService, "Model response has no tasks array"};
    }

    std::vector<Task> tasks;
    size_t index = 0;
    for (const auto& entry : *it) {
        size_t position = index++;
        if (!entry.is_object()) {
            log_.warn("Skipping non-object task entry " + std::to_string(position));
            continue;
        }

        auto type_name = entry.value("task_type", std::string{"generic"});
        auto type = parse_task_type(type_name);
        if (!type) {
            log_.warn("Skipping task entry " + std::to_string(position)
                      + " with unknown type '" + type_name + "'");
            continue;
        }

        auto fields = [&]() -> Result<Task> {
            try {
                Task task;
                task.type = *type;
                task.id = "task_" + std::to_string(position) + "_" + std::string{to_string(*type)};
                task.description = entry.value("description", std::string{});
                task.estimated_complexity = entry.value("estimated_complexity", 3.0);
                task.priority = entry.value("priority", 5);
                task.inputs = entry.value("input_requirements", std::vector<std::string>{});
                task.outputs = entry.value("output_artifacts", std::vector<std::string>{});
                task.required = entry.value("required", true);
                task.best_effort = entry.value("best_effort", false);
                if (auto ctx = entry.find("context"); ctx != entry.end() && ctx->is_object()) {
                    for (const auto& [key, value] : ctx->items()) {
                        task.context[key] = value.is_string() ? value.get<std::string>() : value.dump();
                    }
                }
                return task;
            } catch (const Json::exception& e) {
                return Error{ErrorCode::ExternalService, e.what()};
            }
        }();

        if (!fields) {
            log_.warn("Skipping malformed task entry " + std::to_string(position) + ": "
                      + fields.error().message);
            continue;
        }
        tasks.push_back(std::move(fields).value());
    }

    if (tasks.empty()) {
        return Error{ErrorCode::ExternalService, "Model response contained no usable tasks"};
    }
    return tasks;
}

Result<std::vector<Task>> ModelDecomposer::decompose(const Specification& spec,
                                                     const SpecAnalysis& analysis) const {
    LanguageModelRequest request;
    request.prompt = build_prompt(spec, analysis);
    request.max_tokens = config_.model_max_tokens;
    request.temperature = 0.1;
    request.timeout = Duration{config_.model_timeout_ms};

    auto response = client_->generate(request);
    if (!response) return response.error();
    return parse_response(*response);
}

// ─────────────────────────────────────────────
// TaskDecomposer
// ─────────────────────────────────────────────

TaskDecomposer::TaskDecomposer(const DecomposerConfig& config,
                               Logger& logger,
                               std::shared_ptr<ILanguageModelClient> client)
    : config_(config), log_(logger, "decomposer") {
    if (client && config_.model_assisted) {
        auto timed = std::make_shared<TimedModelClient>(std::move(client));
        model_ = std::make_unique<ModelDecomposer>(std::move(timed), config_, log_);
    }
}

Result<Decomposition> TaskDecomposer::decompose(const Specification& spec) const {
    if (spec.is_blank()) {
        return Error{ErrorCode::DecompositionError, "Specification has no content to decompose"};
    }

    auto analysis = analyze_specification(spec);
    Decomposition out;

    if (model_) {
        auto from_model = model_->decompose(spec, analysis);
        if (from_model) {
            auto validated = validate_and_refine(std::move(from_model).value(), spec);
            if (validated) {
                out.tasks = std::move(validated).value();
                out.strategy = "model";
                log_.info("Model decomposition produced " + std::to_string(out.tasks.size()) + " tasks");
                return out;
            }
            out.fallback_reason = validated.error().message;
        } else {
            out.fallback_reason = from_model.error().message;
        }
        log_.warn("Model decomposition unavailable, using patterns: " + out.fallback_reason);
    }

    auto validated = validate_and_refine(pattern_.decompose(spec, analysis), spec);
    if (!validated) return validated.error();

    out.tasks = std::move(validated).value();
    out.strategy = "pattern";
    log_.info("Pattern decomposition produced " + std::to_string(out.tasks.size()) + " tasks");
    return out;
}

Result<std::vector<Task>> TaskDecomposer::validate_and_refine(std::vector<Task> tasks,
                                                              const Specification& spec) const {
    std::vector<Task> validated;
    std::set<TaskId> ids;

    for (auto& task : tasks) {
        if (!has_words(task.description)) {
            log_.warn("Dropping task '" + task.id + "' with empty description");
            continue;
        }

        task.estimated_complexity = refine_complexity(task.type, task.estimated_complexity);
        task.status = TaskStatus::Pending;
        if (!spec.id.empty()) task.context.emplace("specification_id", spec.id);

        if (task.id.empty()) task.id = "task";
        if (ids.contains(task.id)) {
            uint32_t counter = 1;
            while (ids.contains(task.id + "_" + std::to_string(counter))) ++counter;
            task.id += "_" + std::to_string(counter);
        }
        ids.insert(task.id);
        validated.push_back(std::move(task));
    }

    if (validated.empty()) {
        return Error{ErrorCode::DecompositionError, "Decomposition produced no valid tasks"};
    }
    return validated;
}

}  // namespace task_dispatch
