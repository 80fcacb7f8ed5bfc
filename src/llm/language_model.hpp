/**
 * @file language_model.hpp
 * @brief Contract for the external language-model service.
 * @author TaskDispatch contributors
 *
 * Model-assisted decomposition and dependency refinement talk to the model
 * only through ILanguageModelClient. Concrete transports live outside this
 * library; tests inject a scripted client.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace task_dispatch {

struct LanguageModelRequest {
    std::string prompt;
    uint32_t max_tokens = 4000;
    double temperature = 0.1;
    Duration timeout{60000};
};

// ─────────────────────────────────────────────
// ILanguageModelClient (Virtual — injected)
// ─────────────────────────────────────────────

class ILanguageModelClient {
public:
    virtual ~ILanguageModelClient() = default;

    /// Completion text, or an ExternalService / Timeout error.
    virtual Result<std::string> generate(const LanguageModelRequest& request) = 0;
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/**
 * @brief Decorator enforcing `request.timeout` on any client.
 *
 * The wrapped call runs on its own thread; if it overruns, the caller gets
 * a Timeout error immediately and the late completion is discarded.
 */
class TimedModelClient : public ILanguageModelClient {
public:
    explicit TimedModelClient(std::shared_ptr<ILanguageModelClient> inner);

    Result<std::string> generate(const LanguageModelRequest& request) override;
    [[nodiscard]] std::string_view name() const override { return inner_->name(); }

private:
    std::shared_ptr<ILanguageModelClient> inner_;
};

}  // namespace task_dispatch
