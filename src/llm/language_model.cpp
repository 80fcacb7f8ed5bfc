/**
 * @file language_model.cpp
 * @brief TimedModelClient implementation.
 * @author TaskDispatch contributors
 */

#include "llm/language_model.hpp"

#include <future>
#include <thread>

namespace task_dispatch {

TimedModelClient::TimedModelClient(std::shared_ptr<ILanguageModelClient> inner)
    : inner_(std::move(inner)) {}

Result<std::string> TimedModelClient::generate(const LanguageModelRequest& request) {
    auto promise = std::make_shared<std::promise<Result<std::string>>>();
    auto future = promise->get_future();

    // The worker owns copies of everything it touches so it may outlive us.
    std::jthread worker([inner = inner_, request, promise] {
        try {
            promise->set_value(inner->generate(request));
        } catch (const std::exception& e) {
            promise->set_value(Error{ErrorCode::ExternalService,
                                     std::string{"Model client threw: "} + e.what()});
        }
    });

    if (future.wait_for(request.timeout) != std::future_status::ready) {
        worker.detach();
        return Error{ErrorCode::Timeout,
                     "Model call exceeded " + std::to_string(request.timeout.count()) + " ms"};
    }
    return future.get();
}

}  // namespace task_dispatch
