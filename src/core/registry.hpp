/**
 * @file registry.hpp
 * @brief Name → factory registry with isolated load failures.
 * @author TaskDispatch contributors
 *
 * Factories are registered once at startup. Instantiating a list of names
 * never aborts on a single bad plug-in: failures are logged, reported and
 * excluded while the remaining products load normally.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace task_dispatch {

struct PluginLoadFailure {
    std::string name;
    std::string reason;
};

template <NamedPlugin Product>
class PluginRegistry {
public:
    using Factory = std::function<std::unique_ptr<Product>()>;

    struct Loaded {
        std::vector<std::unique_ptr<Product>> products;
        std::vector<PluginLoadFailure> failures;
    };

    /// InvalidArgument on an empty name, a null factory or a duplicate.
    Result<void> register_factory(std::string name, Factory factory) {
        if (name.empty() || !factory) {
            return Error{ErrorCode::InvalidArgument, "Plug-in registration needs a name and a factory"};
        }
        if (factories_.contains(name)) {
            return Error{ErrorCode::InvalidArgument, "Plug-in already registered: " + name};
        }
        factories_.emplace(std::move(name), std::move(factory));
        return {};
    }

    [[nodiscard]] bool contains(const std::string& name) const {
        return factories_.contains(name);
    }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(factories_.size());
        for (const auto& [name, _] : factories_) out.push_back(name);
        return out;
    }

    [[nodiscard]] Result<std::unique_ptr<Product>> create(const std::string& name) const {
        auto it = factories_.find(name);
        if (it == factories_.end()) {
            return Error{ErrorCode::NotFound, "No plug-in registered as '" + name + "'"};
        }
        try {
            auto product = it->second();
            if (!product) {
                return Error{ErrorCode::Unknown, "Factory for '" + name + "' returned nothing"};
            }
            return product;
        } catch (const std::exception& e) {
            return Error{ErrorCode::Unknown, "Factory for '" + name + "' threw: " + e.what()};
        }
    }

    /// Instantiate `wanted` in order, isolating each failure.
    [[nodiscard]] Loaded load(const std::vector<std::string>& wanted,
                              const ComponentLogger& log) const {
        Loaded loaded;
        for (const auto& name : wanted) {
            auto product = create(name);
            if (!product) {
                log.error("Plug-in '" + name + "' failed to load: " + product.error().message);
                loaded.failures.push_back({name, product.error().message});
                continue;
            }
            loaded.products.push_back(std::move(product).value());
        }
        return loaded;
    }

private:
    std::map<std::string, Factory> factories_;
};

}  // namespace task_dispatch
