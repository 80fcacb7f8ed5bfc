/**
 * @file test_registry.cpp
 * @brief Unit tests for PluginRegistry.
 */

#include "core/registry.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace task_dispatch;

namespace {

struct Widget {
    std::string label;
    [[nodiscard]] std::string_view name() const { return label; }
};

static_assert(NamedPlugin<Widget>);

}  // namespace

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        buffer_ = sink->buffer();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Debug);

        ASSERT_TRUE(registry_.register_factory("alpha", [] {
            return std::make_unique<Widget>(Widget{"alpha"});
        }));
        ASSERT_TRUE(registry_.register_factory("beta", [] {
            return std::make_unique<Widget>(Widget{"beta"});
        }));
    }

    PluginRegistry<Widget> registry_;
    std::shared_ptr<MemorySink::Buffer> buffer_;
    std::unique_ptr<Logger> logger_;
};

TEST_F(RegistryTest, CreatesRegisteredProducts) {
    auto alpha = registry_.create("alpha");
    ASSERT_TRUE(alpha.has_value());
    EXPECT_EQ((*alpha)->name(), "alpha");
    EXPECT_TRUE(registry_.contains("beta"));
    EXPECT_EQ(registry_.names(), (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(RegistryTest, UnknownNameIsNotFound) {
    auto missing = registry_.create("gamma");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(RegistryTest, RejectsDuplicateAndEmptyRegistrations) {
    auto dup = registry_.register_factory("alpha", [] { return std::make_unique<Widget>(); });
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, ErrorCode::InvalidArgument);

    EXPECT_FALSE(registry_.register_factory("", [] { return std::make_unique<Widget>(); }));
    EXPECT_FALSE(registry_.register_factory("null", nullptr));
}

TEST_F(RegistryTest, LoadIsolatesFailures) {
    ASSERT_TRUE(registry_.register_factory("broken", []() -> std::unique_ptr<Widget> {
        throw std::runtime_error("missing resource");
    }));
    ASSERT_TRUE(registry_.register_factory("empty", []() -> std::unique_ptr<Widget> {
        return nullptr;
    }));

    ComponentLogger log(*logger_, "registry");
    auto loaded = registry_.load({"alpha", "broken", "unknown", "empty", "beta"}, log);

    ASSERT_EQ(loaded.products.size(), 2u);
    EXPECT_EQ(loaded.products[0]->name(), "alpha");
    EXPECT_EQ(loaded.products[1]->name(), "beta");

    ASSERT_EQ(loaded.failures.size(), 3u);
    EXPECT_EQ(loaded.failures[0].name, "broken");
    EXPECT_NE(loaded.failures[0].reason.find("missing resource"), std::string::npos);
    EXPECT_EQ(loaded.failures[1].name, "unknown");
    EXPECT_EQ(loaded.failures[2].name, "empty");

    MemorySink view(buffer_);
    EXPECT_EQ(view.count_containing(R"("level":"error")"), 3u);
}
