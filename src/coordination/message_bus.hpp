/**
 * @file message_bus.hpp
 * @brief Topic-based publish/subscribe with bounded per-subscriber queues.
 * @author TaskDispatch contributors
 *
 * publish() never blocks: it appends to a bounded history ring and to each
 * matching subscriber's queue, dropping (and counting) when a queue is at
 * its bound. Critical messages bypass the bound. Delivery happens either
 * synchronously via drain() or on a background thread after start().
 * Ordering holds per (topic, subscriber) only.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/serialization.hpp"
#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace task_dispatch {

enum class MessagePriority : uint8_t {
    Low,
    Normal,
    High,
    Critical    ///< Never dropped by backpressure
};

[[nodiscard]] constexpr std::string_view to_string(MessagePriority priority) noexcept {
    switch (priority) {
        case MessagePriority::Low:      return "low";
        case MessagePriority::Normal:   return "normal";
        case MessagePriority::High:     return "high";
        case MessagePriority::Critical: return "critical";
    }
    return "unknown";
}

struct Message {
    std::string topic;
    Json payload;
    MessagePriority priority = MessagePriority::Normal;
    Timestamp timestamp;
    std::optional<Duration> ttl;
    uint64_t sequence = 0;

    [[nodiscard]] bool expired(Timestamp now) const noexcept {
        return ttl.has_value() && now - timestamp > *ttl;
    }
};

using MessageHandler = std::function<void(const Message&)>;
using SubscriptionId = uint64_t;

struct SubscriptionStats {
    SubscriptionId id = 0;
    std::string pattern;
    uint64_t delivered = 0;
    uint64_t dropped = 0;
    uint64_t expired = 0;
    uint64_t failed = 0;        ///< Gave up after max delivery attempts
    size_t queued = 0;
};

struct BusStats {
    uint64_t published = 0;
    uint64_t delivered = 0;
    uint64_t dropped = 0;
    uint64_t expired = 0;
    uint64_t redelivered = 0;
    uint64_t failed = 0;
    size_t subscribers = 0;
    size_t history_size = 0;
};

class MessageBus {
public:
    MessageBus(const BusConfig& config, Logger& logger);
    ~MessageBus();

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    /// Fire-and-forget.
    void publish(std::string topic,
                 Json payload,
                 MessagePriority priority = MessagePriority::Normal,
                 std::optional<Duration> ttl = std::nullopt);

    /**
     * @brief Register a handler for topics matching `pattern` ('*' matches any run of characters).
     * @param queue_bound Overrides the configured per-subscriber bound.
     */
    SubscriptionId subscribe(std::string pattern,
                             MessageHandler handler,
                             std::optional<size_t> queue_bound = std::nullopt);

    bool unsubscribe(SubscriptionId id);

    /// Deliver everything currently queued on the calling thread.
    /// @return Number of successful deliveries.
    size_t drain();

    /// Start a background delivery thread. Idempotent.
    void start();
    /// Stop the background thread after it finishes its current delivery.
    void stop();
    [[nodiscard]] bool running() const;

    /// Recent messages matching `pattern`, oldest first, optionally newer than `since`.
    [[nodiscard]] std::vector<Message> history(std::string_view pattern = "*",
                                               std::optional<Timestamp> since = std::nullopt) const;

    [[nodiscard]] BusStats stats() const;
    [[nodiscard]] std::optional<SubscriptionStats> subscription_stats(SubscriptionId id) const;

    [[nodiscard]] static bool topic_matches(std::string_view pattern, std::string_view topic) noexcept;

private:
    struct Subscription {
        SubscriptionId id = 0;
        std::string pattern;
        MessageHandler handler;
        size_t bound = 0;
        std::deque<Message> queue;
        bool delivering = false;
        bool active = true;
        SubscriptionStats stats;
    };

    /// nullopt when nothing is deliverable; otherwise whether the handler accepted the message.
    std::optional<bool> deliver_one();
    void run(std::stop_token stop);

    BusConfig config_;
    ComponentLogger log_;

    mutable std::mutex mutex_;
    std::condition_variable_any pending_cv_;
    std::map<SubscriptionId, std::shared_ptr<Subscription>> subscriptions_;
    std::deque<Message> history_;
    SubscriptionId next_id_ = 1;
    uint64_t next_sequence_ = 1;
    BusStats stats_;

    std::atomic<bool> running_{false};
    std::jthread worker_;
};

}  // namespace task_dispatch
