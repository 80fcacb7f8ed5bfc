/**
 * @file message_bus.cpp
 * @brief MessageBus implementation.
 * @author TaskDispatch contributors
 */

#include "coordination/message_bus.hpp"

#include <algorithm>
#include <chrono>
#include <format>

namespace task_dispatch {

MessageBus::MessageBus(const BusConfig& config, Logger& logger)
    : config_(config)
    , log_(logger, "message_bus") {}

MessageBus::~MessageBus() {
    stop();
}

// ─────────────────────────────────────────────
// Publish / Subscribe
// ─────────────────────────────────────────────

void MessageBus::publish(std::string topic,
                         Json payload,
                         MessagePriority priority,
                         std::optional<Duration> ttl) {
    {
        std::lock_guard lock(mutex_);
        Message message{
            .topic = std::move(topic),
            .payload = std::move(payload),
            .priority = priority,
            .timestamp = std::chrono::system_clock::now(),
            .ttl = ttl,
            .sequence = next_sequence_++
        };
        ++stats_.published;

        for (auto& [id, sub] : subscriptions_) {
            if (!sub->active || !topic_matches(sub->pattern, message.topic)) continue;
            if (sub->queue.size() >= sub->bound && priority != MessagePriority::Critical) {
                ++sub->stats.dropped;
                ++stats_.dropped;
                continue;
            }
            sub->queue.push_back(message);
        }

        if (config_.history_size > 0) {
            history_.push_back(std::move(message));
            while (history_.size() > config_.history_size) history_.pop_front();
        }
    }
    pending_cv_.notify_one();
}

SubscriptionId MessageBus::subscribe(std::string pattern,
                                     MessageHandler handler,
                                     std::optional<size_t> queue_bound) {
    std::lock_guard lock(mutex_);
    auto sub = std::make_shared<Subscription>();
    sub->id = next_id_++;
    sub->pattern = std::move(pattern);
    sub->handler = std::move(handler);
    sub->bound = queue_bound.value_or(config_.subscriber_queue_bound);
    sub->stats.id = sub->id;
    sub->stats.pattern = sub->pattern;
    subscriptions_.emplace(sub->id, sub);
    return sub->id;
}

bool MessageBus::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    auto it = subscriptions_.find(id);
    if (it == subscriptions_.end()) return false;
    it->second->active = false;
    it->second->queue.clear();
    subscriptions_.erase(it);
    return true;
}

// ─────────────────────────────────────────────
// Delivery
// ─────────────────────────────────────────────

std::optional<bool> MessageBus::deliver_one() {
    std::shared_ptr<Subscription> sub;
    Message message;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, candidate] : subscriptions_) {
            if (candidate->active && !candidate->delivering && !candidate->queue.empty()) {
                sub = candidate;
                break;
            }
        }
        if (!sub) return std::nullopt;
        message = std::move(sub->queue.front());
        sub->queue.pop_front();
        sub->delivering = true;
    }

    if (message.expired(std::chrono::system_clock::now())) {
        std::lock_guard lock(mutex_);
        ++sub->stats.expired;
        ++stats_.expired;
        sub->delivering = false;
        return false;
    }

    uint32_t max_attempts = std::max<uint32_t>(1, config_.max_delivery_attempts);
    uint32_t attempts = 0;
    bool delivered = false;
    while (attempts < max_attempts && !delivered) {
        ++attempts;
        try {
            sub->handler(message);
            delivered = true;
        } catch (const std::exception& e) {
            log_.warn(std::format("Handler for '{}' failed on '{}' (attempt {}/{}): {}",
                                  sub->pattern, message.topic, attempts, max_attempts, e.what()));
        }
    }

    std::lock_guard lock(mutex_);
    sub->delivering = false;
    stats_.redelivered += attempts - 1;
    if (delivered) {
        ++sub->stats.delivered;
        ++stats_.delivered;
    } else {
        ++sub->stats.failed;
        ++stats_.failed;
        log_.error(std::format("Giving up on '{}' for subscriber '{}' after {} attempts",
                               message.topic, sub->pattern, attempts));
    }
    return delivered;
}

size_t MessageBus::drain() {
    size_t delivered = 0;
    while (auto outcome = deliver_one()) {
        if (*outcome) ++delivered;
    }
    return delivered;
}

void MessageBus::start() {
    if (running_.exchange(true)) return;
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void MessageBus::stop() {
    if (!running_.exchange(false)) return;
    worker_.request_stop();
    pending_cv_.notify_all();
    worker_.join();
}

bool MessageBus::running() const {
    return running_.load();
}

void MessageBus::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        drain();
        std::unique_lock lock(mutex_);
        pending_cv_.wait(lock, stop, [this] {
            return std::any_of(subscriptions_.begin(), subscriptions_.end(), [](const auto& entry) {
                const auto& sub = entry.second;
                return sub->active && !sub->delivering && !sub->queue.empty();
            });
        });
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<Message> MessageBus::history(std::string_view pattern, std::optional<Timestamp> since) const {
    std::lock_guard lock(mutex_);
    std::vector<Message> out;
    for (const auto& message : history_) {
        if (since && message.timestamp <= *since) continue;
        if (topic_matches(pattern, message.topic)) out.push_back(message);
    }
    return out;
}

BusStats MessageBus::stats() const {
    std::lock_guard lock(mutex_);
    BusStats stats = stats_;
    stats.subscribers = subscriptions_.size();
    stats.history_size = history_.size();
    return stats;
}

std::optional<SubscriptionStats> MessageBus::subscription_stats(SubscriptionId id) const {
    std::lock_guard lock(mutex_);
    auto it = subscriptions_.find(id);
    if (it == subscriptions_.end()) return std::nullopt;
    auto stats = it->second->stats;
    stats.queued = it->second->queue.size();
    return stats;
}

bool MessageBus::topic_matches(std::string_view pattern, std::string_view topic) noexcept {
    size_t p = 0;
    size_t t = 0;
    size_t star = std::string_view::npos;
    size_t resume = 0;

    while (t < topic.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (p < pattern.size() && pattern[p] == topic[t]) {
            ++p;
            ++t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

}  // namespace task_dispatch
