/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe between the engine and its consumers
 *
 * WHY THIS FILE EXISTS:
 * The orchestrator announces job-list changes, activity entries, quota
 * refreshes and connectivity flips without knowing who listens. A
 * transport layer or the daemon's log mirror subscribes by event type.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<JobsUpdatedEvent>([](const JobsUpdatedEvent& e) { ... });
 * bus.emit(JobsUpdatedEvent{jobs});
 * bus.unsubscribe(id);
 *
 * Or tie the subscription to an owner's lifetime:
 * Subscription sub = bus.subscribe_scoped<StatsUpdatedEvent>(...);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cloudsync::events {

using SubscriptionId = std::uint64_t;

class EventBus;

/**
 * @brief Move-only guard that unsubscribes when destroyed
 *
 * Must not outlive the bus it came from.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus& bus, SubscriptionId id) : bus_(&bus), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept
        : bus_(std::exchange(other.bus_, nullptr)), id_(other.id_) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = std::exchange(other.bus_, nullptr);
            id_ = other.id_;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    SubscriptionId id() const noexcept { return id_; }
    void reset();

private:
    EventBus* bus_ = nullptr;
    SubscriptionId id_ = 0;
};

/**
 * @brief Type-keyed event bus
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/emit may be called from any thread
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may itself subscribe, unsubscribe or emit
 * - A handler added during dispatch first sees the next emit
 */
class EventBus {
public:
    explicit EventBus(std::shared_ptr<spdlog::logger> logger = nullptr)
        : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        auto dispatch = std::make_shared<const Dispatch>(
            [handler = std::move(handler)](const void* event) {
                handler(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = ++last_id_;
        const std::type_index type(typeid(EventType));
        channels_[type].push_back({id, std::move(dispatch)});
        owners_.emplace(id, type);
        return id;
    }

    template<typename EventType>
    Subscription subscribe_scoped(std::function<void(const EventType&)> handler) {
        return Subscription(*this, subscribe<EventType>(std::move(handler)));
    }

    /// @return false if @p id is unknown or already removed
    bool unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto owner = owners_.find(id);
        if (owner == owners_.end()) {
            return false;
        }
        auto& slots = channels_[owner->second];
        slots.erase(std::remove_if(slots.begin(), slots.end(),
                                   [id](const Slot& slot) { return slot.id == id; }),
                    slots.end());
        owners_.erase(owner);
        return true;
    }

    /**
     * @brief Deliver @p event to every current subscriber of its type
     *
     * A handler that throws is logged and skipped; the emitter never
     * sees the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<const Dispatch>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = channels_.find(std::type_index(typeid(EventType)));
            if (it == channels_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& slot : it->second) {
                targets.push_back(slot.dispatch);
            }
        }

        for (const auto& dispatch : targets) {
            try {
                (*dispatch)(&event);
            } catch (const std::exception& e) {
                logger_->error("Handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = channels_.find(std::type_index(typeid(EventType)));
        return it != channels_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        channels_.clear();
        owners_.clear();
    }

private:
    using Dispatch = std::function<void(const void*)>;

    struct Slot {
        SubscriptionId id;
        std::shared_ptr<const Dispatch> dispatch;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Slot>> channels_;
    std::unordered_map<SubscriptionId, std::type_index> owners_;
    SubscriptionId last_id_ = 0;
    std::shared_ptr<spdlog::logger> logger_;
};

inline void Subscription::reset() {
    if (bus_) {
        bus_->unsubscribe(id_);
        bus_ = nullptr;
    }
}

} // namespace cloudsync::events
