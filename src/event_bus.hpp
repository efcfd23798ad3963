#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace mtsatori {

using EventHandler = std::function<void(const Event&)>;

class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish synchronously; handlers run in registration order on the
    // publishing thread, without the bus lock held. A throwing handler is
    // logged and skipped so one listener cannot break the publisher.
    // Returns the number of handlers that completed.
    size_t publish(const Event& event);

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Unsubscribes on destruction.
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    ScopedSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() { reset(); }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;
    ScopedSubscription(ScopedSubscription&& o) noexcept : bus_(o.bus_), id_(o.id_) {
        o.bus_ = nullptr;
    }
    ScopedSubscription& operator=(ScopedSubscription&& o) noexcept {
        if (this != &o) {
            reset();
            bus_ = o.bus_;
            id_ = o.id_;
            o.bus_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (bus_) bus_->unsubscribe(id_);
        bus_ = nullptr;
    }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

} // namespace mtsatori
