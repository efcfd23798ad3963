#pragma once
#include "event_bus.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace mtsatori {

// Counts dropped updates, failed actions and normalizer transitions seen on
// the bus. The publishers log each one; this keeps the totals.
class BridgeStats {
public:
    struct Snapshot {
        uint64_t updates_dropped = 0;
        uint64_t actions_failed = 0;
        uint64_t normalizer_transitions = 0;
        std::string normalizer_state = "Disconnected";
        std::map<std::string, uint64_t> drops_by_reason;
        std::map<std::string, uint64_t> failures_by_kind;
    };

    explicit BridgeStats(EventBus& bus);

    Snapshot snapshot() const;

    // One line, e.g. "normalizer Live after 3 transitions; 2 updates dropped
    // (duplicate=2); 0 actions failed".
    std::string summary() const;
    void log_summary() const;

private:
    void on_dropped(const UpdateDroppedEvent& ev);
    void on_failed(const ActionFailedEvent& ev);
    void on_normalizer(const NormalizerStateChangedEvent& ev);

    mutable std::mutex mutex_;
    Snapshot stats_;

    ScopedSubscription dropped_sub_;
    ScopedSubscription failed_sub_;
    ScopedSubscription normalizer_sub_;
};

} // namespace mtsatori
