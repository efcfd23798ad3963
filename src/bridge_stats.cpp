#include "bridge_stats.hpp"

#include <iostream>

namespace mtsatori {

BridgeStats::BridgeStats(EventBus& bus) {
    dropped_sub_ = ScopedSubscription(bus, subscribe<UpdateDroppedEvent>(bus,
        [this](const UpdateDroppedEvent& ev) { on_dropped(ev); }));
    failed_sub_ = ScopedSubscription(bus, subscribe<ActionFailedEvent>(bus,
        [this](const ActionFailedEvent& ev) { on_failed(ev); }));
    normalizer_sub_ = ScopedSubscription(bus, subscribe<NormalizerStateChangedEvent>(bus,
        [this](const NormalizerStateChangedEvent& ev) { on_normalizer(ev); }));
}

BridgeStats::Snapshot BridgeStats::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void BridgeStats::on_dropped(const UpdateDroppedEvent& ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.updates_dropped++;
    stats_.drops_by_reason[ev.reason]++;
}

void BridgeStats::on_failed(const ActionFailedEvent& ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.actions_failed++;
    stats_.failures_by_kind[ev.kind]++;
}

void BridgeStats::on_normalizer(const NormalizerStateChangedEvent& ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.normalizer_transitions++;
    stats_.normalizer_state = ev.to;
}

static std::string join_counts(const std::map<std::string, uint64_t>& counts) {
    std::string out;
    for (const auto& [key, n] : counts) {
        if (!out.empty()) out += ", ";
        out += key + "=" + std::to_string(n);
    }
    return out;
}

std::string BridgeStats::summary() const {
    Snapshot s = snapshot();
    std::string out = "normalizer " + s.normalizer_state + " after "
        + std::to_string(s.normalizer_transitions) + " transitions; "
        + std::to_string(s.updates_dropped) + " updates dropped";
    if (!s.drops_by_reason.empty()) out += " (" + join_counts(s.drops_by_reason) + ")";
    out += "; " + std::to_string(s.actions_failed) + " actions failed";
    if (!s.failures_by_kind.empty()) out += " (" + join_counts(s.failures_by_kind) + ")";
    return out;
}

void BridgeStats::log_summary() const {
    std::cerr << "[stats] " << summary() << "\n";
}

} // namespace mtsatori
