#pragma once
#include "backend.hpp"
#include "codec.hpp"
#include "event_bus.hpp"
#include "event_stream.hpp"
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace mtsatori {

enum class NormalizerState { Disconnected, Connecting, Syncing, Live };

const char* normalizer_state_name(NormalizerState state);

// Recently seen keys, oldest evicted first once capacity is reached.
class RecentSet {
public:
    explicit RecentSet(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // Returns false if key was already present.
    bool insert(const std::string& key);
    bool contains(const std::string& key) const { return keys_.count(key) > 0; }
    size_t size() const { return order_.size(); }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::deque<std::string> order_;
    std::unordered_set<std::string> keys_;
};

// Turns the native update stream into gateway events.
//
// Disconnected -> Connecting on on_login(); Connecting -> Syncing on the
// backend's catch-up checkpoint; Syncing -> Live once the backlog is
// drained; any state -> Disconnected on connection loss. Content updates are
// converted in every state but Disconnected, where they are dropped: the
// backend replays them on the next connect and the recently-seen set keeps
// the replay from producing a second event.
class EventNormalizer {
public:
    EventNormalizer(EventStream& stream, EventBus& bus, size_t dedup_window);

    void on_login(const NativeUser& self);
    void on_disconnect();
    // Final stop at session teardown; updates are dropped afterwards.
    void stop();

    // Returns the id of the emitted event, or 0 if the update produced none.
    // Never throws for a bad update.
    uint64_t process(const NativeUpdate& update);

    // Pure conversion, no state change. nullopt for control updates and
    // updates that do not map to an event; throws BridgeError for malformed
    // ones.
    std::optional<GatewayEvent> convert(const NativeUpdate& update) const;

    NormalizerState state() const;
    int64_t self_id() const;
    size_t seen_count() const;

private:
    // Both record a notice under mutex_; flush_notices() publishes them on
    // the bus after the lock is released.
    void transition(NormalizerState to);
    void dropped(const NativeUpdate& update, const std::string& reason);
    void flush_notices();
    std::optional<GatewayEvent> take_event(const NativeUpdate& update);

    EventStream& stream_;
    EventBus& bus_;

    mutable std::mutex mutex_;
    NormalizerState state_ = NormalizerState::Disconnected;
    NativeUser self_;
    CodecContext ctx_;
    RecentSet seen_;
    std::vector<NormalizerStateChangedEvent> transitions_;
    std::vector<UpdateDroppedEvent> drops_;
};

} // namespace mtsatori
