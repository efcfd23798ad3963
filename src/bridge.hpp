#pragma once
#include "event_bus.hpp"
#include "event_stream.hpp"
#include "normalizer.hpp"
#include "session.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>

namespace mtsatori {

// Pumps native updates from the session's backend through the normalizer
// and turns session state changes into login-updated events.
class BridgeRunner {
public:
    BridgeRunner(SessionController& session, EventNormalizer& normalizer,
                 EventStream& stream, EventBus& bus);

    // One poll of the backend. Returns the number of gateway events emitted.
    // Does nothing unless the session is authenticated.
    size_t pump_once(std::chrono::milliseconds timeout);

    // Pump until stop is set or the session terminates. Reconnects while the
    // session is authenticating, waiting reconnect_delay between attempts.
    void run(const std::atomic<bool>& stop,
             std::chrono::milliseconds poll_timeout = std::chrono::seconds(1),
             std::chrono::milliseconds reconnect_delay = std::chrono::seconds(5));

private:
    void on_session_state(const SessionStateChangedEvent& ev);

    SessionController& session_;
    EventNormalizer& normalizer_;
    EventStream& stream_;
    ScopedSubscription subscription_;

    // Updates that followed a connection drop while the resume was pending.
    std::mutex backlog_mutex_;
    std::vector<NativeUpdate> backlog_;
};

} // namespace mtsatori
