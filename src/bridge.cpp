#include "bridge.hpp"
#include "ids.hpp"
#include "util.hpp"

#include <iostream>
#include <thread>

namespace mtsatori {

static void sleep_unless(const std::atomic<bool>& stop, std::chrono::milliseconds total) {
    auto deadline = std::chrono::steady_clock::now() + total;
    while (!stop.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

BridgeRunner::BridgeRunner(SessionController& session, EventNormalizer& normalizer,
                           EventStream& stream, EventBus& bus)
    : session_(session), normalizer_(normalizer), stream_(stream) {
    subscription_ = ScopedSubscription(bus, subscribe<SessionStateChangedEvent>(bus,
        [this](const SessionStateChangedEvent& ev) { on_session_state(ev); }));
}

void BridgeRunner::on_session_state(const SessionStateChangedEvent& ev) {
    SatoriLogin login;
    if (ev.to == session_state_name(SessionState::Authenticated)) {
        login.status = LoginStatus::Online;
    } else if (ev.to == session_state_name(SessionState::Authenticating)) {
        login.status = ev.from == session_state_name(SessionState::Authenticated)
            ? LoginStatus::Reconnect : LoginStatus::Connect;
    } else {
        login.status = LoginStatus::Offline;
    }

    NativeUser self = session_.self();
    int64_t self_id = ev.self_id != 0 ? ev.self_id : self.id;
    if (self.id != 0 && self.id == self_id) login.user = make_user(self, self_id);

    GatewayEvent event;
    event.type = event_types::LoginUpdated;
    event.timestamp = static_cast<int64_t>(epoch_millis());
    if (self_id != 0) event.self_id = encode_id(self_id, Scope::User);
    event.login = std::move(login);
    stream_.publish(std::move(event));
}

size_t BridgeRunner::pump_once(std::chrono::milliseconds timeout) {
    if (session_.state() != SessionState::Authenticated) return 0;
    std::shared_ptr<Backend> backend;
    try {
        backend = session_.backend();
    } catch (const BridgeError& e) {
        // Lost the session between the check and the fetch.
        std::cerr << "[bridge] no backend: " << e.what() << "\n";
        return 0;
    }

    std::vector<NativeUpdate> updates;
    {
        std::lock_guard<std::mutex> lock(backlog_mutex_);
        updates.swap(backlog_);
    }
    if (updates.empty()) updates = backend->poll_updates(timeout);

    size_t emitted = 0;
    for (size_t i = 0; i < updates.size(); i++) {
        const NativeUpdate& update = updates[i];
        switch (update.kind) {
            case UpdateKind::ConnectionLost:
                std::cerr << "[bridge] connection lost\n";
                session_.on_connection_lost();
                if (session_.state() != SessionState::Authenticated) {
                    // The catch-up that followed the drop is delivered only
                    // once; hold it until the session is back.
                    std::lock_guard<std::mutex> lock(backlog_mutex_);
                    backlog_.assign(updates.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                                    updates.end());
                    return emitted;
                }
                try {
                    backend = session_.backend();
                } catch (const BridgeError& e) {
                    std::cerr << "[bridge] no backend after resume: " << e.what() << "\n";
                    return emitted;
                }
                continue;

            case UpdateKind::AuthorizationRevoked:
                session_.on_revoked(update.raw_type.empty() ? "authorization revoked"
                                                            : update.raw_type);
                return emitted;

            default:
                break;
        }

        if (normalizer_.process(update) != 0) ++emitted;

        if (update.kind == UpdateKind::CallbackQuery && !update.callback_id.empty()) {
            try {
                backend->answer_callback(update.callback_id);
            } catch (const std::exception& e) {
                std::cerr << "[bridge] answer callback " << update.callback_id
                          << " failed: " << e.what() << "\n";
            }
        }
    }
    return emitted;
}

void BridgeRunner::run(const std::atomic<bool>& stop, std::chrono::milliseconds poll_timeout,
                       std::chrono::milliseconds reconnect_delay) {
    while (!stop.load()) {
        switch (session_.state()) {
            case SessionState::Terminated:
                std::cerr << "[bridge] session terminated, stopping\n";
                return;

            case SessionState::Unauthenticated:
                sleep_unless(stop, reconnect_delay);
                if (stop.load()) return;
                try {
                    session_.start();
                } catch (const BridgeError& e) {
                    std::cerr << "[bridge] login failed: " << e.what() << "\n";
                }
                break;

            case SessionState::Authenticating:
                if (!session_.reconnect()) sleep_unless(stop, reconnect_delay);
                break;

            case SessionState::Authenticated:
                try {
                    pump_once(poll_timeout);
                } catch (const std::exception& e) {
                    std::cerr << "[bridge] poll failed: " << e.what() << "\n";
                    sleep_unless(stop, std::chrono::seconds(1));
                }
                break;
        }
    }
}

} // namespace mtsatori
