#include "session.hpp"

#include <iostream>

namespace mtsatori {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Unauthenticated: return "Unauthenticated";
        case SessionState::Authenticating:  return "Authenticating";
        case SessionState::Authenticated:   return "Authenticated";
        case SessionState::Terminated:      return "Terminated";
    }
    return "Unauthenticated";
}

const char* login_failure_name(LoginFailure failure) {
    switch (failure) {
        case LoginFailure::None:                 return "None";
        case LoginFailure::BadCredentials:       return "BadCredentials";
        case LoginFailure::SecondFactorRequired: return "SecondFactorRequired";
        case LoginFailure::NetworkError:         return "NetworkError";
        case LoginFailure::Revoked:              return "Revoked";
    }
    return "None";
}

SessionController::SessionController(LoginDriver& driver, EventNormalizer& normalizer,
                                     EventBus& bus)
    : driver_(driver), normalizer_(normalizer), bus_(bus) {}

SessionController::~SessionController() {
    std::shared_ptr<Backend> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend = std::move(backend_);
    }
    if (backend) backend->fail_pending(ErrorKind::SessionTerminated, "session destroyed");
}

void SessionController::set_state(SessionState to, const std::string& reason) {
    if (state_ == to) return;
    std::cerr << "[session] " << session_state_name(state_) << " -> "
              << session_state_name(to);
    if (!reason.empty()) std::cerr << " (" << reason << ")";
    std::cerr << "\n";
    state_ = to;
}

// Publishes outside mutex_; subscribers may call back into state().
static void announce(EventBus& bus, SessionState from, SessionState to,
                     const std::string& reason, int64_t self_id) {
    if (from == to) return;
    SessionStateChangedEvent ev;
    ev.from = session_state_name(from);
    ev.to = session_state_name(to);
    ev.reason = reason;
    ev.self_id = self_id;
    bus.publish(ev);
}

bool SessionController::start() {
    SessionState from;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Terminated) {
            throw BridgeError(ErrorKind::SessionTerminated, "session already terminated");
        }
        if (state_ != SessionState::Unauthenticated) return state_ == SessionState::Authenticated;
        from = state_;
        set_state(SessionState::Authenticating, "login");
    }
    announce(bus_, from, SessionState::Authenticating, "login", 0);

    LoginOutcome outcome;
    try {
        outcome = driver_.login();
    } catch (const std::exception& e) {
        outcome = LoginOutcome::failed(LoginFailure::NetworkError, e.what());
    }
    return accept(outcome, false);
}

bool SessionController::accept(const LoginOutcome& outcome, bool resuming) {
    if (outcome.ok()) {
        SessionState from;
        int64_t self_id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SessionState::Authenticating) {
                // Shut down while the login was in flight.
                outcome.backend->fail_pending(ErrorKind::SessionTerminated, "session terminated");
                return false;
            }
            from = state_;
            if (backend_ && backend_ != outcome.backend) {
                backend_->fail_pending(ErrorKind::SessionTerminated, "connection replaced");
            }
            backend_ = outcome.backend;
            self_ = outcome.self;
            self_id = self_.id;
            last_failure_ = LoginFailure::None;
            set_state(SessionState::Authenticated, resuming ? "resumed" : "logged in");
        }
        normalizer_.on_login(outcome.self);
        announce(bus_, from, SessionState::Authenticated, resuming ? "resumed" : "logged in",
                 self_id);
        return true;
    }

    std::string reason = std::string(login_failure_name(outcome.failure));
    if (!outcome.message.empty()) reason += ": " + outcome.message;
    std::cerr << "[session] login failed: " << reason << "\n";

    if (outcome.failure == LoginFailure::NetworkError) {
        SessionState from;
        SessionState to;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_failure_ = outcome.failure;
            if (state_ != SessionState::Authenticating) return false;
            from = state_;
            // A first login falls back so start() can be retried; a resume keeps
            // trying from the stored session.
            to = resuming ? SessionState::Authenticating : SessionState::Unauthenticated;
            set_state(to, reason);
        }
        announce(bus_, from, to, reason, 0);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_failure_ = outcome.failure;
    }
    terminate(reason, false);
    return false;
}

void SessionController::on_connection_lost() {
    SessionState from;
    int64_t self_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Authenticated) return;
        from = state_;
        self_id = self_.id;
        set_state(SessionState::Authenticating, "connection lost");
    }
    normalizer_.on_disconnect();
    announce(bus_, from, SessionState::Authenticating, "connection lost", self_id);
    reconnect();
}

bool SessionController::reconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Authenticated) return true;
        if (state_ != SessionState::Authenticating) return false;
    }
    LoginOutcome outcome;
    try {
        outcome = driver_.resume();
    } catch (const std::exception& e) {
        outcome = LoginOutcome::failed(LoginFailure::NetworkError, e.what());
    }
    return accept(outcome, true);
}

void SessionController::on_revoked(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Terminated) return;
        last_failure_ = LoginFailure::Revoked;
    }
    terminate(reason.empty() ? "authorization revoked" : reason, false);
}

void SessionController::logout() {
    terminate("logout", true);
}

void SessionController::shutdown(const std::string& reason) {
    terminate(reason, false);
}

void SessionController::terminate(const std::string& reason, bool log_out) {
    std::shared_ptr<Backend> backend;
    SessionState from;
    int64_t self_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Terminated) return;
        from = state_;
        self_id = self_.id;
        backend = backend_;
        set_state(SessionState::Terminated, reason);
    }

    if (log_out && backend) {
        try {
            driver_.logout(*backend);
        } catch (const std::exception& e) {
            std::cerr << "[session] logout failed: " << e.what() << "\n";
        }
    }

    normalizer_.stop();
    if (backend) backend->fail_pending(ErrorKind::SessionTerminated, reason);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend_.reset();
    }
    backend.reset();

    announce(bus_, from, SessionState::Terminated, reason, self_id);
}

SessionState SessionController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

LoginFailure SessionController::last_failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_failure_;
}

NativeUser SessionController::self() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return self_;
}

std::shared_ptr<Backend> SessionController::backend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case SessionState::Authenticated:
            return backend_;
        case SessionState::Terminated:
            throw BridgeError(ErrorKind::SessionTerminated, "session terminated");
        default:
            throw BridgeError(ErrorKind::TransientTransportError,
                              std::string("session is ") + session_state_name(state_));
    }
}

} // namespace mtsatori
