#pragma once
#include "backend.hpp"
#include "event_bus.hpp"
#include "normalizer.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace mtsatori {

enum class SessionState { Unauthenticated, Authenticating, Authenticated, Terminated };

const char* session_state_name(SessionState state);

enum class LoginFailure { None, BadCredentials, SecondFactorRequired, NetworkError, Revoked };

const char* login_failure_name(LoginFailure failure);

struct LoginOutcome {
    std::shared_ptr<Backend> backend;
    NativeUser self;
    LoginFailure failure = LoginFailure::None;
    std::string message;

    bool ok() const { return backend != nullptr && failure == LoginFailure::None; }

    static LoginOutcome success(std::shared_ptr<Backend> backend, NativeUser self) {
        LoginOutcome out;
        out.backend = std::move(backend);
        out.self = std::move(self);
        return out;
    }
    static LoginOutcome failed(LoginFailure failure, std::string message) {
        LoginOutcome out;
        out.failure = failure;
        out.message = std::move(message);
        return out;
    }
};

// Produces an authenticated backend from configured credentials.
class LoginDriver {
public:
    virtual ~LoginDriver() = default;

    // First login; may prompt for a login code.
    virtual LoginOutcome login() = 0;

    // Re-establish the session after a connection loss from the stored
    // session only. Must never prompt.
    virtual LoginOutcome resume() = 0;

    // Invalidate the account session on the backend. Best effort.
    virtual void logout(Backend& backend) { (void)backend; }
};

// Owns the one authenticated backend handle of the process and drives the
// session state machine:
//
//   Unauthenticated -> Authenticating -> Authenticated -> Terminated
//                           ^                 |
//                           +-- connection ---+
//                               lost
//
// Teardown always stops the normalizer first, then fails outstanding RPCs
// with SessionTerminated, then releases the backend handle.
class SessionController {
public:
    SessionController(LoginDriver& driver, EventNormalizer& normalizer, EventBus& bus);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Run the login. Returns true once Authenticated. Network failures leave
    // the session Unauthenticated so start() can be retried; credential
    // problems terminate it.
    bool start();

    // Backend reported connection loss: Authenticated -> Authenticating,
    // then one non-interactive resume attempt.
    void on_connection_lost();

    // Retry resume while Authenticating. Returns true once Authenticated.
    bool reconnect();

    // Backend invalidated the authorization.
    void on_revoked(const std::string& reason);

    // Explicit logout: logs the account out and terminates.
    void logout();

    // Process shutdown: terminate without logging the account out.
    void shutdown(const std::string& reason);

    SessionState state() const;
    LoginFailure last_failure() const;
    NativeUser self() const;

    // The live backend handle. Throws BridgeError(SessionTerminated) once
    // terminated and BridgeError(TransientTransportError) while not
    // authenticated.
    std::shared_ptr<Backend> backend() const;

private:
    void set_state(SessionState to, const std::string& reason);   // caller holds mutex_
    bool accept(const LoginOutcome& outcome, bool resuming);
    void terminate(const std::string& reason, bool log_out);

    LoginDriver& driver_;
    EventNormalizer& normalizer_;
    EventBus& bus_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Unauthenticated;
    LoginFailure last_failure_ = LoginFailure::None;
    std::shared_ptr<Backend> backend_;
    NativeUser self_;
};

} // namespace mtsatori
