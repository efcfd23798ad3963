#pragma once
#include "session.hpp"
#include "telegram/td_backend.hpp"
#include <chrono>
#include <memory>

namespace mtsatori {

// Walks TDLib's authorization states with the configured credentials.
// The TDLib database keeps the session, so resume() only needs the stored
// authorization and never asks for a login code.
class TdLoginDriver : public LoginDriver {
public:
    explicit TdLoginDriver(const Config& config);

    LoginOutcome login() override;
    LoginOutcome resume() override;
    void logout(Backend& backend) override;

    // Ask for the login code on stdin when TDLib wants one.
    void set_interactive(bool interactive) { interactive_ = interactive; }

private:
    LoginOutcome authorize(bool interactive);
    LoginOutcome authorize_on(const std::shared_ptr<TdBackend>& backend, bool interactive);
    void send_parameters(TdBackend& backend);
    void send_proxy(TdBackend& backend);

    Config config_;
    bool interactive_ = true;
    std::chrono::milliseconds step_timeout_;
    std::shared_ptr<TdBackend> backend_;
};

} // namespace mtsatori
