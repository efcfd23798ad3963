#pragma once
#include "session.hpp"
#include "mock_backend.hpp"
#include <deque>
#include <memory>

namespace mtsatori {

// Login driver handing out a MockBackend. Queued outcomes are used first;
// once empty, login() and resume() succeed with `backend`.
class FakeLoginDriver : public LoginDriver {
public:
    std::shared_ptr<MockBackend> backend = std::make_shared<MockBackend>();
    std::deque<LoginOutcome> login_outcomes;
    std::deque<LoginOutcome> resume_outcomes;
    int login_calls = 0;
    int resume_calls = 0;
    int logout_calls = 0;

    FakeLoginDriver() {
        backend->me.id = 1;
        backend->me.first_name = "Self";
        backend->me.username = "self";
    }

    LoginOutcome login() override {
        login_calls++;
        return next(login_outcomes);
    }

    LoginOutcome resume() override {
        resume_calls++;
        return next(resume_outcomes);
    }

    void logout(Backend& /*backend*/) override { logout_calls++; }

private:
    LoginOutcome next(std::deque<LoginOutcome>& queue) {
        if (queue.empty()) return LoginOutcome::success(backend, backend->me);
        LoginOutcome out = queue.front();
        queue.pop_front();
        return out;
    }
};

} // namespace mtsatori
