#pragma once
#include "config.hpp"
#include "event_stream.hpp"
#include "http.hpp"
#include <vector>

namespace mtsatori {

// Posts every gateway event as JSON to the configured webhook urls.
// Delivery is best effort: failures are logged and the event is not
// retried, so a slow receiver cannot stall the event stream for long.
class WebhookSink : public EventSink {
public:
    WebhookSink(HttpClient& http, std::vector<WebhookTarget> targets, long timeout_seconds = 10)
        : http_(http), targets_(std::move(targets)), timeout_seconds_(timeout_seconds) {}

    void on_event(const GatewayEvent& event) override;

    size_t delivered() const { return delivered_; }
    size_t failed() const { return failed_; }

private:
    HttpClient& http_;
    std::vector<WebhookTarget> targets_;
    long timeout_seconds_;
    size_t delivered_ = 0;
    size_t failed_ = 0;
};

} // namespace mtsatori
