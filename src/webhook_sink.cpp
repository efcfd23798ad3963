#include "webhook_sink.hpp"

#include <iostream>

namespace mtsatori {

void WebhookSink::on_event(const GatewayEvent& event) {
    if (targets_.empty()) return;
    std::string body = event_to_json(event).dump();

    for (const auto& target : targets_) {
        std::vector<Header> headers = {
            {"Content-Type", "application/json"},
            {"Satori-Opcode", "0"},
            {"Satori-Platform", kPlatform},
            {"Satori-User-ID", event.self_id},
            {"X-Platform", kPlatform},
            {"X-Self-ID", event.self_id},
        };
        if (!target.token.empty()) headers.emplace_back("Authorization", "Bearer " + target.token);

        HttpResponse resp = http_.post(target.url, body, headers, timeout_seconds_);
        if (resp.status_code >= 200 && resp.status_code < 300) {
            ++delivered_;
            continue;
        }
        ++failed_;
        std::cerr << "[webhook] " << event.type << " #" << event.id << " to " << target.url
                  << " failed: ";
        if (resp.status_code == 0) {
            std::cerr << "connection error\n";
        } else {
            std::cerr << "HTTP " << resp.status_code << "\n";
        }
    }
}

} // namespace mtsatori
