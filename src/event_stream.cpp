#include "event_stream.hpp"

#include <iostream>

namespace mtsatori {

nlohmann::json event_to_json(const GatewayEvent& event) {
    nlohmann::json j = {
        {"id", event.id},
        {"type", event.type},
        {"platform", kPlatform},
        {"self_id", event.self_id},
        {"timestamp", event.timestamp}
    };
    if (event.login) j["login"] = login_to_json(*event.login);
    if (event.channel) j["channel"] = channel_to_json(*event.channel);
    if (event.guild) j["guild"] = guild_to_json(*event.guild);
    if (event.user) j["user"] = user_to_json(*event.user);
    if (event.member) j["member"] = member_to_json(*event.member);
    if (event.message) j["message"] = message_to_json(*event.message);
    if (!event.button_id.empty()) j["button"] = {{"id", event.button_id}};
    if (!event.emoji.empty()) j["emoji"] = {{"id", event.emoji}, {"name", event.emoji}};
    return j;
}

void EventStream::add_sink(std::shared_ptr<EventSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

uint64_t EventStream::publish(GatewayEvent event) {
    // Held across delivery: the next event cannot overtake this one.
    std::lock_guard<std::mutex> lock(mutex_);
    event.id = ++last_id_;
    for (const auto& sink : sinks_) {
        try {
            sink->on_event(event);
        } catch (const std::exception& e) {
            std::cerr << "[events] sink failed on " << event.type << " #" << event.id
                      << ": " << e.what() << "\n";
        }
    }
    return event.id;
}

uint64_t EventStream::last_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_id_;
}

} // namespace mtsatori
