#pragma once
#include "satori.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <mutex>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mtsatori {

namespace event_types {
    constexpr const char* MessageCreated    = "message-created";
    constexpr const char* MessageUpdated    = "message-updated";
    constexpr const char* MessageDeleted    = "message-deleted";
    constexpr const char* GuildMemberAdded  = "guild-member-added";
    constexpr const char* GuildMemberRemoved = "guild-member-removed";
    constexpr const char* ReactionAdded     = "reaction-added";
    constexpr const char* ReactionRemoved   = "reaction-removed";
    constexpr const char* InteractionButton = "interaction/button";
    constexpr const char* LoginUpdated      = "login-updated";
} // namespace event_types

// One gateway event. id is 0 until the stream assigns it.
struct GatewayEvent {
    uint64_t id = 0;
    std::string type;
    int64_t timestamp = 0;   // ms
    std::string self_id;
    std::optional<SatoriLogin> login;
    std::optional<SatoriChannel> channel;
    std::optional<SatoriGuild> guild;
    std::optional<SatoriUser> user;
    std::optional<SatoriMember> member;
    std::optional<SatoriMessage> message;
    std::string button_id;   // interaction/button
    std::string emoji;       // reaction-added / reaction-removed
};

nlohmann::json event_to_json(const GatewayEvent& event);

class EventSink {
public:
    virtual ~EventSink() = default;
    // Called once per event, in id order, from the publishing thread.
    virtual void on_event(const GatewayEvent& event) = 0;
};

// Append-only gateway event stream. publish() assigns the next id and
// delivers to every sink before returning; concurrent publishers are
// serialized so delivery order always equals id order and ids have no gaps.
class EventStream {
public:
    void add_sink(std::shared_ptr<EventSink> sink);

    // Returns the assigned id. A throwing sink is logged and skipped.
    uint64_t publish(GatewayEvent event);

    uint64_t last_id() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<EventSink>> sinks_;
    uint64_t last_id_ = 0;
};

} // namespace mtsatori
