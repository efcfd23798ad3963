#pragma once
#include "backend.hpp"
#include "codec.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mtsatori {

// Gateway-side resource model and its JSON shape.

constexpr const char* kPlatform = "telegram";
constexpr const char* kAdapter = "mtproto";

enum class ChannelType { Text = 0, Direct = 1, Category = 2, Voice = 3 };

enum class LoginStatus { Offline = 0, Online = 1, Connect = 2, Disconnect = 3, Reconnect = 4 };

struct SatoriUser {
    std::string id;
    std::string name;     // username
    std::string nick;     // display name
    std::string avatar;
    bool is_bot = false;
};

struct SatoriChannel {
    std::string id;
    ChannelType type = ChannelType::Text;
    std::string name;
};

struct SatoriGuild {
    std::string id;
    std::string name;
    std::string avatar;
};

struct SatoriMember {
    std::optional<SatoriUser> user;
    std::string nick;
    int64_t joined_at = 0;   // ms, 0 if unknown
};

struct SatoriMessage {
    std::string id;
    std::string content;     // markup
    std::optional<SatoriChannel> channel;
    std::optional<SatoriGuild> guild;
    std::optional<SatoriUser> user;
    std::optional<SatoriMember> member;
    int64_t created_at = 0;  // ms
    int64_t updated_at = 0;
};

struct SatoriLogin {
    int sn = 0;
    LoginStatus status = LoginStatus::Offline;
    std::optional<SatoriUser> user;
};

const char* login_status_name(LoginStatus status);

// ── Native -> gateway resources ─────────────────────────────────

SatoriUser make_user(const NativeUser& user, int64_t self_id);
SatoriChannel make_channel(const NativeChat& chat);
// Direct chats have no guild.
std::optional<SatoriGuild> make_guild(const NativeChat& chat, int64_t self_id);
SatoriMember make_member(const NativeMember& member, int64_t self_id);
SatoriMessage make_message(const NativeMessage& message, const CodecContext& ctx);

// ── JSON ────────────────────────────────────────────────────────

nlohmann::json user_to_json(const SatoriUser& user);
nlohmann::json channel_to_json(const SatoriChannel& channel);
nlohmann::json guild_to_json(const SatoriGuild& guild);
nlohmann::json member_to_json(const SatoriMember& member);
nlohmann::json message_to_json(const SatoriMessage& message);
nlohmann::json login_to_json(const SatoriLogin& login);

// {"data": [...], "next": "..."}; next omitted on the last page.
template<typename T, typename F>
nlohmann::json page_to_json(const std::vector<T>& items, const std::string& next, F convert) {
    nlohmann::json data = nlohmann::json::array();
    for (const auto& item : items) data.push_back(convert(item));
    nlohmann::json out = {{"data", std::move(data)}};
    if (!next.empty()) out["next"] = next;
    return out;
}

} // namespace mtsatori
