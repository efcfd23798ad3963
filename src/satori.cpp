#include "satori.hpp"
#include "elements.hpp"
#include "ids.hpp"

namespace mtsatori {

const char* login_status_name(LoginStatus status) {
    switch (status) {
        case LoginStatus::Offline:    return "offline";
        case LoginStatus::Online:     return "online";
        case LoginStatus::Connect:    return "connect";
        case LoginStatus::Disconnect: return "disconnect";
        case LoginStatus::Reconnect:  return "reconnect";
    }
    return "offline";
}

SatoriUser make_user(const NativeUser& user, int64_t self_id) {
    SatoriUser out;
    out.id = encode_id(user.id, Scope::User);
    out.name = user.username;
    out.nick = user.display_name();
    if (!user.photo_file_id.empty()) out.avatar = internal_media_url(self_id, user.photo_file_id);
    out.is_bot = user.is_bot;
    return out;
}

SatoriChannel make_channel(const NativeChat& chat) {
    SatoriChannel out;
    out.id = encode_id(chat.id, Scope::Channel);
    out.type = chat.is_direct() ? ChannelType::Direct : ChannelType::Text;
    out.name = chat.title;
    return out;
}

std::optional<SatoriGuild> make_guild(const NativeChat& chat, int64_t self_id) {
    if (chat.is_direct()) return std::nullopt;
    SatoriGuild out;
    out.id = encode_id(chat.id, Scope::Chat);
    out.name = chat.title;
    if (!chat.photo_file_id.empty()) out.avatar = internal_media_url(self_id, chat.photo_file_id);
    return out;
}

SatoriMember make_member(const NativeMember& member, int64_t self_id) {
    SatoriMember out;
    out.user = make_user(member.user, self_id);
    out.nick = member.custom_title;
    out.joined_at = member.joined_at * 1000;
    return out;
}

SatoriMessage make_message(const NativeMessage& message, const CodecContext& ctx) {
    SatoriMessage out;
    out.id = encode_id(message.id, Scope::Message);
    out.content = dump_markup(to_segments(message, ctx));
    out.channel = make_channel(message.chat);
    out.guild = make_guild(message.chat, ctx.self_id);
    if (message.sender) {
        out.user = make_user(*message.sender, ctx.self_id);
        if (out.guild) {
            SatoriMember member;
            member.user = out.user;
            out.member = std::move(member);
        }
    }
    out.created_at = message.date * 1000;
    if (message.edit_date > 0) out.updated_at = message.edit_date * 1000;
    return out;
}

// ── JSON ────────────────────────────────────────────────────────

nlohmann::json user_to_json(const SatoriUser& user) {
    nlohmann::json j = {{"id", user.id}, {"is_bot", user.is_bot}};
    if (!user.name.empty()) j["name"] = user.name;
    if (!user.nick.empty()) j["nick"] = user.nick;
    if (!user.avatar.empty()) j["avatar"] = user.avatar;
    return j;
}

nlohmann::json channel_to_json(const SatoriChannel& channel) {
    nlohmann::json j = {{"id", channel.id}, {"type", static_cast<int>(channel.type)}};
    if (!channel.name.empty()) j["name"] = channel.name;
    return j;
}

nlohmann::json guild_to_json(const SatoriGuild& guild) {
    nlohmann::json j = {{"id", guild.id}};
    if (!guild.name.empty()) j["name"] = guild.name;
    if (!guild.avatar.empty()) j["avatar"] = guild.avatar;
    return j;
}

nlohmann::json member_to_json(const SatoriMember& member) {
    nlohmann::json j = nlohmann::json::object();
    if (member.user) j["user"] = user_to_json(*member.user);
    if (!member.nick.empty()) j["nick"] = member.nick;
    if (member.joined_at > 0) j["joined_at"] = member.joined_at;
    return j;
}

nlohmann::json message_to_json(const SatoriMessage& message) {
    nlohmann::json j = {{"id", message.id}, {"content", message.content}};
    if (message.channel) j["channel"] = channel_to_json(*message.channel);
    if (message.guild) j["guild"] = guild_to_json(*message.guild);
    if (message.user) j["user"] = user_to_json(*message.user);
    if (message.member) j["member"] = member_to_json(*message.member);
    if (message.created_at > 0) j["created_at"] = message.created_at;
    if (message.updated_at > 0) j["updated_at"] = message.updated_at;
    return j;
}

nlohmann::json login_to_json(const SatoriLogin& login) {
    nlohmann::json j = {
        {"sn", login.sn},
        {"status", static_cast<int>(login.status)},
        {"adapter", kAdapter},
        {"platform", kPlatform},
        {"features", {"message.create", "message.get", "message.update", "message.delete",
                      "message.list", "guild.get", "guild.list", "guild.member.get",
                      "guild.member.list", "channel.get", "channel.list",
                      "user.get", "user.channel.create"}}
    };
    if (login.user) {
        j["user"] = user_to_json(*login.user);
        j["self_id"] = login.user->id;
    }
    return j;
}

} // namespace mtsatori
