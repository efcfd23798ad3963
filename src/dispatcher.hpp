#pragma once
#include "backend.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "media.hpp"
#include "satori.hpp"
#include "session.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mtsatori {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Login status shown to gateway clients for a session state.
LoginStatus login_status_for(SessionState state);

struct CreateResult {
    std::vector<SatoriMessage> messages;
    std::vector<Diagnostic> diagnostics;
};

// Executes gateway actions against the backend.
//
// References are decoded and scope-checked before any RPC is issued. Reads
// are retried on rate limits and transient transport failures with bounded
// exponential backoff; sends, edits and deletes are never retried since a
// retry could duplicate a message. Writes to one channel are serialized.
// Native failures leave as BridgeError with a gateway ErrorKind.
class ActionDispatcher {
public:
    ActionDispatcher(SessionController& session, MediaFetcher& media,
                     const BridgeConfig& config, Sleeper sleeper = {});

    SatoriLogin login_get() const;

    SatoriUser user_get(const std::string& user_id);
    SatoriChannel user_channel_create(const std::string& user_id);

    SatoriChannel channel_get(const std::string& channel_id);
    // A guild has exactly one channel: the chat itself.
    Page<SatoriChannel> channel_list(const std::string& guild_id, const std::string& next);

    SatoriGuild guild_get(const std::string& guild_id);
    Page<SatoriGuild> guild_list(const std::string& next);
    SatoriMember guild_member_get(const std::string& guild_id, const std::string& user_id);
    Page<SatoriMember> guild_member_list(const std::string& guild_id, const std::string& next);

    // Throws when nothing was sent. Once the first native send succeeded,
    // later failures are reported as diagnostics next to the messages that
    // went out.
    CreateResult message_create(const std::string& channel_id, const std::string& content);
    SatoriMessage message_get(const std::string& channel_id, const std::string& message_id);
    std::vector<Diagnostic> message_update(const std::string& channel_id,
                                           const std::string& message_id,
                                           const std::string& content);
    void message_delete(const std::string& channel_id, const std::string& message_id);
    Page<SatoriMessage> message_list(const std::string& channel_id, const std::string& next);

    // Bytes behind an "internal:" media url.
    FetchedMedia download(const std::string& url);

    static constexpr int kPageSize = 50;

private:
    template<typename F>
    auto read(const char* method, F&& call) -> decltype(call(std::declval<Backend&>()));

    template<typename F>
    auto write(int64_t chat_id, F&& call) -> decltype(call(std::declval<Backend&>()));

    std::shared_ptr<std::mutex> channel_lock(int64_t chat_id);
    void resolve_media(SendPlan& plan);
    CodecContext context() const;
    TargetCapabilities capabilities() const;

    SessionController& session_;
    MediaFetcher& media_;
    const BridgeConfig& config_;
    Sleeper sleeper_;

    std::mutex locks_mutex_;
    std::unordered_map<int64_t, std::shared_ptr<std::mutex>> channel_locks_;
};

} // namespace mtsatori
