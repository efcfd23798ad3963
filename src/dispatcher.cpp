#include "dispatcher.hpp"
#include "elements.hpp"
#include "ids.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace mtsatori {

LoginStatus login_status_for(SessionState state) {
    switch (state) {
        case SessionState::Authenticated:   return LoginStatus::Online;
        case SessionState::Authenticating:  return LoginStatus::Connect;
        case SessionState::Unauthenticated:
        case SessionState::Terminated:      return LoginStatus::Offline;
    }
    return LoginStatus::Offline;
}

namespace {

// Exhausted transient failures carry no useful transport detail for the
// caller.
ErrorKind surface(ErrorKind kind) {
    return kind == ErrorKind::TransientTransportError ? ErrorKind::InternalError : kind;
}

BridgeError classified(const BackendError& e) {
    return BridgeError(surface(classify_backend_error(e.code(), e.what())), e.what());
}

BridgeError classified(const BridgeError& e) {
    return BridgeError(surface(e.kind()), e.what());
}

std::string sniff_mime(const std::string& data) {
    auto starts = [&](const char* magic, size_t n, size_t at = 0) {
        return data.size() >= at + n && data.compare(at, n, magic, n) == 0;
    };
    if (starts("\xFF\xD8\xFF", 3)) return "image/jpeg";
    if (starts("\x89PNG", 4)) return "image/png";
    if (starts("GIF8", 4)) return "image/gif";
    if (starts("RIFF", 4) && starts("WEBP", 4, 8)) return "image/webp";
    if (starts("OggS", 4)) return "audio/ogg";
    if (starts("ID3", 3)) return "audio/mpeg";
    if (starts("ftyp", 4, 4)) return "video/mp4";
    if (starts("\x1A\x45\xDF\xA3", 4)) return "video/webm";
    if (starts("%PDF", 4)) return "application/pdf";
    return "application/octet-stream";
}

void log_diagnostics(const char* method, const std::vector<Diagnostic>& diagnostics) {
    for (const auto& d : diagnostics) {
        std::cerr << "[dispatcher] " << method << ": " << error_kind_name(d.kind)
                  << ": " << d.detail << "\n";
    }
}

bool empty_part(const NativeSendRequest& part) {
    return part.text.empty() && part.media.empty() && !part.location;
}

} // namespace

ActionDispatcher::ActionDispatcher(SessionController& session, MediaFetcher& media,
                                   const BridgeConfig& config, Sleeper sleeper)
    : session_(session), media_(media), config_(config), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

CodecContext ActionDispatcher::context() const {
    CodecContext ctx;
    ctx.self_id = session_.self().id;
    return ctx;
}

TargetCapabilities ActionDispatcher::capabilities() const {
    TargetCapabilities caps;
    caps.max_text_length = config_.max_text_length;
    caps.max_caption_length = config_.max_caption_length;
    caps.max_album_size = config_.max_album_size;
    return caps;
}

template<typename F>
auto ActionDispatcher::read(const char* method, F&& call)
    -> decltype(call(std::declval<Backend&>())) {
    uint32_t attempts = std::max<uint32_t>(config_.read_attempts, 1);
    for (uint32_t attempt = 1;; ++attempt) {
        ErrorKind kind;
        std::string message;
        uint32_t retry_after = 0;
        try {
            std::shared_ptr<Backend> backend = session_.backend();
            return call(*backend);
        } catch (const BackendError& e) {
            kind = classify_backend_error(e.code(), e.what());
            message = e.what();
            retry_after = e.retry_after_sec() ? e.retry_after_sec() : parse_retry_after(message);
        } catch (const BridgeError& e) {
            if (e.kind() != ErrorKind::TransientTransportError) throw;
            kind = e.kind();
            message = e.what();
        }

        if (kind != ErrorKind::RateLimited && kind != ErrorKind::TransientTransportError) {
            throw BridgeError(kind, message);
        }
        if (attempt >= attempts) {
            throw BridgeError(surface(kind), message);
        }

        uint64_t delay = static_cast<uint64_t>(config_.backoff_base_ms) << (attempt - 1);
        delay = std::min<uint64_t>(delay, config_.backoff_max_ms);
        if (retry_after > 0) {
            uint64_t wait = static_cast<uint64_t>(retry_after) * 1000;
            // Not worth holding the caller for.
            if (wait > config_.backoff_max_ms) throw BridgeError(ErrorKind::RateLimited, message);
            delay = std::max(delay, wait);
        }
        std::cerr << "[dispatcher] " << method << " attempt " << attempt << "/" << attempts
                  << " failed (" << message << "), retrying in " << delay << "ms\n";
        sleeper_(std::chrono::milliseconds(delay));
    }
}

template<typename F>
auto ActionDispatcher::write(int64_t chat_id, F&& call)
    -> decltype(call(std::declval<Backend&>())) {
    std::shared_ptr<std::mutex> lock_ptr = channel_lock(chat_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);
    try {
        std::shared_ptr<Backend> backend = session_.backend();
        return call(*backend);
    } catch (const BackendError& e) {
        throw classified(e);
    } catch (const BridgeError& e) {
        throw classified(e);
    }
}

std::shared_ptr<std::mutex> ActionDispatcher::channel_lock(int64_t chat_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = channel_locks_[chat_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

// ── Reads ───────────────────────────────────────────────────────

SatoriLogin ActionDispatcher::login_get() const {
    SatoriLogin login;
    login.status = login_status_for(session_.state());
    NativeUser self = session_.self();
    if (self.id != 0) login.user = make_user(self, self.id);
    return login;
}

SatoriUser ActionDispatcher::user_get(const std::string& user_id) {
    int64_t uid = decode_as(user_id, Scope::User, "user_id");
    NativeUser user = read("user.get", [&](Backend& b) { return b.get_user(uid); });
    return make_user(user, context().self_id);
}

SatoriChannel ActionDispatcher::channel_get(const std::string& channel_id) {
    int64_t chat = decode_as(channel_id, Scope::Channel, "channel_id");
    return make_channel(read("channel.get", [&](Backend& b) { return b.get_chat(chat); }));
}

Page<SatoriChannel> ActionDispatcher::channel_list(const std::string& guild_id,
                                                   const std::string& next) {
    int64_t chat = decode_as(guild_id, Scope::Chat, "guild_id");
    Page<SatoriChannel> page;
    if (!next.empty()) return page;
    NativeChat native = read("channel.list", [&](Backend& b) { return b.get_chat(chat); });
    if (native.is_direct()) {
        throw BridgeError(ErrorKind::NotFound, "not a guild: " + guild_id);
    }
    page.items.push_back(make_channel(native));
    return page;
}

SatoriGuild ActionDispatcher::guild_get(const std::string& guild_id) {
    int64_t chat = decode_as(guild_id, Scope::Chat, "guild_id");
    NativeChat native = read("guild.get", [&](Backend& b) { return b.get_chat(chat); });
    auto guild = make_guild(native, context().self_id);
    if (!guild) throw BridgeError(ErrorKind::NotFound, "not a guild: " + guild_id);
    return *guild;
}

Page<SatoriGuild> ActionDispatcher::guild_list(const std::string& next) {
    Page<NativeChat> chats = read("guild.list", [&](Backend& b) {
        return b.get_chats(next, kPageSize);
    });
    int64_t self_id = context().self_id;
    Page<SatoriGuild> page;
    page.next = chats.next;
    for (const auto& chat : chats.items) {
        if (auto guild = make_guild(chat, self_id)) page.items.push_back(std::move(*guild));
    }
    return page;
}

SatoriMember ActionDispatcher::guild_member_get(const std::string& guild_id,
                                                const std::string& user_id) {
    int64_t chat = decode_as(guild_id, Scope::Chat, "guild_id");
    int64_t uid = decode_as(user_id, Scope::User, "user_id");
    NativeMember member = read("guild.member.get", [&](Backend& b) {
        return b.get_chat_member(chat, uid);
    });
    return make_member(member, context().self_id);
}

Page<SatoriMember> ActionDispatcher::guild_member_list(const std::string& guild_id,
                                                       const std::string& next) {
    int64_t chat = decode_as(guild_id, Scope::Chat, "guild_id");
    Page<NativeMember> members = read("guild.member.list", [&](Backend& b) {
        return b.get_chat_members(chat, next, kPageSize);
    });
    int64_t self_id = context().self_id;
    Page<SatoriMember> page;
    page.next = members.next;
    for (const auto& m : members.items) page.items.push_back(make_member(m, self_id));
    return page;
}

SatoriMessage ActionDispatcher::message_get(const std::string& channel_id,
                                            const std::string& message_id) {
    int64_t chat = decode_as(channel_id, Scope::Channel, "channel_id");
    int64_t mid = decode_as(message_id, Scope::Message, "message_id");
    NativeMessage msg = read("message.get", [&](Backend& b) { return b.get_message(chat, mid); });
    return make_message(msg, context());
}

Page<SatoriMessage> ActionDispatcher::message_list(const std::string& channel_id,
                                                   const std::string& next) {
    int64_t chat = decode_as(channel_id, Scope::Channel, "channel_id");
    Page<NativeMessage> history = read("message.list", [&](Backend& b) {
        return b.get_history(chat, next, kPageSize);
    });
    CodecContext ctx = context();
    Page<SatoriMessage> page;
    page.next = history.next;
    for (const auto& m : history.items) page.items.push_back(make_message(m, ctx));
    return page;
}

FetchedMedia ActionDispatcher::download(const std::string& url) {
    int64_t owner = 0;
    auto file_id = parse_internal_media_url(url, &owner);
    if (!file_id) throw BridgeError(ErrorKind::InvalidReference, "not an internal media url: " + url);
    if (owner != context().self_id) {
        throw BridgeError(ErrorKind::NotFound, "media belongs to another account");
    }
    FetchedMedia out;
    out.data = read("proxy", [&](Backend& b) { return b.download_file(*file_id); });
    out.mime = sniff_mime(out.data);
    out.name = *file_id + extension_for_mime(out.mime);
    return out;
}

// ── Writes ──────────────────────────────────────────────────────

SatoriChannel ActionDispatcher::user_channel_create(const std::string& user_id) {
    int64_t uid = decode_as(user_id, Scope::User, "user_id");
    // Idempotent on the backend side: the existing private chat comes back.
    NativeChat chat = read("user.channel.create", [&](Backend& b) {
        return b.create_private_chat(uid);
    });
    return make_channel(chat);
}

void ActionDispatcher::resolve_media(SendPlan& plan) {
    for (auto& part : plan.parts) {
        std::vector<OutgoingMedia> kept;
        for (auto& m : part.media) {
            if (m.file.source != InputFile::Source::Url) {
                kept.push_back(std::move(m));
                continue;
            }
            std::string error;
            auto fetched = media_.fetch(m.file.value, m.file.name, error);
            if (!fetched) {
                plan.diagnostics.push_back({ErrorKind::UnsupportedSegment,
                                            "media dropped: " + error});
                continue;
            }
            m.file.source = InputFile::Source::Bytes;
            m.file.value = std::move(fetched->data);
            m.file.name = std::move(fetched->name);
            m.file.mime = std::move(fetched->mime);
            if (m.kind == MediaKind::Photo && m.file.mime == "image/gif") {
                m.kind = MediaKind::Animation;
            }
            kept.push_back(std::move(m));
        }
        part.media = std::move(kept);
    }

    // Parts left without content go; their reply target and keyboard move
    // to the parts that remain.
    if (plan.parts.empty()) return;
    int64_t reply_to = plan.parts.front().reply_to_message_id;
    NativeKeyboard keyboard = plan.parts.back().keyboard;
    plan.parts.erase(std::remove_if(plan.parts.begin(), plan.parts.end(), empty_part),
                     plan.parts.end());
    if (plan.parts.empty()) return;
    plan.parts.front().reply_to_message_id = reply_to;
    plan.parts.back().keyboard = std::move(keyboard);
}

CreateResult ActionDispatcher::message_create(const std::string& channel_id,
                                              const std::string& content) {
    int64_t chat = decode_as(channel_id, Scope::Channel, "channel_id");
    Segments segments = parse_markup(content);

    SendPlan plan = from_segments(segments, chat, capabilities());
    resolve_media(plan);

    CreateResult result;
    result.diagnostics = std::move(plan.diagnostics);
    if (plan.parts.empty()) {
        log_diagnostics("message.create", result.diagnostics);
        throw BridgeError(ErrorKind::InvalidReference, "message has no sendable content");
    }

    CodecContext ctx = context();
    {
        std::shared_ptr<std::mutex> lock_ptr = channel_lock(chat);
        std::lock_guard<std::mutex> lock(*lock_ptr);
        std::shared_ptr<Backend> backend;
        try {
            backend = session_.backend();
        } catch (const BridgeError& e) {
            throw classified(e);
        }

        for (size_t i = 0; i < plan.parts.size(); ++i) {
            try {
                for (const auto& msg : backend->send(plan.parts[i])) {
                    result.messages.push_back(make_message(msg, ctx));
                }
            } catch (const BackendError& e) {
                if (i == 0) throw classified(e);
                BridgeError err = classified(e);
                result.diagnostics.push_back({err.kind(),
                    "part " + std::to_string(i + 1) + "/" + std::to_string(plan.parts.size()) +
                    " not sent: " + err.what()});
                break;
            } catch (const BridgeError& e) {
                BridgeError err = classified(e);
                if (i == 0) throw err;
                result.diagnostics.push_back({err.kind(),
                    "part " + std::to_string(i + 1) + "/" + std::to_string(plan.parts.size()) +
                    " not sent: " + err.what()});
                break;
            }
        }
    }
    log_diagnostics("message.create", result.diagnostics);
    return result;
}

std::vector<Diagnostic> ActionDispatcher::message_update(const std::string& channel_id,
                                                         const std::string& message_id,
                                                         const std::string& content) {
    int64_t chat = decode_as(channel_id, Scope::Channel, "channel_id");
    int64_t mid = decode_as(message_id, Scope::Message, "message_id");
    EditPlan plan = edit_text(parse_markup(content), capabilities());
    write(chat, [&](Backend& b) {
        b.edit_message(chat, mid, plan.text, plan.entities, plan.keyboard);
    });
    log_diagnostics("message.update", plan.diagnostics);
    return plan.diagnostics;
}

void ActionDispatcher::message_delete(const std::string& channel_id,
                                      const std::string& message_id) {
    int64_t chat = decode_as(channel_id, Scope::Channel, "channel_id");
    int64_t mid = decode_as(message_id, Scope::Message, "message_id");
    write(chat, [&](Backend& b) { b.delete_messages(chat, {mid}); });
}

} // namespace mtsatori
