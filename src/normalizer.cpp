#include "normalizer.hpp"
#include "ids.hpp"
#include "util.hpp"

#include <iostream>

namespace mtsatori {

const char* normalizer_state_name(NormalizerState state) {
    switch (state) {
        case NormalizerState::Disconnected: return "Disconnected";
        case NormalizerState::Connecting:   return "Connecting";
        case NormalizerState::Syncing:      return "Syncing";
        case NormalizerState::Live:         return "Live";
    }
    return "Disconnected";
}

bool RecentSet::insert(const std::string& key) {
    if (keys_.count(key)) return false;
    if (order_.size() >= capacity_) {
        keys_.erase(order_.front());
        order_.pop_front();
    }
    order_.push_back(key);
    keys_.insert(key);
    return true;
}

EventNormalizer::EventNormalizer(EventStream& stream, EventBus& bus, size_t dedup_window)
    : stream_(stream), bus_(bus), seen_(dedup_window) {}

void EventNormalizer::transition(NormalizerState to) {
    if (state_ == to) return;
    NormalizerStateChangedEvent ev;
    ev.from = normalizer_state_name(state_);
    ev.to = normalizer_state_name(to);
    state_ = to;
    std::cerr << "[normalizer] " << ev.from << " -> " << ev.to << "\n";
    transitions_.push_back(std::move(ev));
}

void EventNormalizer::flush_notices() {
    std::vector<NormalizerStateChangedEvent> transitions;
    std::vector<UpdateDroppedEvent> drops;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transitions.swap(transitions_);
        drops.swap(drops_);
    }
    for (const auto& ev : transitions) bus_.publish(ev);
    for (const auto& ev : drops) bus_.publish(ev);
}

void EventNormalizer::on_login(const NativeUser& self) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        self_ = self;
        ctx_.self_id = self.id;
        if (state_ == NormalizerState::Disconnected) transition(NormalizerState::Connecting);
    }
    flush_notices();
}

void EventNormalizer::on_disconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transition(NormalizerState::Disconnected);
    }
    flush_notices();
}

void EventNormalizer::stop() {
    on_disconnect();
}

NormalizerState EventNormalizer::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int64_t EventNormalizer::self_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return self_.id;
}

size_t EventNormalizer::seen_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

void EventNormalizer::dropped(const NativeUpdate& update, const std::string& reason) {
    UpdateDroppedEvent ev;
    ev.update_id = update.update_id;
    ev.raw_type = update.raw_type.empty() ? update_kind_name(update.kind) : update.raw_type;
    ev.reason = reason;
    drops_.push_back(std::move(ev));
}

uint64_t EventNormalizer::process(const NativeUpdate& update) {
    std::optional<GatewayEvent> event = take_event(update);
    flush_notices();
    if (!event) return 0;
    return stream_.publish(std::move(*event));
}

std::optional<GatewayEvent> EventNormalizer::take_event(const NativeUpdate& update) {
    std::optional<GatewayEvent> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        switch (update.kind) {
            case UpdateKind::Checkpoint:
                if (state_ == NormalizerState::Connecting || state_ == NormalizerState::Live)
                    transition(NormalizerState::Syncing);
                return std::nullopt;
            case UpdateKind::BacklogDrained:
                if (state_ == NormalizerState::Connecting) transition(NormalizerState::Syncing);
                if (state_ == NormalizerState::Syncing) transition(NormalizerState::Live);
                return std::nullopt;
            case UpdateKind::ConnectionLost:
            case UpdateKind::AuthorizationRevoked:
                transition(NormalizerState::Disconnected);
                return std::nullopt;
            default:
                break;
        }

        if (state_ == NormalizerState::Disconnected) {
            dropped(update, "disconnected");
            return std::nullopt;
        }

        if (!update.update_id.empty() && !seen_.insert(update.update_id)) {
            std::cerr << "[normalizer] duplicate update " << update.update_id << " dropped\n";
            dropped(update, "duplicate");
            return std::nullopt;
        }

        try {
            event = convert(update);
        } catch (const std::exception& e) {
            std::cerr << "[normalizer] malformed " << update_kind_name(update.kind)
                      << " update " << update.update_id << ": " << e.what() << "\n";
            dropped(update, "malformed");
            return std::nullopt;
        }
        if (!event) {
            dropped(update, "unsupported");
            return std::nullopt;
        }
    }
    return event;
}

std::optional<GatewayEvent> EventNormalizer::convert(const NativeUpdate& update) const {
    GatewayEvent ev;
    ev.self_id = encode_id(self_.id, Scope::User);
    ev.timestamp = update.date > 0 ? update.date * 1000 : static_cast<int64_t>(epoch_millis());

    auto require_message = [&]() -> const NativeMessage& {
        if (!update.message) {
            throw BridgeError(ErrorKind::InternalError, "update carries no message");
        }
        return *update.message;
    };
    auto require_chat = [&]() {
        if (update.chat_id == 0 && !update.chat) {
            throw BridgeError(ErrorKind::InternalError, "update carries no chat");
        }
    };
    // Channel and guild of a chat the update only names by id.
    auto place = [&](GatewayEvent& out) {
        if (update.chat) {
            out.channel = make_channel(*update.chat);
            out.guild = make_guild(*update.chat, ctx_.self_id);
        } else {
            SatoriChannel channel;
            channel.id = encode_id(update.chat_id, Scope::Channel);
            out.channel = std::move(channel);
        }
    };

    switch (update.kind) {
        case UpdateKind::NewMessage:
        case UpdateKind::EditedMessage: {
            const NativeMessage& msg = require_message();
            ev.type = update.kind == UpdateKind::NewMessage ? event_types::MessageCreated
                                                            : event_types::MessageUpdated;
            ev.message = make_message(msg, ctx_);
            ev.channel = ev.message->channel;
            ev.guild = ev.message->guild;
            ev.user = ev.message->user;
            ev.member = ev.message->member;
            int64_t when = update.kind == UpdateKind::EditedMessage && msg.edit_date > 0
                ? msg.edit_date : msg.date;
            if (when > 0) ev.timestamp = when * 1000;
            return ev;
        }

        case UpdateKind::DeletedMessage: {
            require_chat();
            if (update.message_id == 0) {
                throw BridgeError(ErrorKind::InternalError, "deletion without message id");
            }
            ev.type = event_types::MessageDeleted;
            place(ev);
            SatoriMessage message;
            message.id = encode_id(update.message_id, Scope::Message);
            message.channel = ev.channel;
            ev.message = std::move(message);
            if (update.user) ev.user = make_user(*update.user, ctx_.self_id);
            return ev;
        }

        case UpdateKind::MemberJoined:
        case UpdateKind::MemberLeft: {
            require_chat();
            if (!update.user) {
                throw BridgeError(ErrorKind::InternalError, "membership change without user");
            }
            ev.type = update.kind == UpdateKind::MemberJoined ? event_types::GuildMemberAdded
                                                              : event_types::GuildMemberRemoved;
            place(ev);
            if (!ev.guild) {
                SatoriGuild guild;
                guild.id = encode_id(update.chat ? update.chat->id : update.chat_id, Scope::Chat);
                ev.guild = std::move(guild);
            }
            ev.user = make_user(*update.user, ctx_.self_id);
            SatoriMember member;
            member.user = ev.user;
            if (update.kind == UpdateKind::MemberJoined && update.date > 0)
                member.joined_at = update.date * 1000;
            ev.member = std::move(member);
            return ev;
        }

        case UpdateKind::ReactionAdded:
        case UpdateKind::ReactionRemoved: {
            require_chat();
            if (update.message_id == 0 || update.reaction.empty()) {
                throw BridgeError(ErrorKind::InternalError, "reaction without message or emoji");
            }
            ev.type = update.kind == UpdateKind::ReactionAdded ? event_types::ReactionAdded
                                                               : event_types::ReactionRemoved;
            place(ev);
            SatoriMessage message;
            message.id = encode_id(update.message_id, Scope::Message);
            message.channel = ev.channel;
            ev.message = std::move(message);
            if (update.user) ev.user = make_user(*update.user, ctx_.self_id);
            ev.emoji = update.reaction;
            return ev;
        }

        case UpdateKind::CallbackQuery: {
            if (update.callback_data.empty()) {
                throw BridgeError(ErrorKind::InternalError, "callback without data");
            }
            ev.type = event_types::InteractionButton;
            ev.button_id = update.callback_data;
            if (update.message) {
                ev.message = make_message(*update.message, ctx_);
                ev.channel = ev.message->channel;
                ev.guild = ev.message->guild;
            } else if (update.chat_id != 0 || update.chat) {
                place(ev);
            }
            // The pressing user, not the author of the message with the keyboard
            if (update.user) {
                ev.user = make_user(*update.user, ctx_.self_id);
                if (ev.guild) {
                    SatoriMember member;
                    member.user = ev.user;
                    ev.member = std::move(member);
                }
            }
            return ev;
        }

        default:
            return std::nullopt;
    }
}

} // namespace mtsatori
