#include "telegram/td_backend.hpp"
#include "util.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace mtsatori {

const char* auth_state_name(AuthState state) {
    switch (state) {
        case AuthState::Unknown:         return "Unknown";
        case AuthState::WaitParameters:  return "WaitParameters";
        case AuthState::WaitPhoneNumber: return "WaitPhoneNumber";
        case AuthState::WaitCode:        return "WaitCode";
        case AuthState::WaitPassword:    return "WaitPassword";
        case AuthState::WaitOther:       return "WaitOther";
        case AuthState::Ready:           return "Ready";
        case AuthState::LoggingOut:      return "LoggingOut";
        case AuthState::Closing:         return "Closing";
        case AuthState::Closed:          return "Closed";
    }
    return "Unknown";
}

namespace {

constexpr uint64_t kUntrackedBit = 1ull << 63;

std::string remote_id(const td_api::file* file) {
    if (!file || !file->remote_) return "";
    return file->remote_->id_;
}

std::string key(const char* kind, int64_t a, int64_t b) {
    return std::string(kind) + ":" + std::to_string(a) + ":" + std::to_string(b);
}

int64_t parse_cursor(const std::string& cursor) {
    if (cursor.empty()) return 0;
    try {
        size_t used = 0;
        long long value = std::stoll(cursor, &used);
        if (used == cursor.size() && value >= 0) return value;
    } catch (const std::exception&) {
        // fall through
    }
    throw BridgeError(ErrorKind::InvalidReference, "invalid page cursor '" + cursor + "'");
}

// ── Text and entities ───────────────────────────────────────────

std::vector<NativeEntity> entities_from(const td_api::formattedText& text) {
    std::vector<NativeEntity> out;
    for (const auto& e : text.entities_) {
        if (!e || !e->type_) continue;
        NativeEntity n;
        n.offset = static_cast<size_t>(e->offset_);
        n.length = static_cast<size_t>(e->length_);
        switch (e->type_->get_id()) {
            case td_api::textEntityTypeBold::ID:          n.kind = EntityKind::Bold; break;
            case td_api::textEntityTypeItalic::ID:        n.kind = EntityKind::Italic; break;
            case td_api::textEntityTypeUnderline::ID:     n.kind = EntityKind::Underline; break;
            case td_api::textEntityTypeStrikethrough::ID: n.kind = EntityKind::Strikethrough; break;
            case td_api::textEntityTypeSpoiler::ID:       n.kind = EntityKind::Spoiler; break;
            case td_api::textEntityTypeCode::ID:          n.kind = EntityKind::Code; break;
            case td_api::textEntityTypePre::ID:           n.kind = EntityKind::Pre; break;
            case td_api::textEntityTypePreCode::ID:
                n.kind = EntityKind::Pre;
                n.language = static_cast<const td_api::textEntityTypePreCode&>(*e->type_).language_;
                break;
            case td_api::textEntityTypeTextUrl::ID:
                n.kind = EntityKind::TextUrl;
                n.url = static_cast<const td_api::textEntityTypeTextUrl&>(*e->type_).url_;
                break;
            case td_api::textEntityTypeMention::ID:       n.kind = EntityKind::Mention; break;
            case td_api::textEntityTypeMentionName::ID:
                n.kind = EntityKind::TextMention;
                n.user_id = static_cast<const td_api::textEntityTypeMentionName&>(*e->type_).user_id_;
                break;
            default:
                continue;
        }
        out.push_back(std::move(n));
    }
    return out;
}

td_api::object_ptr<td_api::formattedText> formatted_text(const std::string& text,
                                                         const std::vector<NativeEntity>& entities) {
    auto out = td_api::make_object<td_api::formattedText>();
    out->text_ = text;
    for (const auto& e : entities) {
        td_api::object_ptr<td_api::TextEntityType> type;
        switch (e.kind) {
            case EntityKind::Bold:          type = td_api::make_object<td_api::textEntityTypeBold>(); break;
            case EntityKind::Italic:        type = td_api::make_object<td_api::textEntityTypeItalic>(); break;
            case EntityKind::Underline:     type = td_api::make_object<td_api::textEntityTypeUnderline>(); break;
            case EntityKind::Strikethrough: type = td_api::make_object<td_api::textEntityTypeStrikethrough>(); break;
            case EntityKind::Spoiler:       type = td_api::make_object<td_api::textEntityTypeSpoiler>(); break;
            case EntityKind::Code:          type = td_api::make_object<td_api::textEntityTypeCode>(); break;
            case EntityKind::Pre:
                if (e.language.empty()) {
                    type = td_api::make_object<td_api::textEntityTypePre>();
                } else {
                    auto pre = td_api::make_object<td_api::textEntityTypePreCode>();
                    pre->language_ = e.language;
                    type = std::move(pre);
                }
                break;
            case EntityKind::TextUrl: {
                auto url = td_api::make_object<td_api::textEntityTypeTextUrl>();
                url->url_ = e.url;
                type = std::move(url);
                break;
            }
            case EntityKind::TextMention: {
                auto mention = td_api::make_object<td_api::textEntityTypeMentionName>();
                mention->user_id_ = e.user_id;
                type = std::move(mention);
                break;
            }
            case EntityKind::Mention:
                // "@username" is recognised by the server itself.
                continue;
        }
        auto entity = td_api::make_object<td_api::textEntity>();
        entity->offset_ = static_cast<int32_t>(e.offset);
        entity->length_ = static_cast<int32_t>(e.length);
        entity->type_ = std::move(type);
        out->entities_.push_back(std::move(entity));
    }
    return out;
}

// ── Keyboards ───────────────────────────────────────────────────

NativeKeyboard keyboard_from(const td_api::ReplyMarkup* markup) {
    NativeKeyboard out;
    if (!markup || markup->get_id() != td_api::replyMarkupInlineKeyboard::ID) return out;
    const auto& inline_kb = static_cast<const td_api::replyMarkupInlineKeyboard&>(*markup);
    for (const auto& row : inline_kb.rows_) {
        std::vector<NativeButton> buttons;
        for (const auto& b : row) {
            if (!b || !b->type_) continue;
            NativeButton button;
            button.text = b->text_;
            switch (b->type_->get_id()) {
                case td_api::inlineKeyboardButtonTypeCallback::ID:
                    button.callback_data =
                        static_cast<const td_api::inlineKeyboardButtonTypeCallback&>(*b->type_).data_;
                    break;
                case td_api::inlineKeyboardButtonTypeUrl::ID:
                    button.url = static_cast<const td_api::inlineKeyboardButtonTypeUrl&>(*b->type_).url_;
                    break;
                case td_api::inlineKeyboardButtonTypeSwitchInline::ID:
                    button.switch_query =
                        static_cast<const td_api::inlineKeyboardButtonTypeSwitchInline&>(*b->type_).query_;
                    break;
                default:
                    continue;
            }
            buttons.push_back(std::move(button));
        }
        if (!buttons.empty()) out.push_back(std::move(buttons));
    }
    return out;
}

td_api::object_ptr<td_api::ReplyMarkup> reply_markup(const NativeKeyboard& keyboard) {
    if (keyboard.empty()) return nullptr;
    auto markup = td_api::make_object<td_api::replyMarkupInlineKeyboard>();
    for (const auto& row : keyboard) {
        std::vector<td_api::object_ptr<td_api::inlineKeyboardButton>> buttons;
        for (const auto& b : row) {
            auto button = td_api::make_object<td_api::inlineKeyboardButton>();
            button->text_ = b.text;
            if (!b.url.empty()) {
                auto type = td_api::make_object<td_api::inlineKeyboardButtonTypeUrl>();
                type->url_ = b.url;
                button->type_ = std::move(type);
            } else if (!b.switch_query.empty()) {
                auto type = td_api::make_object<td_api::inlineKeyboardButtonTypeSwitchInline>();
                type->query_ = b.switch_query;
                type->target_chat_ = td_api::make_object<td_api::targetChatCurrent>();
                button->type_ = std::move(type);
            } else {
                auto type = td_api::make_object<td_api::inlineKeyboardButtonTypeCallback>();
                type->data_ = b.callback_data;
                button->type_ = std::move(type);
            }
            buttons.push_back(std::move(button));
        }
        markup->rows_.push_back(std::move(buttons));
    }
    return markup;
}

int64_t sender_user_id(const td_api::MessageSender* sender) {
    if (!sender || sender->get_id() != td_api::messageSenderUser::ID) return 0;
    return static_cast<const td_api::messageSenderUser&>(*sender).user_id_;
}

std::string member_status(const td_api::ChatMemberStatus* status, std::string& custom_title) {
    if (!status) return "member";
    switch (status->get_id()) {
        case td_api::chatMemberStatusCreator::ID:
            custom_title = static_cast<const td_api::chatMemberStatusCreator&>(*status).custom_title_;
            return "creator";
        case td_api::chatMemberStatusAdministrator::ID:
            custom_title = static_cast<const td_api::chatMemberStatusAdministrator&>(*status).custom_title_;
            return "administrator";
        case td_api::chatMemberStatusRestricted::ID: return "restricted";
        case td_api::chatMemberStatusLeft::ID:       return "left";
        case td_api::chatMemberStatusBanned::ID:     return "banned";
        default:                                     return "member";
    }
}

bool supported_content(int32_t id) {
    switch (id) {
        case td_api::messageText::ID:
        case td_api::messagePhoto::ID:
        case td_api::messageVideo::ID:
        case td_api::messageAnimation::ID:
        case td_api::messageAudio::ID:
        case td_api::messageDocument::ID:
        case td_api::messageVoiceNote::ID:
        case td_api::messageVideoNote::ID:
        case td_api::messageSticker::ID:
        case td_api::messageLocation::ID:
        case td_api::messageVenue::ID:
            return true;
        default:
            return false;
    }
}

std::set<std::string> reaction_emojis(
        const std::vector<td_api::object_ptr<td_api::ReactionType>>& reactions) {
    std::set<std::string> out;
    for (const auto& r : reactions) {
        if (r && r->get_id() == td_api::reactionTypeEmoji::ID) {
            out.insert(static_cast<const td_api::reactionTypeEmoji&>(*r).emoji_);
        }
    }
    return out;
}

// Removes upload copies once a send is done with them.
struct TempFiles {
    std::vector<std::string> paths;
    ~TempFiles() {
        std::error_code ec;
        for (const auto& p : paths) {
            std::filesystem::remove(p, ec);
            std::filesystem::remove(std::filesystem::path(p).parent_path(), ec);
        }
    }
};

} // namespace

// ── Lifecycle ───────────────────────────────────────────────────

TdBackend::TdBackend(const AccountConfig& account, const BridgeConfig& bridge, int tdlib_verbosity)
    : account_(account)
    , bridge_(bridge)
    , tdlib_verbosity_(tdlib_verbosity)
    , rpc_timeout_(std::chrono::seconds(bridge.rpc_timeout_sec))
{}

TdBackend::~TdBackend() {
    if (!running_.load()) return;
    {
        std::lock_guard<std::mutex> lock(auth_mutex_);
        closing_requested_ = true;
    }
    if (auth_state() != AuthState::Closed) {
        td::ClientManager::get_manager_singleton()->send(
            client_id_, kUntrackedBit | next_untracked_++, td_api::make_object<td_api::close>());
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        std::unique_lock<std::mutex> lock(auth_mutex_);
        auth_cv_.wait_until(lock, deadline, [this] { return auth_state_ == AuthState::Closed; });
        if (auth_state_ != AuthState::Closed) {
            std::cerr << "[tdlib] close timed out, stopping anyway\n";
        }
    }
    running_.store(false);
    if (receive_thread_.joinable()) receive_thread_.join();
    pending_.reject_all(ErrorKind::SessionTerminated, "client closed");
    sends_.reject_all(ErrorKind::SessionTerminated, "client closed");
}

void TdBackend::start() {
    auto verbosity = td_api::make_object<td_api::setLogVerbosityLevel>();
    verbosity->new_verbosity_level_ = tdlib_verbosity_;
    td::ClientManager::execute(std::move(verbosity));

    auto* manager = td::ClientManager::get_manager_singleton();
    client_id_ = manager->create_client_id();
    running_.store(true);
    receive_thread_ = std::thread([this]() { receive_loop(); });

    // The instance is created by its first request.
    auto version = td_api::make_object<td_api::getOption>();
    version->name_ = "version";
    auto answer = request(std::move(version));
    if (answer && answer->get_id() == td_api::optionValueString::ID) {
        std::cerr << "[tdlib] client " << client_id_ << " running TDLib "
                  << static_cast<const td_api::optionValueString&>(*answer).value_ << "\n";
    }
}

td_api::object_ptr<td_api::Object> TdBackend::request(
        td_api::object_ptr<td_api::Function> function, std::chrono::milliseconds timeout) {
    uint64_t id = pending_.open();
    td::ClientManager::get_manager_singleton()->send(client_id_, id, std::move(function));
    auto result = pending_.wait(id, timeout);
    if (result && result->get_id() == td_api::error::ID) {
        auto error = td::move_tl_object_as<td_api::error>(result);
        throw BackendError(error->code_, error->message_, parse_retry_after(error->message_));
    }
    return result;
}

td_api::object_ptr<td_api::Object> TdBackend::request(td_api::object_ptr<td_api::Function> function) {
    return request(std::move(function), rpc_timeout_);
}

void TdBackend::receive_loop() {
    auto* manager = td::ClientManager::get_manager_singleton();
    while (running_.load()) {
        auto response = manager->receive(1.0);
        if (!response.object) continue;
        if (response.client_id != client_id_) continue;

        if (response.request_id == 0) {
            try {
                handle_update(std::move(response.object));
            } catch (const std::exception& e) {
                std::cerr << "[tdlib] update handling failed: " << e.what() << "\n";
            }
            continue;
        }
        if (response.request_id & kUntrackedBit) continue;
        pending_.resolve(response.request_id, std::move(response.object));
    }
}

AuthState TdBackend::auth_state() const {
    std::lock_guard<std::mutex> lock(auth_mutex_);
    return auth_state_;
}

AuthState TdBackend::wait_auth_change(AuthState seen, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(auth_mutex_);
    auth_cv_.wait_for(lock, timeout, [&] { return auth_state_ != seen; });
    return auth_state_;
}

void TdBackend::log_out() {
    {
        std::lock_guard<std::mutex> lock(auth_mutex_);
        closing_requested_ = true;
    }
    request(td_api::make_object<td_api::logOut>());
    std::unique_lock<std::mutex> lock(auth_mutex_);
    auth_cv_.wait_for(lock, rpc_timeout_, [this] { return auth_state_ == AuthState::Closed; });
}

bool TdBackend::wait_connected(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return connected_cv_.wait_for(lock, timeout, [this] { return connected_; });
}

void TdBackend::fail_pending(ErrorKind kind, const std::string& reason) {
    pending_.reject_all(kind, reason);
    sends_.reject_all(kind, reason);
    queue_cv_.notify_all();
}

// ── Update handling (receive thread) ────────────────────────────

void TdBackend::enqueue(NativeUpdate update, bool needs_message) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(QueuedUpdate{std::move(update), needs_message});
    }
    queue_cv_.notify_one();
}

void TdBackend::handle_update(td_api::object_ptr<td_api::Object> object) {
    switch (object->get_id()) {
        case td_api::updateAuthorizationState::ID: {
            auto& u = static_cast<td_api::updateAuthorizationState&>(*object);
            if (u.authorization_state_) on_auth_state(*u.authorization_state_);
            break;
        }
        case td_api::updateConnectionState::ID: {
            auto& u = static_cast<td_api::updateConnectionState&>(*object);
            if (u.state_) on_connection_state(*u.state_);
            break;
        }
        case td_api::updateUser::ID: {
            auto& u = static_cast<td_api::updateUser&>(*object);
            if (!u.user_) break;
            NativeUser user = convert_user(*u.user_);
            std::lock_guard<std::mutex> lock(cache_mutex_);
            users_[user.id] = std::move(user);
            break;
        }
        case td_api::updateNewChat::ID: {
            auto& u = static_cast<td_api::updateNewChat&>(*object);
            if (!u.chat_) break;
            ChatInfo info = convert_chat(*u.chat_);
            std::lock_guard<std::mutex> lock(cache_mutex_);
            chats_[info.chat.id] = std::move(info);
            break;
        }
        case td_api::updateChatTitle::ID: {
            auto& u = static_cast<td_api::updateChatTitle&>(*object);
            std::lock_guard<std::mutex> lock(cache_mutex_);
            auto it = chats_.find(u.chat_id_);
            if (it != chats_.end()) it->second.chat.title = u.title_;
            break;
        }
        case td_api::updateChatPhoto::ID: {
            auto& u = static_cast<td_api::updateChatPhoto&>(*object);
            std::lock_guard<std::mutex> lock(cache_mutex_);
            auto it = chats_.find(u.chat_id_);
            if (it != chats_.end()) {
                it->second.chat.photo_file_id = u.photo_ ? remote_id(u.photo_->small_.get()) : "";
            }
            break;
        }
        case td_api::updateNewMessage::ID: {
            auto& u = static_cast<td_api::updateNewMessage&>(*object);
            if (u.message_) on_new_message(*u.message_);
            break;
        }
        case td_api::updateMessageSendSucceeded::ID: {
            auto& u = static_cast<td_api::updateMessageSendSucceeded&>(*object);
            if (!u.message_) break;
            NativeMessage sent = convert_message(*u.message_);
            on_send_finished(u.old_message_id_, &sent, nullptr);
            NativeUpdate update;
            update.update_id = key("msg", sent.chat_id, sent.id);
            update.kind = UpdateKind::NewMessage;
            update.chat_id = sent.chat_id;
            update.message_id = sent.id;
            update.date = sent.date;
            update.raw_type = "updateMessageSendSucceeded";
            update.message = std::move(sent);
            enqueue(std::move(update));
            break;
        }
        case td_api::updateMessageSendFailed::ID: {
            auto& u = static_cast<td_api::updateMessageSendFailed&>(*object);
            on_send_finished(u.old_message_id_, nullptr, u.error_.get());
            break;
        }
        case td_api::updateMessageEdited::ID: {
            auto& u = static_cast<td_api::updateMessageEdited&>(*object);
            NativeUpdate update;
            update.update_id = "edit:" + std::to_string(u.chat_id_) + ":" +
                               std::to_string(u.message_id_) + ":" + std::to_string(u.edit_date_);
            update.kind = UpdateKind::EditedMessage;
            update.chat_id = u.chat_id_;
            update.message_id = u.message_id_;
            update.date = u.edit_date_;
            update.raw_type = "updateMessageEdited";
            enqueue(std::move(update), true);
            break;
        }
        case td_api::updateDeleteMessages::ID: {
            auto& u = static_cast<td_api::updateDeleteMessages&>(*object);
            // Cache evictions are not deletions.
            if (!u.is_permanent_ || u.from_cache_) break;
            std::optional<NativeChat> chat;
            {
                std::lock_guard<std::mutex> lock(cache_mutex_);
                auto it = chats_.find(u.chat_id_);
                if (it != chats_.end()) chat = it->second.chat;
            }
            for (int64_t id : u.message_ids_) {
                NativeUpdate update;
                update.update_id = key("del", u.chat_id_, id);
                update.kind = UpdateKind::DeletedMessage;
                update.chat_id = u.chat_id_;
                update.message_id = id;
                update.chat = chat;
                update.raw_type = "updateDeleteMessages";
                enqueue(std::move(update));
            }
            break;
        }
        case td_api::updateMessageReaction::ID:
            on_reaction(static_cast<const td_api::updateMessageReaction&>(*object));
            break;
        case td_api::updateNewCallbackQuery::ID: {
            auto& u = static_cast<td_api::updateNewCallbackQuery&>(*object);
            NativeUpdate update;
            update.update_id = "cb:" + std::to_string(u.id_);
            update.kind = UpdateKind::CallbackQuery;
            update.callback_id = std::to_string(u.id_);
            update.chat_id = u.chat_id_;
            update.message_id = u.message_id_;
            update.user = cached_user(u.sender_user_id_);
            update.raw_type = "updateNewCallbackQuery";
            if (u.payload_ && u.payload_->get_id() == td_api::callbackQueryPayloadData::ID) {
                update.callback_data =
                    static_cast<const td_api::callbackQueryPayloadData&>(*u.payload_).data_;
            }
            enqueue(std::move(update), true);
            break;
        }
        default:
            break;
    }
}

void TdBackend::on_auth_state(const td_api::AuthorizationState& state) {
    AuthState next;
    switch (state.get_id()) {
        case td_api::authorizationStateWaitTdlibParameters::ID: next = AuthState::WaitParameters; break;
        case td_api::authorizationStateWaitPhoneNumber::ID:     next = AuthState::WaitPhoneNumber; break;
        case td_api::authorizationStateWaitCode::ID:            next = AuthState::WaitCode; break;
        case td_api::authorizationStateWaitPassword::ID:        next = AuthState::WaitPassword; break;
        case td_api::authorizationStateReady::ID:               next = AuthState::Ready; break;
        case td_api::authorizationStateLoggingOut::ID:          next = AuthState::LoggingOut; break;
        case td_api::authorizationStateClosing::ID:             next = AuthState::Closing; break;
        case td_api::authorizationStateClosed::ID:              next = AuthState::Closed; break;
        default:                                                next = AuthState::WaitOther; break;
    }

    bool revoked = false;
    {
        std::lock_guard<std::mutex> lock(auth_mutex_);
        revoked = auth_state_ == AuthState::Ready && !closing_requested_ &&
                  (next == AuthState::LoggingOut || next == AuthState::Closing ||
                   next == AuthState::Closed);
        auth_state_ = next;
    }
    auth_cv_.notify_all();
    std::cerr << "[tdlib] authorization " << auth_state_name(next) << "\n";

    if (revoked) {
        NativeUpdate update;
        update.kind = UpdateKind::AuthorizationRevoked;
        update.raw_type = "authorization " + std::string(auth_state_name(next));
        enqueue(std::move(update));
    }
    if (next == AuthState::Closed) {
        pending_.reject_all(ErrorKind::SessionTerminated, "client closed");
        sends_.reject_all(ErrorKind::SessionTerminated, "client closed");
    }
}

void TdBackend::on_connection_state(const td_api::ConnectionState& state) {
    NativeUpdate update;
    switch (state.get_id()) {
        case td_api::connectionStateWaitingForNetwork::ID:
        case td_api::connectionStateConnectingToProxy::ID:
        case td_api::connectionStateConnecting::ID: {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!connected_) return;
            connected_ = false;
            update.kind = UpdateKind::ConnectionLost;
            break;
        }
        case td_api::connectionStateUpdating::ID:
            update.kind = UpdateKind::Checkpoint;
            break;
        case td_api::connectionStateReady::ID: {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            connected_ = true;
            connected_cv_.notify_all();
            update.kind = UpdateKind::BacklogDrained;
            break;
        }
        default:
            return;
    }
    update.raw_type = "updateConnectionState";
    std::cerr << "[tdlib] connection " << update_kind_name(update.kind) << "\n";
    enqueue(std::move(update));
}

void TdBackend::on_new_message(const td_api::message& message) {
    // Our own sends surface through updateMessageSendSucceeded.
    if (message.sending_state_) return;

    std::optional<NativeChat> chat;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = chats_.find(message.chat_id_);
        if (it != chats_.end()) chat = it->second.chat;
    }

    auto membership = [&](UpdateKind kind, int64_t user_id) {
        NativeUpdate update;
        update.update_id = std::string(kind == UpdateKind::MemberJoined ? "join:" : "leave:") +
                           std::to_string(message.chat_id_) + ":" + std::to_string(message.id_) +
                           ":" + std::to_string(user_id);
        update.kind = kind;
        update.chat_id = message.chat_id_;
        update.message_id = message.id_;
        update.chat = chat;
        update.user = cached_user(user_id);
        update.date = message.date_;
        update.raw_type = "updateNewMessage";
        enqueue(std::move(update));
    };

    int32_t content = message.content_ ? message.content_->get_id() : 0;
    switch (content) {
        case td_api::messageChatAddMembers::ID:
            for (int64_t uid : static_cast<const td_api::messageChatAddMembers&>(
                                   *message.content_).member_user_ids_) {
                membership(UpdateKind::MemberJoined, uid);
            }
            return;
        case td_api::messageChatJoinByLink::ID:
        case td_api::messageChatJoinByRequest::ID:
            membership(UpdateKind::MemberJoined, sender_user_id(message.sender_id_.get()));
            return;
        case td_api::messageChatDeleteMember::ID:
            membership(UpdateKind::MemberLeft,
                       static_cast<const td_api::messageChatDeleteMember&>(*message.content_).user_id_);
            return;
        default:
            break;
    }

    NativeUpdate update;
    update.update_id = key("msg", message.chat_id_, message.id_);
    update.chat_id = message.chat_id_;
    update.message_id = message.id_;
    update.date = message.date_;
    if (supported_content(content)) {
        update.kind = UpdateKind::NewMessage;
        update.raw_type = "updateNewMessage";
        update.message = convert_message(message);
    } else {
        update.kind = UpdateKind::Unknown;
        update.raw_type = "updateNewMessage/" + std::to_string(content);
    }
    enqueue(std::move(update));
}

void TdBackend::on_send_finished(int64_t old_id, NativeMessage* sent, const td_api::error* error) {
    int code = error ? error->code_ : -1;
    std::string text = error ? error->message_ : "send failed";

    std::lock_guard<std::mutex> lock(sends_mutex_);
    auto it = awaiting_.find(old_id);
    if (it == awaiting_.end()) {
        // The sender has not registered yet, or gave up waiting.
        if (finished_early_.size() + failed_early_.size() > 256) {
            finished_early_.clear();
            failed_early_.clear();
        }
        if (sent) {
            finished_early_[old_id] = *sent;
        } else {
            failed_early_[old_id] = {code, text};
        }
        return;
    }
    if (sent) {
        sends_.resolve(it->second, *sent);
    } else {
        sends_.reject(it->second,
                      std::make_exception_ptr(BackendError(code, text, parse_retry_after(text))));
    }
    awaiting_.erase(it);
}

void TdBackend::on_reaction(const td_api::updateMessageReaction& u) {
    std::set<std::string> before = reaction_emojis(u.old_reaction_types_);
    std::set<std::string> after = reaction_emojis(u.new_reaction_types_);
    int64_t actor = sender_user_id(u.actor_id_.get());

    std::optional<NativeChat> chat;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = chats_.find(u.chat_id_);
        if (it != chats_.end()) chat = it->second.chat;
    }

    auto emit = [&](UpdateKind kind, const std::string& emoji) {
        NativeUpdate update;
        update.update_id = std::string(kind == UpdateKind::ReactionAdded ? "react+:" : "react-:") +
                           std::to_string(u.chat_id_) + ":" + std::to_string(u.message_id_) + ":" +
                           std::to_string(actor) + ":" + emoji + ":" + std::to_string(u.date_);
        update.kind = kind;
        update.chat_id = u.chat_id_;
        update.message_id = u.message_id_;
        update.chat = chat;
        if (actor != 0) update.user = cached_user(actor);
        update.reaction = emoji;
        update.date = u.date_;
        update.raw_type = "updateMessageReaction";
        enqueue(std::move(update));
    };
    for (const auto& e : after) {
        if (!before.count(e)) emit(UpdateKind::ReactionAdded, e);
    }
    for (const auto& e : before) {
        if (!after.count(e)) emit(UpdateKind::ReactionRemoved, e);
    }
}

std::vector<NativeUpdate> TdBackend::poll_updates(std::chrono::milliseconds timeout) {
    std::deque<QueuedUpdate> batch;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || !running_.load(); });
        batch.swap(queue_);
    }

    std::vector<NativeUpdate> out;
    out.reserve(batch.size());
    for (auto& q : batch) {
        if (q.needs_message && q.update.chat_id != 0 && q.update.message_id != 0) {
            try {
                q.update.message = get_message(q.update.chat_id, q.update.message_id);
                if (!q.update.chat) q.update.chat = q.update.message->chat;
            } catch (const std::exception& e) {
                std::cerr << "[tdlib] cannot load message " << q.update.chat_id << "/"
                          << q.update.message_id << ": " << e.what() << "\n";
                if (q.update.kind == UpdateKind::EditedMessage) continue;
            }
        }
        out.push_back(std::move(q.update));
    }
    return out;
}

// ── Conversion ──────────────────────────────────────────────────

NativeUser TdBackend::convert_user(const td_api::user& user) const {
    NativeUser out;
    out.id = user.id_;
    out.first_name = user.first_name_;
    out.last_name = user.last_name_;
    if (user.usernames_ && !user.usernames_->active_usernames_.empty()) {
        out.username = user.usernames_->active_usernames_.front();
    }
    if (user.profile_photo_) out.photo_file_id = remote_id(user.profile_photo_->small_.get());
    out.is_bot = user.type_ && user.type_->get_id() == td_api::userTypeBot::ID;
    return out;
}

TdBackend::ChatInfo TdBackend::convert_chat(const td_api::chat& chat) const {
    ChatInfo info;
    info.chat.id = chat.id_;
    info.chat.title = chat.title_;
    if (chat.photo_) info.chat.photo_file_id = remote_id(chat.photo_->small_.get());
    if (!chat.type_) return info;
    switch (chat.type_->get_id()) {
        case td_api::chatTypePrivate::ID:
            info.chat.kind = ChatKind::Private;
            info.private_user_id = static_cast<const td_api::chatTypePrivate&>(*chat.type_).user_id_;
            break;
        case td_api::chatTypeSecret::ID:
            info.chat.kind = ChatKind::Secret;
            info.private_user_id = static_cast<const td_api::chatTypeSecret&>(*chat.type_).user_id_;
            break;
        case td_api::chatTypeBasicGroup::ID:
            info.chat.kind = ChatKind::Group;
            info.group_id = static_cast<const td_api::chatTypeBasicGroup&>(*chat.type_).basic_group_id_;
            break;
        case td_api::chatTypeSupergroup::ID: {
            const auto& sg = static_cast<const td_api::chatTypeSupergroup&>(*chat.type_);
            info.chat.kind = sg.is_channel_ ? ChatKind::Channel : ChatKind::Supergroup;
            info.group_id = sg.supergroup_id_;
            break;
        }
        default:
            break;
    }
    return info;
}

NativeUser TdBackend::cached_user(int64_t user_id) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = users_.find(user_id);
    if (it != users_.end()) return it->second;
    NativeUser out;
    out.id = user_id;
    return out;
}

TdBackend::ChatInfo TdBackend::chat_info(int64_t chat_id) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = chats_.find(chat_id);
        if (it != chats_.end()) return it->second;
    }
    auto fn = td_api::make_object<td_api::getChat>();
    fn->chat_id_ = chat_id;
    ChatInfo info = convert_chat(*call<td_api::chat>(std::move(fn)));
    std::lock_guard<std::mutex> lock(cache_mutex_);
    chats_[chat_id] = info;
    return info;
}

// Messages seen recently, so a reply can carry the message it answers
// without another round trip from the receive thread.
static const size_t kRecentMessages = 2048;

NativeMessage TdBackend::convert_message(const td_api::message& message) const {
    NativeMessage out = translate_message(message);
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (out.reply_to_message_id != 0) {
        auto it = recent_.find({out.chat_id, out.reply_to_message_id});
        if (it != recent_.end()) out.reply_to = it->second;
    }
    auto entry = std::make_shared<NativeMessage>(out);
    entry->reply_to.reset();
    auto slot = std::make_pair(out.chat_id, out.id);
    if (recent_.find(slot) == recent_.end()) {
        if (recent_order_.size() >= kRecentMessages) {
            recent_.erase(recent_order_.front());
            recent_order_.pop_front();
        }
        recent_order_.push_back(slot);
    }
    recent_[slot] = std::move(entry);
    return out;
}

NativeMessage TdBackend::translate_message(const td_api::message& message) const {
    NativeMessage out;
    out.chat_id = message.chat_id_;
    out.id = message.id_;
    out.date = message.date_;
    out.edit_date = message.edit_date_;
    out.outgoing = message.is_outgoing_;
    out.chat.id = message.chat_id_;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = chats_.find(message.chat_id_);
        if (it != chats_.end()) out.chat = it->second.chat;
    }

    if (message.sender_id_) {
        if (message.sender_id_->get_id() == td_api::messageSenderUser::ID) {
            out.sender = cached_user(sender_user_id(message.sender_id_.get()));
        } else if (message.sender_id_->get_id() == td_api::messageSenderChat::ID) {
            out.sender_chat_id = static_cast<const td_api::messageSenderChat&>(*message.sender_id_).chat_id_;
        }
    }

    if (message.reply_to_ && message.reply_to_->get_id() == td_api::messageReplyToMessage::ID) {
        out.reply_to_message_id =
            static_cast<const td_api::messageReplyToMessage&>(*message.reply_to_).message_id_;
    }

    if (message.forward_info_ && message.forward_info_->origin_) {
        const auto& origin = *message.forward_info_->origin_;
        switch (origin.get_id()) {
            case td_api::messageOriginUser::ID:
                out.forward_origin = cached_user(
                    static_cast<const td_api::messageOriginUser&>(origin).sender_user_id_).display_name();
                break;
            case td_api::messageOriginHiddenUser::ID:
                out.forward_origin = static_cast<const td_api::messageOriginHiddenUser&>(origin).sender_name_;
                break;
            case td_api::messageOriginChat::ID: {
                int64_t id = static_cast<const td_api::messageOriginChat&>(origin).sender_chat_id_;
                std::lock_guard<std::mutex> lock(cache_mutex_);
                auto it = chats_.find(id);
                out.forward_origin = it != chats_.end() ? it->second.chat.title : std::to_string(id);
                break;
            }
            case td_api::messageOriginChannel::ID: {
                int64_t id = static_cast<const td_api::messageOriginChannel&>(origin).chat_id_;
                std::lock_guard<std::mutex> lock(cache_mutex_);
                auto it = chats_.find(id);
                out.forward_origin = it != chats_.end() ? it->second.chat.title : std::to_string(id);
                break;
            }
            default:
                break;
        }
    }

    out.keyboard = keyboard_from(message.reply_markup_.get());

    auto caption = [&](const td_api::object_ptr<td_api::formattedText>& text) {
        if (!text) return;
        out.text = text->text_;
        out.entities = entities_from(*text);
    };
    auto media = [&](MediaKind kind, const td_api::file* file, const std::string& name,
                     const std::string& mime) {
        NativeMedia m;
        m.kind = kind;
        m.file_id = remote_id(file);
        m.file_name = name;
        m.mime = mime;
        out.media = std::move(m);
    };

    if (!message.content_) return out;
    const auto& content = *message.content_;
    switch (content.get_id()) {
        case td_api::messageText::ID:
            caption(static_cast<const td_api::messageText&>(content).text_);
            break;
        case td_api::messagePhoto::ID: {
            const auto& c = static_cast<const td_api::messagePhoto&>(content);
            caption(c.caption_);
            if (c.photo_ && !c.photo_->sizes_.empty()) {
                media(MediaKind::Photo, c.photo_->sizes_.back()->photo_.get(), "", "image/jpeg");
                out.media->spoiler = c.has_spoiler_;
            }
            out.caption_above_media = c.show_caption_above_media_;
            break;
        }
        case td_api::messageVideo::ID: {
            const auto& c = static_cast<const td_api::messageVideo&>(content);
            caption(c.caption_);
            if (c.video_) {
                media(MediaKind::Video, c.video_->video_.get(), c.video_->file_name_, c.video_->mime_type_);
                out.media->spoiler = c.has_spoiler_;
            }
            out.caption_above_media = c.show_caption_above_media_;
            break;
        }
        case td_api::messageAnimation::ID: {
            const auto& c = static_cast<const td_api::messageAnimation&>(content);
            caption(c.caption_);
            if (c.animation_) {
                media(MediaKind::Animation, c.animation_->animation_.get(),
                      c.animation_->file_name_, c.animation_->mime_type_);
                out.media->spoiler = c.has_spoiler_;
            }
            out.caption_above_media = c.show_caption_above_media_;
            break;
        }
        case td_api::messageAudio::ID: {
            const auto& c = static_cast<const td_api::messageAudio&>(content);
            caption(c.caption_);
            if (c.audio_) {
                media(MediaKind::Audio, c.audio_->audio_.get(), c.audio_->file_name_, c.audio_->mime_type_);
            }
            break;
        }
        case td_api::messageDocument::ID: {
            const auto& c = static_cast<const td_api::messageDocument&>(content);
            caption(c.caption_);
            if (c.document_) {
                media(MediaKind::Document, c.document_->document_.get(),
                      c.document_->file_name_, c.document_->mime_type_);
            }
            break;
        }
        case td_api::messageVoiceNote::ID: {
            const auto& c = static_cast<const td_api::messageVoiceNote&>(content);
            caption(c.caption_);
            if (c.voice_note_) {
                media(MediaKind::Voice, c.voice_note_->voice_.get(), "", c.voice_note_->mime_type_);
            }
            break;
        }
        case td_api::messageVideoNote::ID: {
            const auto& c = static_cast<const td_api::messageVideoNote&>(content);
            if (c.video_note_) media(MediaKind::VideoNote, c.video_note_->video_.get(), "", "video/mp4");
            break;
        }
        case td_api::messageSticker::ID: {
            const auto& c = static_cast<const td_api::messageSticker&>(content);
            if (c.sticker_) media(MediaKind::Sticker, c.sticker_->sticker_.get(), "", "image/webp");
            break;
        }
        case td_api::messageLocation::ID: {
            const auto& c = static_cast<const td_api::messageLocation&>(content);
            if (c.location_) out.location = NativeLocation{c.location_->latitude_, c.location_->longitude_};
            break;
        }
        case td_api::messageVenue::ID: {
            const auto& c = static_cast<const td_api::messageVenue&>(content);
            if (c.venue_ && c.venue_->location_) {
                out.location = NativeLocation{c.venue_->location_->latitude_,
                                              c.venue_->location_->longitude_};
                out.text = c.venue_->title_;
            }
            break;
        }
        default:
            break;
    }
    return out;
}

NativeMember TdBackend::convert_member(const td_api::chatMember& member) {
    NativeMember out;
    int64_t uid = sender_user_id(member.member_id_.get());
    out.user = cached_user(uid);
    if (uid != 0 && out.user.first_name.empty() && out.user.username.empty()) {
        out.user = get_user(uid);
    }
    out.status = member_status(member.status_.get(), out.custom_title);
    out.joined_at = member.joined_chat_date_;
    return out;
}

// ── Reads ───────────────────────────────────────────────────────

NativeUser TdBackend::get_me() {
    NativeUser me = convert_user(*call<td_api::user>(td_api::make_object<td_api::getMe>()));
    std::lock_guard<std::mutex> lock(cache_mutex_);
    self_id_ = me.id;
    users_[me.id] = me;
    return me;
}

NativeUser TdBackend::get_user(int64_t user_id) {
    auto fn = td_api::make_object<td_api::getUser>();
    fn->user_id_ = user_id;
    NativeUser user = convert_user(*call<td_api::user>(std::move(fn)));
    std::lock_guard<std::mutex> lock(cache_mutex_);
    users_[user.id] = user;
    return user;
}

NativeChat TdBackend::get_chat(int64_t chat_id) {
    auto fn = td_api::make_object<td_api::getChat>();
    fn->chat_id_ = chat_id;
    ChatInfo info = convert_chat(*call<td_api::chat>(std::move(fn)));
    std::lock_guard<std::mutex> lock(cache_mutex_);
    chats_[chat_id] = info;
    return info.chat;
}

NativeChat TdBackend::create_private_chat(int64_t user_id) {
    auto fn = td_api::make_object<td_api::createPrivateChat>();
    fn->user_id_ = user_id;
    fn->force_ = false;
    ChatInfo info = convert_chat(*call<td_api::chat>(std::move(fn)));
    std::lock_guard<std::mutex> lock(cache_mutex_);
    chats_[info.chat.id] = info;
    return info.chat;
}

Page<NativeChat> TdBackend::get_chats(const std::string& cursor, int limit) {
    int64_t offset = parse_cursor(cursor);
    int32_t want = static_cast<int32_t>(offset + limit);

    auto load = td_api::make_object<td_api::loadChats>();
    load->limit_ = want;
    try {
        request(std::move(load));
    } catch (const BackendError& e) {
        // 404: everything is already loaded.
        if (e.code() != 404) throw;
    }

    auto fn = td_api::make_object<td_api::getChats>();
    fn->limit_ = want;
    auto chats = call<td_api::chats>(std::move(fn));

    Page<NativeChat> page;
    const auto& ids = chats->chat_ids_;
    for (size_t i = static_cast<size_t>(offset); i < ids.size() && i < static_cast<size_t>(want); ++i) {
        page.items.push_back(chat_info(ids[i]).chat);
    }
    if (ids.size() >= static_cast<size_t>(want)) page.next = std::to_string(want);
    return page;
}

NativeMember TdBackend::get_chat_member(int64_t chat_id, int64_t user_id) {
    auto sender = td_api::make_object<td_api::messageSenderUser>();
    sender->user_id_ = user_id;
    auto fn = td_api::make_object<td_api::getChatMember>();
    fn->chat_id_ = chat_id;
    fn->member_id_ = std::move(sender);
    return convert_member(*call<td_api::chatMember>(std::move(fn)));
}

Page<NativeMember> TdBackend::get_chat_members(int64_t chat_id, const std::string& cursor, int limit) {
    ChatInfo info = chat_info(chat_id);
    Page<NativeMember> page;

    switch (info.chat.kind) {
        case ChatKind::Private:
        case ChatKind::Secret: {
            if (!cursor.empty()) return page;
            NativeMember self;
            self.user = get_me();
            self.status = "member";
            page.items.push_back(std::move(self));
            if (info.private_user_id != 0 && info.private_user_id != page.items.front().user.id) {
                NativeMember peer;
                peer.user = get_user(info.private_user_id);
                peer.status = "member";
                page.items.push_back(std::move(peer));
            }
            return page;
        }
        case ChatKind::Group: {
            if (!cursor.empty()) return page;
            auto fn = td_api::make_object<td_api::getBasicGroupFullInfo>();
            fn->basic_group_id_ = info.group_id;
            auto full = call<td_api::basicGroupFullInfo>(std::move(fn));
            for (const auto& m : full->members_) {
                if (m) page.items.push_back(convert_member(*m));
            }
            return page;
        }
        case ChatKind::Supergroup:
        case ChatKind::Channel: {
            int64_t offset = parse_cursor(cursor);
            auto fn = td_api::make_object<td_api::getSupergroupMembers>();
            fn->supergroup_id_ = info.group_id;
            fn->offset_ = static_cast<int32_t>(offset);
            fn->limit_ = limit;
            auto members = call<td_api::chatMembers>(std::move(fn));
            for (const auto& m : members->members_) {
                if (m) page.items.push_back(convert_member(*m));
            }
            int64_t reached = offset + static_cast<int64_t>(members->members_.size());
            if (!members->members_.empty() && reached < members->total_count_) {
                page.next = std::to_string(reached);
            }
            return page;
        }
    }
    return page;
}

NativeMessage TdBackend::get_message(int64_t chat_id, int64_t message_id) {
    auto fn = td_api::make_object<td_api::getMessage>();
    fn->chat_id_ = chat_id;
    fn->message_id_ = message_id;
    NativeMessage out = convert_message(*call<td_api::message>(std::move(fn)));
    if (out.reply_to_message_id != 0 && !out.reply_to) {
        auto replied = td_api::make_object<td_api::getMessage>();
        replied->chat_id_ = chat_id;
        replied->message_id_ = out.reply_to_message_id;
        try {
            auto quoted = std::make_shared<NativeMessage>(
                translate_message(*call<td_api::message>(std::move(replied))));
            out.reply_to = std::move(quoted);
        } catch (const BackendError& e) {
            // Deleted or inaccessible; the quote keeps only its id.
            std::cerr << "[tdlib] replied message " << out.reply_to_message_id
                      << " unavailable: " << e.what() << "\n";
        }
    }
    return out;
}

Page<NativeMessage> TdBackend::get_history(int64_t chat_id, const std::string& cursor, int limit) {
    int64_t from = parse_cursor(cursor);
    auto fn = td_api::make_object<td_api::getChatHistory>();
    fn->chat_id_ = chat_id;
    fn->from_message_id_ = from;
    fn->offset_ = 0;
    fn->limit_ = from == 0 ? limit : limit + 1;
    fn->only_local_ = false;
    auto messages = call<td_api::messages>(std::move(fn));

    Page<NativeMessage> page;
    for (const auto& m : messages->messages_) {
        // The page starts at from_message_id itself, already listed last time.
        if (!m || (from != 0 && m->id_ == from)) continue;
        page.items.push_back(convert_message(*m));
        if (page.items.size() >= static_cast<size_t>(limit)) break;
    }
    if (!page.items.empty()) page.next = std::to_string(page.items.back().id);
    return page;
}

std::string TdBackend::download_file(const std::string& file_id) {
    auto remote = td_api::make_object<td_api::getRemoteFile>();
    remote->remote_file_id_ = file_id;
    remote->file_type_ = nullptr;
    auto file = call<td_api::file>(std::move(remote));
    if (bridge_.max_media_bytes > 0 && file->size_ > 0 &&
        static_cast<uint64_t>(file->size_) > bridge_.max_media_bytes) {
        throw BridgeError(ErrorKind::Forbidden, "file exceeds the media size limit");
    }

    auto fn = td_api::make_object<td_api::downloadFile>();
    fn->file_id_ = file->id_;
    fn->priority_ = 1;
    fn->offset_ = 0;
    fn->limit_ = 0;
    fn->synchronous_ = true;
    auto answer = request(std::move(fn), std::chrono::seconds(bridge_.media_timeout_sec));
    if (!answer || answer->get_id() != td_api::file::ID) {
        throw BackendError(-1, "unexpected TDLib answer type");
    }
    auto done = td::move_tl_object_as<td_api::file>(answer);
    if (!done->local_ || !done->local_->is_downloading_completed_) {
        throw BackendError(-1, "download incomplete");
    }

    std::ifstream in(done->local_->path_, std::ios::binary);
    if (!in.is_open()) throw BackendError(-1, "cannot open downloaded file");
    std::ostringstream data;
    data << in.rdbuf();
    return data.str();
}

// ── Writes ──────────────────────────────────────────────────────

td_api::object_ptr<td_api::InputFile> TdBackend::input_file(
        const InputFile& file, std::vector<std::string>& temp_files) const {
    switch (file.source) {
        case InputFile::Source::RemoteId:
        case InputFile::Source::Url: {
            auto remote = td_api::make_object<td_api::inputFileRemote>();
            remote->id_ = file.value;
            return remote;
        }
        case InputFile::Source::Path: {
            auto local = td_api::make_object<td_api::inputFileLocal>();
            local->path_ = file.value;
            return local;
        }
        case InputFile::Source::Bytes: {
            std::string name = file.name.empty() ? "file" + extension_for_mime(file.mime) : file.name;
            std::string path = expand_home(account_.data_dir) + "/uploads/" + generate_id() + "/" +
                               std::filesystem::path(name).filename().string();
            if (!atomic_write_file(path, file.value)) {
                throw BackendError(-1, "cannot stage upload " + name);
            }
            temp_files.push_back(path);
            auto local = td_api::make_object<td_api::inputFileLocal>();
            local->path_ = path;
            return local;
        }
    }
    throw BackendError(-1, "unknown input file source");
}

td_api::object_ptr<td_api::InputMessageContent> TdBackend::input_content(
        const OutgoingMedia& media, td_api::object_ptr<td_api::formattedText> caption,
        bool caption_above, std::vector<std::string>& temp_files) const {
    auto file = input_file(media.file, temp_files);
    switch (media.kind) {
        case MediaKind::Photo: {
            auto c = td_api::make_object<td_api::inputMessagePhoto>();
            c->photo_ = std::move(file);
            c->caption_ = std::move(caption);
            c->has_spoiler_ = media.spoiler;
            c->show_caption_above_media_ = caption_above;
            return c;
        }
        case MediaKind::Animation: {
            auto c = td_api::make_object<td_api::inputMessageAnimation>();
            c->animation_ = std::move(file);
            c->caption_ = std::move(caption);
            c->has_spoiler_ = media.spoiler;
            c->show_caption_above_media_ = caption_above;
            return c;
        }
        case MediaKind::Video: {
            auto c = td_api::make_object<td_api::inputMessageVideo>();
            c->video_ = std::move(file);
            c->caption_ = std::move(caption);
            c->has_spoiler_ = media.spoiler;
            c->show_caption_above_media_ = caption_above;
            c->supports_streaming_ = true;
            return c;
        }
        case MediaKind::VideoNote: {
            auto c = td_api::make_object<td_api::inputMessageVideoNote>();
            c->video_note_ = std::move(file);
            return c;
        }
        case MediaKind::Voice: {
            auto c = td_api::make_object<td_api::inputMessageVoiceNote>();
            c->voice_note_ = std::move(file);
            c->caption_ = std::move(caption);
            return c;
        }
        case MediaKind::Audio: {
            auto c = td_api::make_object<td_api::inputMessageAudio>();
            c->audio_ = std::move(file);
            c->caption_ = std::move(caption);
            return c;
        }
        case MediaKind::Sticker: {
            auto c = td_api::make_object<td_api::inputMessageSticker>();
            c->sticker_ = std::move(file);
            return c;
        }
        case MediaKind::Document: {
            auto c = td_api::make_object<td_api::inputMessageDocument>();
            c->document_ = std::move(file);
            c->caption_ = std::move(caption);
            return c;
        }
    }
    throw BackendError(-1, "unknown media kind");
}

std::vector<NativeMessage> TdBackend::await_sent(const std::vector<int64_t>& temp_ids,
                                                 std::chrono::milliseconds timeout) {
    std::vector<std::optional<NativeMessage>> results(temp_ids.size());
    std::vector<std::pair<size_t, uint64_t>> slots;
    {
        std::lock_guard<std::mutex> lock(sends_mutex_);
        for (size_t i = 0; i < temp_ids.size(); ++i) {
            int64_t id = temp_ids[i];
            auto done = finished_early_.find(id);
            if (done != finished_early_.end()) {
                results[i] = std::move(done->second);
                finished_early_.erase(done);
                continue;
            }
            auto failed = failed_early_.find(id);
            if (failed != failed_early_.end()) {
                auto error = failed->second;
                failed_early_.erase(failed);
                for (const auto& s : slots) awaiting_.erase(temp_ids[s.first]);
                throw BackendError(error.first, error.second, parse_retry_after(error.second));
            }
            uint64_t slot = sends_.open();
            awaiting_[id] = slot;
            slots.emplace_back(i, slot);
        }
    }

    try {
        for (const auto& s : slots) results[s.first] = sends_.wait(s.second, timeout);
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(sends_mutex_);
        for (const auto& s : slots) awaiting_.erase(temp_ids[s.first]);
        throw;
    }

    std::vector<NativeMessage> out;
    out.reserve(results.size());
    for (auto& r : results) {
        if (r) out.push_back(std::move(*r));
    }
    return out;
}

std::vector<NativeMessage> TdBackend::send(const NativeSendRequest& req) {
    TempFiles temp;
    auto reply_to = [&]() -> td_api::object_ptr<td_api::InputMessageReplyTo> {
        if (req.reply_to_message_id == 0) return nullptr;
        auto r = td_api::make_object<td_api::inputMessageReplyToMessage>();
        r->message_id_ = req.reply_to_message_id;
        return r;
    };

    td_api::object_ptr<td_api::Object> answer;
    auto timeout = req.media.empty()
        ? rpc_timeout_
        : std::chrono::milliseconds(std::chrono::seconds(bridge_.media_timeout_sec)) *
              static_cast<int>(req.media.size());

    if (req.media.size() > 1) {
        auto fn = td_api::make_object<td_api::sendMessageAlbum>();
        fn->chat_id_ = req.chat_id;
        fn->reply_to_ = reply_to();
        for (size_t i = 0; i < req.media.size(); ++i) {
            auto caption = i == 0 ? formatted_text(req.text, req.entities)
                                  : td_api::make_object<td_api::formattedText>();
            fn->input_message_contents_.push_back(
                input_content(req.media[i], std::move(caption), req.caption_above_media, temp.paths));
        }
        answer = request(std::move(fn), timeout);
    } else {
        auto fn = td_api::make_object<td_api::sendMessage>();
        fn->chat_id_ = req.chat_id;
        fn->reply_to_ = reply_to();
        fn->reply_markup_ = reply_markup(req.keyboard);
        if (req.location) {
            auto location = td_api::make_object<td_api::location>();
            location->latitude_ = req.location->latitude;
            location->longitude_ = req.location->longitude;
            auto c = td_api::make_object<td_api::inputMessageLocation>();
            c->location_ = std::move(location);
            fn->input_message_content_ = std::move(c);
        } else if (req.media.size() == 1) {
            fn->input_message_content_ = input_content(req.media.front(),
                                                       formatted_text(req.text, req.entities),
                                                       req.caption_above_media, temp.paths);
        } else {
            auto c = td_api::make_object<td_api::inputMessageText>();
            c->text_ = formatted_text(req.text, req.entities);
            fn->input_message_content_ = std::move(c);
        }
        answer = request(std::move(fn), timeout);
    }

    std::vector<const td_api::message*> sent;
    if (answer && answer->get_id() == td_api::message::ID) {
        sent.push_back(static_cast<const td_api::message*>(answer.get()));
    } else if (answer && answer->get_id() == td_api::messages::ID) {
        for (const auto& m : static_cast<const td_api::messages&>(*answer).messages_) {
            if (m) sent.push_back(m.get());
        }
    } else {
        throw BackendError(-1, "unexpected TDLib answer type");
    }

    std::vector<int64_t> pending_ids;
    std::vector<NativeMessage> out;
    for (const auto* m : sent) {
        if (m->sending_state_) {
            pending_ids.push_back(m->id_);
        } else {
            out.push_back(convert_message(*m));
        }
    }
    if (!pending_ids.empty()) {
        auto confirmed = await_sent(pending_ids, timeout);
        out.insert(out.end(), confirmed.begin(), confirmed.end());
    }
    return out;
}

void TdBackend::edit_message(int64_t chat_id, int64_t message_id, const std::string& text,
                             const std::vector<NativeEntity>& entities,
                             const NativeKeyboard& keyboard) {
    auto get = td_api::make_object<td_api::getMessage>();
    get->chat_id_ = chat_id;
    get->message_id_ = message_id;
    auto current = call<td_api::message>(std::move(get));

    if (current->content_ && current->content_->get_id() == td_api::messageText::ID) {
        auto c = td_api::make_object<td_api::inputMessageText>();
        c->text_ = formatted_text(text, entities);
        auto fn = td_api::make_object<td_api::editMessageText>();
        fn->chat_id_ = chat_id;
        fn->message_id_ = message_id;
        fn->reply_markup_ = reply_markup(keyboard);
        fn->input_message_content_ = std::move(c);
        request(std::move(fn));
    } else {
        auto fn = td_api::make_object<td_api::editMessageCaption>();
        fn->chat_id_ = chat_id;
        fn->message_id_ = message_id;
        fn->reply_markup_ = reply_markup(keyboard);
        fn->caption_ = formatted_text(text, entities);
        request(std::move(fn));
    }
}

void TdBackend::delete_messages(int64_t chat_id, const std::vector<int64_t>& message_ids) {
    auto fn = td_api::make_object<td_api::deleteMessages>();
    fn->chat_id_ = chat_id;
    fn->message_ids_ = message_ids;
    fn->revoke_ = true;
    request(std::move(fn));
}

void TdBackend::answer_callback(const std::string& callback_id) {
    auto fn = td_api::make_object<td_api::answerCallbackQuery>();
    try {
        fn->callback_query_id_ = std::stoll(callback_id);
    } catch (const std::exception&) {
        throw BridgeError(ErrorKind::InvalidReference, "invalid callback id '" + callback_id + "'");
    }
    request(std::move(fn));
}

} // namespace mtsatori
