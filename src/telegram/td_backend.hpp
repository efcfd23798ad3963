#pragma once
#include "backend.hpp"
#include "config.hpp"
#include "pending.hpp"

#include <td/telegram/Client.h>
#include <td/telegram/td_api.h>
#include <td/telegram/td_api.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mtsatori {

namespace td_api = td::td_api;

enum class AuthState {
    Unknown,
    WaitParameters,
    WaitPhoneNumber,
    WaitCode,
    WaitPassword,
    WaitOther,       // registration, email, QR confirmation
    Ready,
    LoggingOut,
    Closing,
    Closed,
};

const char* auth_state_name(AuthState state);

// Backend over one TDLib client instance.
//
// A receive thread drains td::ClientManager: responses resolve the pending
// request table, cache updates (users, chats) are applied in place and
// everything that becomes a gateway event is converted and queued for
// poll_updates(). Outgoing messages are only reported once TDLib confirms
// the server-assigned id.
class TdBackend : public Backend {
public:
    TdBackend(const AccountConfig& account, const BridgeConfig& bridge, int tdlib_verbosity = 1);
    ~TdBackend() override;

    TdBackend(const TdBackend&) = delete;
    TdBackend& operator=(const TdBackend&) = delete;

    // Create the client and start the receive thread.
    void start();

    // Send a request and wait for its answer. td_api::error answers are
    // thrown as BackendError.
    td_api::object_ptr<td_api::Object> request(td_api::object_ptr<td_api::Function> function,
                                               std::chrono::milliseconds timeout);
    td_api::object_ptr<td_api::Object> request(td_api::object_ptr<td_api::Function> function);

    template<typename T>
    td_api::object_ptr<T> call(td_api::object_ptr<td_api::Function> function) {
        auto result = request(std::move(function));
        if (!result || result->get_id() != T::ID) {
            throw BackendError(-1, "unexpected TDLib answer type");
        }
        return td::move_tl_object_as<T>(result);
    }

    AuthState auth_state() const;

    // Wait until the authorization state differs from seen; returns the
    // current state (possibly still seen on timeout).
    AuthState wait_auth_change(AuthState seen, std::chrono::milliseconds timeout);

    // Log the account out and wait for TDLib to close.
    void log_out();

    // Wait until TDLib reports a ready connection. False on timeout.
    bool wait_connected(std::chrono::milliseconds timeout);

    // ── Backend ─────────────────────────────────────────────────
    NativeUser get_me() override;
    NativeUser get_user(int64_t user_id) override;
    NativeChat get_chat(int64_t chat_id) override;
    NativeChat create_private_chat(int64_t user_id) override;
    Page<NativeChat> get_chats(const std::string& cursor, int limit) override;
    NativeMember get_chat_member(int64_t chat_id, int64_t user_id) override;
    Page<NativeMember> get_chat_members(int64_t chat_id, const std::string& cursor,
                                        int limit) override;
    NativeMessage get_message(int64_t chat_id, int64_t message_id) override;
    Page<NativeMessage> get_history(int64_t chat_id, const std::string& cursor,
                                    int limit) override;
    std::vector<NativeMessage> send(const NativeSendRequest& request) override;
    void edit_message(int64_t chat_id, int64_t message_id, const std::string& text,
                      const std::vector<NativeEntity>& entities,
                      const NativeKeyboard& keyboard) override;
    void delete_messages(int64_t chat_id, const std::vector<int64_t>& message_ids) override;
    std::string download_file(const std::string& file_id) override;
    void answer_callback(const std::string& callback_id) override;
    std::vector<NativeUpdate> poll_updates(std::chrono::milliseconds timeout) override;
    void fail_pending(ErrorKind kind, const std::string& reason) override;

private:
    // Chat plus the ids TDLib needs to list its members.
    struct ChatInfo {
        NativeChat chat;
        int64_t group_id = 0;         // basic group or supergroup id
        int64_t private_user_id = 0;  // peer of a private or secret chat
    };

    struct QueuedUpdate {
        NativeUpdate update;
        bool needs_message = false;   // fetch chat_id/message_id before delivery
    };

    void receive_loop();
    void handle_update(td_api::object_ptr<td_api::Object> object);
    void on_auth_state(const td_api::AuthorizationState& state);
    void on_connection_state(const td_api::ConnectionState& state);
    void on_new_message(const td_api::message& message);
    void on_send_finished(int64_t old_id, NativeMessage* sent, const td_api::error* error);
    void on_reaction(const td_api::updateMessageReaction& update);
    void enqueue(NativeUpdate update, bool needs_message = false);

    NativeUser convert_user(const td_api::user& user) const;
    ChatInfo convert_chat(const td_api::chat& chat) const;
    NativeMessage convert_message(const td_api::message& message) const;
    NativeMessage translate_message(const td_api::message& message) const;
    NativeMember convert_member(const td_api::chatMember& member);
    NativeUser cached_user(int64_t user_id) const;
    ChatInfo chat_info(int64_t chat_id);

    td_api::object_ptr<td_api::InputMessageContent> input_content(
        const OutgoingMedia& media, td_api::object_ptr<td_api::formattedText> caption,
        bool caption_above, std::vector<std::string>& temp_files) const;
    td_api::object_ptr<td_api::InputFile> input_file(const InputFile& file,
                                                     std::vector<std::string>& temp_files) const;
    std::vector<NativeMessage> await_sent(const std::vector<int64_t>& temp_ids,
                                          std::chrono::milliseconds timeout);

    AccountConfig account_;
    BridgeConfig bridge_;
    int tdlib_verbosity_;
    std::chrono::milliseconds rpc_timeout_;

    int32_t client_id_ = 0;
    std::atomic<bool> running_{false};
    std::thread receive_thread_;
    std::atomic<uint64_t> next_untracked_{1};   // fire-and-forget requests
    PendingTable<td_api::object_ptr<td_api::Object>> pending_;

    // Outgoing messages waiting for their final id, keyed by temporary id.
    std::mutex sends_mutex_;
    PendingTable<NativeMessage> sends_;
    std::unordered_map<int64_t, uint64_t> awaiting_;
    std::unordered_map<int64_t, NativeMessage> finished_early_;
    std::unordered_map<int64_t, std::pair<int, std::string>> failed_early_;

    mutable std::mutex auth_mutex_;
    std::condition_variable auth_cv_;
    AuthState auth_state_ = AuthState::Unknown;
    bool closing_requested_ = false;

    mutable std::mutex cache_mutex_;
    std::unordered_map<int64_t, NativeUser> users_;
    std::unordered_map<int64_t, ChatInfo> chats_;
    mutable std::map<std::pair<int64_t, int64_t>, std::shared_ptr<const NativeMessage>> recent_;
    mutable std::deque<std::pair<int64_t, int64_t>> recent_order_;
    int64_t self_id_ = 0;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<QueuedUpdate> queue_;
    std::condition_variable connected_cv_;
    bool connected_ = false;          // seen connectionStateReady since the last loss
};

} // namespace mtsatori
