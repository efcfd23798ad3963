#pragma once
#include "errors.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <chrono>
#include <cstdint>

namespace mtsatori {

// ── Native data model ───────────────────────────────────────────
// Backend-side view of users, chats and messages. Field names follow the
// messaging backend; ids are raw backend identifiers and never leave the
// bridge without going through the identifier mapper.

enum class ChatKind { Private, Group, Supergroup, Channel, Secret };

struct NativeUser {
    int64_t id = 0;
    std::string username;
    std::string first_name;
    std::string last_name;
    std::string photo_file_id;
    bool is_bot = false;

    std::string display_name() const;
};

struct NativeChat {
    int64_t id = 0;
    ChatKind kind = ChatKind::Private;
    std::string title;
    std::string photo_file_id;

    bool is_direct() const { return kind == ChatKind::Private || kind == ChatKind::Secret; }
};

struct NativeMember {
    NativeUser user;
    std::string status;      // creator, administrator, member, restricted, left, banned
    std::string custom_title;
    int64_t joined_at = 0;   // epoch seconds, 0 if unknown
};

enum class EntityKind {
    Bold,
    Italic,
    Underline,
    Strikethrough,
    Spoiler,
    Code,
    Pre,
    TextUrl,
    Mention,      // "@username" in the text
    TextMention,  // link to a user without a username
};

struct NativeEntity {
    EntityKind kind = EntityKind::Bold;
    size_t offset = 0;   // UTF-16 units
    size_t length = 0;   // UTF-16 units
    std::string url;     // TextUrl
    int64_t user_id = 0; // TextMention
    std::string language;

    bool operator==(const NativeEntity& o) const {
        return kind == o.kind && offset == o.offset && length == o.length &&
               url == o.url && user_id == o.user_id && language == o.language;
    }
};

enum class MediaKind { Photo, Sticker, Animation, Video, VideoNote, Voice, Audio, Document };

struct NativeMedia {
    MediaKind kind = MediaKind::Photo;
    std::string file_id;
    std::string file_name;
    std::string mime;
    bool spoiler = false;
};

struct NativeButton {
    std::string text;
    std::string callback_data;
    std::string url;
    std::string switch_query;
};

using NativeKeyboard = std::vector<std::vector<NativeButton>>;

struct NativeLocation {
    double latitude = 0.0;
    double longitude = 0.0;
};

struct NativeMessage {
    int64_t chat_id = 0;
    int64_t id = 0;
    NativeChat chat;
    std::optional<NativeUser> sender;
    int64_t sender_chat_id = 0;   // anonymous admins / channel posts
    int64_t date = 0;             // epoch seconds
    int64_t edit_date = 0;
    std::string text;             // text or caption
    std::vector<NativeEntity> entities;
    std::optional<NativeMedia> media;
    bool caption_above_media = false;
    std::optional<NativeLocation> location;
    int64_t reply_to_message_id = 0;
    std::shared_ptr<const NativeMessage> reply_to;   // the replied message, when known
    std::string forward_origin;   // display name of the original sender
    NativeKeyboard keyboard;
    bool outgoing = false;
};

// ── Update stream ───────────────────────────────────────────────

enum class UpdateKind {
    NewMessage,
    EditedMessage,
    DeletedMessage,
    MemberJoined,
    MemberLeft,
    ReactionAdded,
    ReactionRemoved,
    CallbackQuery,
    Checkpoint,            // backend started delivering its catch-up sequence
    BacklogDrained,        // catch-up finished, stream is live
    ConnectionLost,
    AuthorizationRevoked,
    Unknown,
};

const char* update_kind_name(UpdateKind kind);

struct NativeUpdate {
    std::string update_id;          // stable per native update, used for de-duplication
    UpdateKind kind = UpdateKind::Unknown;
    std::optional<NativeMessage> message;
    int64_t chat_id = 0;
    int64_t message_id = 0;
    std::optional<NativeChat> chat;
    std::optional<NativeUser> user;
    std::string reaction;           // emoji
    std::string callback_id;
    std::string callback_data;
    int64_t date = 0;
    std::string raw_type;           // native type name, for logs
};

// ── Outgoing requests ───────────────────────────────────────────

struct InputFile {
    enum class Source {
        RemoteId,  // file already stored by the backend; re-send without upload
        Url,       // must be fetched and uploaded
        Path,      // local file
        Bytes,     // in-memory content
    };
    Source source = Source::Url;
    std::string value;  // file id, url, path or raw bytes
    std::string name;
    std::string mime;
};

struct OutgoingMedia {
    MediaKind kind = MediaKind::Document;
    InputFile file;
    bool spoiler = false;
};

// One native send. Several media form an album; the text becomes the
// caption of the first item.
struct NativeSendRequest {
    int64_t chat_id = 0;
    int64_t reply_to_message_id = 0;
    std::string text;
    std::vector<NativeEntity> entities;
    std::vector<OutgoingMedia> media;
    bool caption_above_media = false;
    std::optional<NativeLocation> location;
    NativeKeyboard keyboard;
};

template<typename T>
struct Page {
    std::vector<T> items;
    std::string next;   // opaque cursor, empty on the last page
};

// ── Backend interface ───────────────────────────────────────────
// Native RPC surface of the messaging backend. Every call may throw
// BackendError (native failure) or BridgeError(SessionTerminated) once the
// connection is shut down. Implementations must bound each call by a
// timeout.

class Backend {
public:
    virtual ~Backend() = default;

    virtual NativeUser get_me() = 0;
    virtual NativeUser get_user(int64_t user_id) = 0;
    virtual NativeChat get_chat(int64_t chat_id) = 0;
    virtual NativeChat create_private_chat(int64_t user_id) = 0;
    virtual Page<NativeChat> get_chats(const std::string& cursor, int limit) = 0;
    virtual NativeMember get_chat_member(int64_t chat_id, int64_t user_id) = 0;
    virtual Page<NativeMember> get_chat_members(int64_t chat_id, const std::string& cursor,
                                                int limit) = 0;
    virtual NativeMessage get_message(int64_t chat_id, int64_t message_id) = 0;
    virtual Page<NativeMessage> get_history(int64_t chat_id, const std::string& cursor,
                                            int limit) = 0;

    // Returns the native messages produced, in order.
    virtual std::vector<NativeMessage> send(const NativeSendRequest& request) = 0;
    virtual void edit_message(int64_t chat_id, int64_t message_id, const std::string& text,
                              const std::vector<NativeEntity>& entities,
                              const NativeKeyboard& keyboard) = 0;
    virtual void delete_messages(int64_t chat_id, const std::vector<int64_t>& message_ids) = 0;

    virtual std::string download_file(const std::string& file_id) = 0;
    virtual void answer_callback(const std::string& callback_id) = 0;

    // Wait up to timeout for the next batch of updates (possibly empty).
    virtual std::vector<NativeUpdate> poll_updates(std::chrono::milliseconds timeout) = 0;

    // Fail every in-flight RPC with kind and refuse new ones.
    virtual void fail_pending(ErrorKind kind, const std::string& reason) = 0;
};

} // namespace mtsatori
