#pragma once
#include "backend.hpp"
#include "event_stream.hpp"
#include <memory>
#include <vector>

namespace mtsatori {

inline NativeUser make_native_user(int64_t id, const std::string& first,
                                   const std::string& username = {}) {
    NativeUser u;
    u.id = id;
    u.first_name = first;
    u.username = username;
    return u;
}

inline NativeChat make_native_chat(int64_t id, ChatKind kind, const std::string& title) {
    NativeChat c;
    c.id = id;
    c.kind = kind;
    c.title = title;
    return c;
}

inline NativeMessage make_native_message(const NativeChat& chat, int64_t id,
                                         const NativeUser& sender, const std::string& text) {
    NativeMessage m;
    m.chat_id = chat.id;
    m.id = id;
    m.chat = chat;
    m.sender = sender;
    m.date = 1700000000;
    m.text = text;
    return m;
}

inline NativeUpdate new_message_update(const NativeMessage& m) {
    NativeUpdate u;
    u.kind = UpdateKind::NewMessage;
    u.update_id = "msg:" + std::to_string(m.chat_id) + ":" + std::to_string(m.id);
    u.chat_id = m.chat_id;
    u.message_id = m.id;
    u.message = m;
    u.date = m.date;
    return u;
}

inline NativeUpdate control_update(UpdateKind kind) {
    NativeUpdate u;
    u.kind = kind;
    return u;
}

class RecordingSink : public EventSink {
public:
    std::vector<GatewayEvent> events;
    void on_event(const GatewayEvent& event) override { events.push_back(event); }
};

} // namespace mtsatori
