#include <catch2/catch_test_macros.hpp>
#include "normalizer.hpp"
#include "fixtures.hpp"

using namespace mtsatori;

namespace {

struct Harness {
    EventBus bus;
    EventStream stream;
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    EventNormalizer normalizer{stream, bus, 16};
    NativeUser self = make_native_user(1, "Self");
    NativeUser alice = make_native_user(2, "Alice", "alice");
    NativeChat group = make_native_chat(-100, ChatKind::Supergroup, "Group");

    Harness() { stream.add_sink(sink); }

    void go_live() {
        normalizer.on_login(self);
        normalizer.process(control_update(UpdateKind::Checkpoint));
        normalizer.process(control_update(UpdateKind::BacklogDrained));
    }
};

} // namespace

// ── RecentSet ────────────────────────────────────────────────────

TEST_CASE("RecentSet: rejects keys already present", "[normalizer]") {
    RecentSet set(4);
    REQUIRE(set.insert("a"));
    REQUIRE_FALSE(set.insert("a"));
    REQUIRE(set.size() == 1);
}

TEST_CASE("RecentSet: evicts oldest once full", "[normalizer]") {
    RecentSet set(2);
    set.insert("a");
    set.insert("b");
    set.insert("c");
    REQUIRE_FALSE(set.contains("a"));
    REQUIRE(set.contains("b"));
    REQUIRE(set.contains("c"));
    REQUIRE(set.insert("a"));
}

// ── State machine ────────────────────────────────────────────────

TEST_CASE("EventNormalizer: login, checkpoint and drain reach Live", "[normalizer]") {
    Harness h;
    std::vector<std::string> seen;
    subscribe<NormalizerStateChangedEvent>(h.bus, [&](const NormalizerStateChangedEvent& ev) {
        seen.push_back(ev.to);
    });

    REQUIRE(h.normalizer.state() == NormalizerState::Disconnected);
    h.go_live();
    REQUIRE(h.normalizer.state() == NormalizerState::Live);
    REQUIRE(seen == std::vector<std::string>{"Connecting", "Syncing", "Live"});
    REQUIRE(h.normalizer.self_id() == 1);
}

TEST_CASE("EventNormalizer: drain without checkpoint still goes Live", "[normalizer]") {
    Harness h;
    h.normalizer.on_login(h.self);
    h.normalizer.process(control_update(UpdateKind::BacklogDrained));
    REQUIRE(h.normalizer.state() == NormalizerState::Live);
}

TEST_CASE("EventNormalizer: connection loss disconnects", "[normalizer]") {
    Harness h;
    h.go_live();
    h.normalizer.process(control_update(UpdateKind::ConnectionLost));
    REQUIRE(h.normalizer.state() == NormalizerState::Disconnected);
    REQUIRE(h.sink->events.empty());
}

// ── Events ───────────────────────────────────────────────────────

TEST_CASE("EventNormalizer: new message becomes message-created", "[normalizer]") {
    Harness h;
    h.go_live();
    auto msg = make_native_message(h.group, 55, h.alice, "hello");
    uint64_t id = h.normalizer.process(new_message_update(msg));

    REQUIRE(id == 1);
    REQUIRE(h.sink->events.size() == 1);
    const auto& ev = h.sink->events[0];
    REQUIRE(ev.type == event_types::MessageCreated);
    REQUIRE(ev.self_id == "user:1");
    REQUIRE(ev.timestamp == 1700000000000);
    REQUIRE(ev.message->id == "message:55");
    REQUIRE(ev.message->content == "hello");
    REQUIRE(ev.channel->id == "channel:-100");
    REQUIRE(ev.guild->id == "chat:-100");
    REQUIRE(ev.user->id == "user:2");
    REQUIRE(ev.member.has_value());
}

TEST_CASE("EventNormalizer: private chat has no guild", "[normalizer]") {
    Harness h;
    h.go_live();
    auto dm = make_native_chat(2, ChatKind::Private, "Alice");
    h.normalizer.process(new_message_update(make_native_message(dm, 1, h.alice, "hi")));
    const auto& ev = h.sink->events.at(0);
    REQUIRE(ev.channel->type == ChannelType::Direct);
    REQUIRE_FALSE(ev.guild.has_value());
    REQUIRE_FALSE(ev.member.has_value());
}

TEST_CASE("EventNormalizer: messages during Syncing are emitted", "[normalizer]") {
    Harness h;
    h.normalizer.on_login(h.self);
    h.normalizer.process(control_update(UpdateKind::Checkpoint));
    REQUIRE(h.normalizer.state() == NormalizerState::Syncing);
    h.normalizer.process(new_message_update(make_native_message(h.group, 1, h.alice, "x")));
    REQUIRE(h.sink->events.size() == 1);
}

TEST_CASE("EventNormalizer: duplicate update id emits once", "[normalizer]") {
    Harness h;
    h.go_live();
    std::vector<std::string> reasons;
    subscribe<UpdateDroppedEvent>(h.bus, [&](const UpdateDroppedEvent& ev) {
        reasons.push_back(ev.reason);
    });

    auto update = new_message_update(make_native_message(h.group, 9, h.alice, "once"));
    REQUIRE(h.normalizer.process(update) != 0);
    REQUIRE(h.normalizer.process(update) == 0);
    REQUIRE(h.sink->events.size() == 1);
    REQUIRE(reasons == std::vector<std::string>{"duplicate"});
}

TEST_CASE("EventNormalizer: replay after reconnect is not re-emitted", "[normalizer]") {
    Harness h;
    h.go_live();
    auto update = new_message_update(make_native_message(h.group, 9, h.alice, "once"));
    h.normalizer.process(update);

    h.normalizer.on_disconnect();
    h.go_live();
    REQUIRE(h.normalizer.process(update) == 0);
    REQUIRE(h.sink->events.size() == 1);
}

TEST_CASE("EventNormalizer: updates while disconnected are dropped", "[normalizer]") {
    Harness h;
    auto update = new_message_update(make_native_message(h.group, 3, h.alice, "early"));
    REQUIRE(h.normalizer.process(update) == 0);
    REQUIRE(h.sink->events.empty());
    REQUIRE(h.normalizer.seen_count() == 0);

    // The replay after connecting still gets through
    h.go_live();
    REQUIRE(h.normalizer.process(update) != 0);
}

TEST_CASE("EventNormalizer: ids are gapless across dropped updates", "[normalizer]") {
    Harness h;
    h.go_live();
    auto first = new_message_update(make_native_message(h.group, 1, h.alice, "a"));
    NativeUpdate malformed;
    malformed.kind = UpdateKind::NewMessage;
    malformed.update_id = "msg:broken";
    NativeUpdate unknown;
    unknown.kind = UpdateKind::Unknown;
    unknown.update_id = "unknown:1";
    auto second = new_message_update(make_native_message(h.group, 2, h.alice, "b"));

    REQUIRE(h.normalizer.process(first) == 1);
    REQUIRE(h.normalizer.process(malformed) == 0);
    REQUIRE(h.normalizer.process(unknown) == 0);
    REQUIRE(h.normalizer.process(second) == 2);
}

TEST_CASE("EventNormalizer: malformed updates are reported, not thrown", "[normalizer]") {
    Harness h;
    h.go_live();
    std::vector<std::string> reasons;
    subscribe<UpdateDroppedEvent>(h.bus, [&](const UpdateDroppedEvent& ev) {
        reasons.push_back(ev.reason);
    });

    NativeUpdate deletion;
    deletion.kind = UpdateKind::DeletedMessage;
    deletion.update_id = "del:x";
    REQUIRE_NOTHROW(h.normalizer.process(deletion));
    REQUIRE(reasons == std::vector<std::string>{"malformed"});
}

TEST_CASE("EventNormalizer: deletion names channel and message", "[normalizer]") {
    Harness h;
    h.go_live();
    NativeUpdate u;
    u.kind = UpdateKind::DeletedMessage;
    u.update_id = "del:-100:8";
    u.chat_id = -100;
    u.message_id = 8;
    h.normalizer.process(u);
    const auto& ev = h.sink->events.at(0);
    REQUIRE(ev.type == event_types::MessageDeleted);
    REQUIRE(ev.message->id == "message:8");
    REQUIRE(ev.channel->id == "channel:-100");
}

TEST_CASE("EventNormalizer: member join carries guild and member", "[normalizer]") {
    Harness h;
    h.go_live();
    NativeUpdate u;
    u.kind = UpdateKind::MemberJoined;
    u.update_id = "join:1";
    u.chat = h.group;
    u.chat_id = h.group.id;
    u.user = h.alice;
    u.date = 1700000100;
    h.normalizer.process(u);
    const auto& ev = h.sink->events.at(0);
    REQUIRE(ev.type == event_types::GuildMemberAdded);
    REQUIRE(ev.guild->id == "chat:-100");
    REQUIRE(ev.member->joined_at == 1700000100000);
    REQUIRE(ev.user->name == "alice");
}

TEST_CASE("EventNormalizer: reactions carry the emoji", "[normalizer]") {
    Harness h;
    h.go_live();
    NativeUpdate u;
    u.kind = UpdateKind::ReactionRemoved;
    u.update_id = "react-:-100:4:x";
    u.chat_id = -100;
    u.message_id = 4;
    u.reaction = "\xF0\x9F\x91\x8D";
    h.normalizer.process(u);
    const auto& ev = h.sink->events.at(0);
    REQUIRE(ev.type == event_types::ReactionRemoved);
    REQUIRE(ev.emoji == "\xF0\x9F\x91\x8D");
    REQUIRE(ev.message->id == "message:4");
}

TEST_CASE("EventNormalizer: button press names the pressing user", "[normalizer]") {
    Harness h;
    h.go_live();
    auto carrier = make_native_message(h.group, 12, h.self, "pick one");
    NativeUpdate u;
    u.kind = UpdateKind::CallbackQuery;
    u.update_id = "cb:77";
    u.callback_id = "77";
    u.callback_data = "yes";
    u.message = carrier;
    u.user = h.alice;
    h.normalizer.process(u);
    const auto& ev = h.sink->events.at(0);
    REQUIRE(ev.type == event_types::InteractionButton);
    REQUIRE(ev.button_id == "yes");
    REQUIRE(ev.user->id == "user:2");
    REQUIRE(ev.message->user->id == "user:1");
}

TEST_CASE("EventNormalizer: stop drops everything afterwards", "[normalizer]") {
    Harness h;
    h.go_live();
    h.normalizer.stop();
    h.normalizer.process(new_message_update(make_native_message(h.group, 1, h.alice, "late")));
    REQUIRE(h.sink->events.empty());
}

TEST_CASE("EventNormalizer: convert has no side effects", "[normalizer]") {
    Harness h;
    h.go_live();
    auto update = new_message_update(make_native_message(h.group, 1, h.alice, "x"));
    REQUIRE(h.normalizer.convert(update).has_value());
    REQUIRE_FALSE(h.normalizer.convert(control_update(UpdateKind::BacklogDrained)).has_value());
    REQUIRE(h.sink->events.empty());
    REQUIRE(h.normalizer.seen_count() == 0);
}
