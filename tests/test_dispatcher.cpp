#include <catch2/catch_test_macros.hpp>
#include "dispatcher.hpp"
#include "fake_login_driver.hpp"
#include "fixtures.hpp"
#include "mock_http_client.hpp"

using namespace mtsatori;

namespace {

BridgeConfig test_bridge_config() {
    BridgeConfig config;
    config.read_attempts = 3;
    config.backoff_base_ms = 100;
    config.backoff_max_ms = 1000;
    return config;
}

struct DispatcherHarness {
    EventBus bus;
    EventStream stream;
    EventNormalizer normalizer{stream, bus, 16};
    FakeLoginDriver driver;
    SessionController session{driver, normalizer, bus};
    MockHttpClient http;
    MediaFetcher media{http, 1024, 5};
    BridgeConfig config = test_bridge_config();
    std::vector<long> sleeps;
    ActionDispatcher dispatcher{session, media, config,
        [this](std::chrono::milliseconds d) { sleeps.push_back(static_cast<long>(d.count())); }};

    NativeChat group = make_native_chat(-100, ChatKind::Supergroup, "Group");
    NativeChat direct = make_native_chat(2, ChatKind::Private, "Alice");
    NativeUser alice = make_native_user(2, "Alice", "alice");

    DispatcherHarness() {
        backend().users[alice.id] = alice;
        backend().chats[group.id] = group;
        backend().chats[direct.id] = direct;
        session.start();
    }

    MockBackend& backend() { return *driver.backend; }
};

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const BridgeError& e) {
        return e.kind();
    }
    FAIL("expected BridgeError");
    return ErrorKind::InternalError;
}

} // namespace

TEST_CASE("login_status_for: session states", "[dispatcher]") {
    REQUIRE(login_status_for(SessionState::Authenticated) == LoginStatus::Online);
    REQUIRE(login_status_for(SessionState::Authenticating) == LoginStatus::Connect);
    REQUIRE(login_status_for(SessionState::Unauthenticated) == LoginStatus::Offline);
    REQUIRE(login_status_for(SessionState::Terminated) == LoginStatus::Offline);
}

// ── Reference checks ─────────────────────────────────────────────

TEST_CASE("ActionDispatcher: wrong scope is rejected before any call", "[dispatcher]") {
    DispatcherHarness h;
    REQUIRE(kind_of([&] { h.dispatcher.user_get("chat:2"); }) == ErrorKind::InvalidReference);
    REQUIRE(kind_of([&] { h.dispatcher.channel_get("user:2"); }) == ErrorKind::InvalidReference);
    REQUIRE(kind_of([&] { h.dispatcher.message_create("chat:-100", "hi"); }) ==
            ErrorKind::InvalidReference);
    REQUIRE(kind_of([&] { h.dispatcher.message_get("channel:-100", "channel:5"); }) ==
            ErrorKind::InvalidReference);
    REQUIRE(h.backend().calls.empty());
}

TEST_CASE("ActionDispatcher: malformed id is rejected", "[dispatcher]") {
    DispatcherHarness h;
    REQUIRE(kind_of([&] { h.dispatcher.user_get("user:02"); }) == ErrorKind::InvalidReference);
    REQUIRE(kind_of([&] { h.dispatcher.guild_get("garbage"); }) == ErrorKind::InvalidReference);
    REQUIRE(h.backend().calls.empty());
}

// ── Reads ────────────────────────────────────────────────────────

TEST_CASE("ActionDispatcher: user_get maps the user", "[dispatcher]") {
    DispatcherHarness h;
    auto user = h.dispatcher.user_get("user:2");
    REQUIRE(user.id == "user:2");
    REQUIRE(user.name == "alice");
    REQUIRE(user.nick == "Alice");
}

TEST_CASE("ActionDispatcher: unknown user is NotFound without retry", "[dispatcher]") {
    DispatcherHarness h;
    REQUIRE(kind_of([&] { h.dispatcher.user_get("user:99"); }) == ErrorKind::NotFound);
    REQUIRE(h.backend().count("get_user") == 1);
    REQUIRE(h.sleeps.empty());
}

TEST_CASE("ActionDispatcher: rate-limited read backs off and retries", "[dispatcher]") {
    DispatcherHarness h;
    h.backend().fail_next("get_user", BackendError(429, "Too Many Requests"));
    h.backend().fail_next("get_user", BackendError(429, "Too Many Requests"));

    auto user = h.dispatcher.user_get("user:2");
    REQUIRE(user.id == "user:2");
    REQUIRE(h.backend().count("get_user") == 3);
    REQUIRE(h.sleeps == std::vector<long>{100, 200});
}

TEST_CASE("ActionDispatcher: retry waits at least the advertised delay", "[dispatcher]") {
    DispatcherHarness h;
    h.backend().fail_next("get_chat", BackendError(429, "Too Many Requests: retry after 1"));

    auto channel = h.dispatcher.channel_get("channel:-100");
    REQUIRE(channel.name == "Group");
    REQUIRE(h.sleeps == std::vector<long>{1000});
}

TEST_CASE("ActionDispatcher: long flood wait fails fast", "[dispatcher]") {
    DispatcherHarness h;
    h.backend().fail_next("get_chat", BackendError(420, "FLOOD_WAIT_30"));

    REQUIRE(kind_of([&] { h.dispatcher.channel_get("channel:-100"); }) ==
            ErrorKind::RateLimited);
    REQUIRE(h.backend().count("get_chat") == 1);
    REQUIRE(h.sleeps.empty());
}

TEST_CASE("ActionDispatcher: exhausted transient failures surface as internal", "[dispatcher]") {
    DispatcherHarness h;
    for (int i = 0; i < 3; i++) h.backend().fail_next("get_user", BackendError(500, "Timeout"));

    REQUIRE(kind_of([&] { h.dispatcher.user_get("user:2"); }) == ErrorKind::InternalError);
    REQUIRE(h.backend().count("get_user") == 3);
    REQUIRE(h.sleeps.size() == 2);
}

TEST_CASE("ActionDispatcher: read while reconnecting is retried", "[dispatcher]") {
    DispatcherHarness h;
    h.driver.resume_outcomes.push_back(
        LoginOutcome::failed(LoginFailure::NetworkError, "offline"));
    h.session.on_connection_lost();
    REQUIRE(h.session.state() == SessionState::Authenticating);

    REQUIRE(kind_of([&] { h.dispatcher.user_get("user:2"); }) == ErrorKind::InternalError);
    REQUIRE(h.sleeps.size() == 2);
    REQUIRE(h.backend().count("get_user") == 0);
}

TEST_CASE("ActionDispatcher: calls after termination fail", "[dispatcher]") {
    DispatcherHarness h;
    h.session.shutdown("test");
    REQUIRE(kind_of([&] { h.dispatcher.user_get("user:2"); }) == ErrorKind::SessionTerminated);
    REQUIRE(kind_of([&] { h.dispatcher.message_create("channel:-100", "hi"); }) ==
            ErrorKind::SessionTerminated);
    REQUIRE(h.sleeps.empty());
}

TEST_CASE("ActionDispatcher: guild_list skips direct chats", "[dispatcher]") {
    DispatcherHarness h;
    h.backend().chats[-200] = make_native_chat(-200, ChatKind::Group, "Small");

    auto page = h.dispatcher.guild_list("");
    REQUIRE(page.items.size() == 2);
    for (const auto& g : page.items) REQUIRE(g.id.rfind("chat:-", 0) == 0);
    REQUIRE(page.next.empty());
}

TEST_CASE("ActionDispatcher: guild_get on a direct chat is NotFound", "[dispatcher]") {
    DispatcherHarness h;
    REQUIRE(h.dispatcher.guild_get("chat:-100").name == "Group");
    REQUIRE(kind_of([&] { h.dispatcher.guild_get("chat:2"); }) == ErrorKind::NotFound);
}

TEST_CASE("ActionDispatcher: channel_list has the chat as only channel", "[dispatcher]") {
    DispatcherHarness h;
    auto page = h.dispatcher.channel_list("chat:-100", "");
    REQUIRE(page.items.size() == 1);
    REQUIRE(page.items[0].id == "channel:-100");
    REQUIRE(page.next.empty());

    REQUIRE(h.dispatcher.channel_list("chat:-100", "more").items.empty());
    REQUIRE(kind_of([&] { h.dispatcher.channel_list("chat:2", ""); }) == ErrorKind::NotFound);
}

TEST_CASE("ActionDispatcher: guild_member_list paginates", "[dispatcher]") {
    DispatcherHarness h;
    for (int64_t i = 0; i < 60; i++) {
        NativeMember m;
        m.user = make_native_user(100 + i, "U" + std::to_string(i));
        m.status = "member";
        h.backend().members[-100].push_back(m);
    }

    auto first = h.dispatcher.guild_member_list("chat:-100", "");
    REQUIRE(first.items.size() == static_cast<size_t>(ActionDispatcher::kPageSize));
    REQUIRE_FALSE(first.next.empty());

    auto second = h.dispatcher.guild_member_list("chat:-100", first.next);
    REQUIRE(second.items.size() == 10);
    REQUIRE(second.next.empty());
    REQUIRE(second.items.back().user->id == "user:159");
}

TEST_CASE("ActionDispatcher: guild_member_get", "[dispatcher]") {
    DispatcherHarness h;
    NativeMember m;
    m.user = h.alice;
    m.custom_title = "admin";
    m.joined_at = 1600000000;
    h.backend().members[-100].push_back(m);

    auto member = h.dispatcher.guild_member_get("chat:-100", "user:2");
    REQUIRE(member.user->id == "user:2");
    REQUIRE(member.nick == "admin");
    REQUIRE(member.joined_at == 1600000000000LL);
    REQUIRE(kind_of([&] { h.dispatcher.guild_member_get("chat:-100", "user:3"); }) ==
            ErrorKind::NotFound);
}

TEST_CASE("ActionDispatcher: message_get and message_list", "[dispatcher]") {
    DispatcherHarness h;
    for (int64_t id = 1; id <= 3; id++) {
        h.backend().messages[{-100, id}] =
            make_native_message(h.group, id, h.alice, "m" + std::to_string(id));
    }

    auto msg = h.dispatcher.message_get("channel:-100", "message:2");
    REQUIRE(msg.id == "message:2");
    REQUIRE(msg.content == "m2");
    REQUIRE(msg.user->id == "user:2");
    REQUIRE(msg.created_at == 1700000000000LL);

    auto page = h.dispatcher.message_list("channel:-100", "");
    REQUIRE(page.items.size() == 3);
    REQUIRE(page.items[0].id == "message:3");
    REQUIRE(page.next.empty());

    REQUIRE(kind_of([&] { h.dispatcher.message_get("channel:-100", "message:9"); }) ==
            ErrorKind::NotFound);
}

TEST_CASE("ActionDispatcher: login_get follows the session", "[dispatcher]") {
    DispatcherHarness h;
    auto login = h.dispatcher.login_get();
    REQUIRE(login.status == LoginStatus::Online);
    REQUIRE(login.user->id == "user:1");

    h.session.shutdown("bye");
    REQUIRE(h.dispatcher.login_get().status == LoginStatus::Offline);
}

TEST_CASE("ActionDispatcher: user_channel_create returns the direct channel", "[dispatcher]") {
    DispatcherHarness h;
    auto channel = h.dispatcher.user_channel_create("user:2");
    REQUIRE(channel.id == "channel:2");
    REQUIRE(channel.type == ChannelType::Direct);
    REQUIRE(kind_of([&] { h.dispatcher.user_channel_create("user:404"); }) ==
            ErrorKind::NotFound);
}

// ── Media proxy ──────────────────────────────────────────────────

TEST_CASE("ActionDispatcher: download serves own files", "[dispatcher]") {
    DispatcherHarness h;
    h.backend().files["F1"] = std::string("\x89PNG\r\n\x1a\n", 8) + "data";

    auto media = h.dispatcher.download(internal_media_url(1, "F1"));
    REQUIRE(media.mime == "image/png");
    REQUIRE(media.name == "F1.png");
    REQUIRE(media.data.size() == 12);
}

TEST_CASE("ActionDispatcher: download refuses other accounts and foreign urls", "[dispatcher]") {
    DispatcherHarness h;
    h.backend().files["F1"] = "x";

    REQUIRE(kind_of([&] { h.dispatcher.download(internal_media_url(7, "F1")); }) ==
            ErrorKind::NotFound);
    REQUIRE(kind_of([&] { h.dispatcher.download("https://example.com/F1"); }) ==
            ErrorKind::InvalidReference);
    REQUIRE(h.backend().count("download_file") == 0);
}

TEST_CASE("ActionDispatcher: unknown file id is NotFound", "[dispatcher]") {
    DispatcherHarness h;
    REQUIRE(kind_of([&] { h.dispatcher.download(internal_media_url(1, "nope")); }) ==
            ErrorKind::NotFound);
}

// ── Writes ───────────────────────────────────────────────────────

TEST_CASE("ActionDispatcher: message_create sends text", "[dispatcher]") {
    DispatcherHarness h;
    auto result = h.dispatcher.message_create("channel:-100", "hello <b>world</b>");

    REQUIRE(result.messages.size() == 1);
    REQUIRE(result.messages[0].id == "message:1000");
    REQUIRE(result.messages[0].content == "hello <b>world</b>");
    REQUIRE(result.diagnostics.empty());
    REQUIRE(h.backend().sent.size() == 1);
    REQUIRE(h.backend().sent[0].chat_id == -100);
    REQUIRE(h.backend().sent[0].text == "hello world");
}

TEST_CASE("ActionDispatcher: long text goes out as two messages", "[dispatcher]") {
    DispatcherHarness h;
    auto result = h.dispatcher.message_create("channel:-100", std::string(5000, 'a'));

    REQUIRE(result.messages.size() == 2);
    REQUIRE(h.backend().sent.size() == 2);
    REQUIRE(h.backend().sent[0].text.size() == 4096);
    REQUIRE(h.backend().sent[1].text.size() == 904);
}

TEST_CASE("ActionDispatcher: sends are never retried", "[dispatcher]") {
    DispatcherHarness h;
    h.backend().fail_next("send", BackendError(500, "Timeout"));

    REQUIRE(kind_of([&] { h.dispatcher.message_create("channel:-100", "hi"); }) ==
            ErrorKind::InternalError);
    REQUIRE(h.backend().count("send") == 1);
    REQUIRE(h.sleeps.empty());
}

TEST_CASE("ActionDispatcher: partial send keeps delivered messages", "[dispatcher]") {
    DispatcherHarness h;
    h.backend().fail_send_at = 2;

    auto result = h.dispatcher.message_create("channel:-100", std::string(5000, 'a'));
    REQUIRE(result.messages.size() == 1);
    REQUIRE(result.messages[0].id == "message:1000");

    bool reported = false;
    for (const auto& d : result.diagnostics) {
        if (d.detail.find("part 2/2 not sent") != std::string::npos) reported = true;
    }
    REQUIRE(reported);
}

TEST_CASE("ActionDispatcher: empty content is rejected", "[dispatcher]") {
    DispatcherHarness h;
    REQUIRE(kind_of([&] { h.dispatcher.message_create("channel:-100", ""); }) ==
            ErrorKind::InvalidReference);
    REQUIRE(h.backend().count("send") == 0);
}

TEST_CASE("ActionDispatcher: data url media is uploaded as bytes", "[dispatcher]") {
    DispatcherHarness h;
    auto result = h.dispatcher.message_create(
        "channel:-100", "<img src=\"data:image/png;base64,iVBORw==\"/>look");

    REQUIRE(result.messages.size() == 1);
    const auto& req = h.backend().sent.at(0);
    REQUIRE(req.media.size() == 1);
    REQUIRE(req.media[0].file.source == InputFile::Source::Bytes);
    REQUIRE(req.media[0].file.mime == "image/png");
    REQUIRE(req.media[0].file.value == "\x89PNG");
    REQUIRE(req.text == "look");
}

TEST_CASE("ActionDispatcher: gif served with parameters goes out as animation", "[dispatcher]") {
    DispatcherHarness h;
    h.http.next_response = {200, "GIF89a", "image/gif; charset=binary"};
    auto result = h.dispatcher.message_create("channel:-100",
                                              "<img src=\"https://e.x/cat.gif\"/>");

    REQUIRE(result.messages.size() == 1);
    const auto& req = h.backend().sent.at(0);
    REQUIRE(req.media.size() == 1);
    REQUIRE(req.media[0].kind == MediaKind::Animation);
    REQUIRE(req.media[0].file.mime == "image/gif");
}

TEST_CASE("ActionDispatcher: unreachable media is dropped with a diagnostic", "[dispatcher]") {
    DispatcherHarness h;
    auto result = h.dispatcher.message_create("channel:-100",
                                              "caption<img src=\"ftp://x/y.png\"/>");

    REQUIRE(result.messages.size() == 1);
    REQUIRE(h.backend().sent.at(0).media.empty());
    REQUIRE(h.backend().sent.at(0).text == "caption");
    REQUIRE_FALSE(result.diagnostics.empty());
    REQUIRE(result.diagnostics[0].detail.find("media dropped") != std::string::npos);
}

TEST_CASE("ActionDispatcher: message_update edits text", "[dispatcher]") {
    DispatcherHarness h;
    auto diagnostics = h.dispatcher.message_update("channel:-100", "message:5", "<b>new</b>");

    REQUIRE(diagnostics.empty());
    REQUIRE(h.backend().edits.size() == 1);
    REQUIRE(h.backend().edits[0].message_id == 5);
    REQUIRE(h.backend().edits[0].text == "new");
    REQUIRE(h.backend().edits[0].entities.size() == 1);
}

TEST_CASE("ActionDispatcher: message_delete", "[dispatcher]") {
    DispatcherHarness h;
    h.dispatcher.message_delete("channel:-100", "message:7");
    REQUIRE(h.backend().deleted == std::vector<int64_t>{7});
}

TEST_CASE("ActionDispatcher: writes while reconnecting surface as internal", "[dispatcher]") {
    DispatcherHarness h;
    h.driver.resume_outcomes.push_back(
        LoginOutcome::failed(LoginFailure::NetworkError, "offline"));
    h.session.on_connection_lost();
    REQUIRE(h.session.state() == SessionState::Authenticating);

    REQUIRE(kind_of([&] { h.dispatcher.message_delete("channel:-100", "message:7"); }) ==
            ErrorKind::InternalError);
    REQUIRE(kind_of([&] { h.dispatcher.message_update("channel:-100", "message:7", "x"); }) ==
            ErrorKind::InternalError);
    REQUIRE(kind_of([&] { h.dispatcher.message_create("channel:-100", "hi"); }) ==
            ErrorKind::InternalError);
    REQUIRE(h.backend().count("delete_messages") == 0);
    REQUIRE(h.backend().count("send") == 0);
    REQUIRE(h.sleeps.empty());
}

TEST_CASE("ActionDispatcher: timed out send surfaces as internal", "[dispatcher]") {
    DispatcherHarness h;
    h.backend().send_error_bridge = BridgeError(ErrorKind::TransientTransportError,
                                                "request timed out");
    h.backend().fail_send_at = 1;
    REQUIRE(kind_of([&] { h.dispatcher.message_create("channel:-100", "hi"); }) ==
            ErrorKind::InternalError);
}

TEST_CASE("ActionDispatcher: forbidden delete is classified", "[dispatcher]") {
    DispatcherHarness h;
    h.backend().fail_next("delete_messages", BackendError(400, "MESSAGE_DELETE_FORBIDDEN"));
    REQUIRE(kind_of([&] { h.dispatcher.message_delete("channel:-100", "message:7"); }) ==
            ErrorKind::Forbidden);
    REQUIRE(h.backend().count("delete_messages") == 1);
}
