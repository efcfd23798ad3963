#include <catch2/catch_test_macros.hpp>
#include "codec.hpp"
#include "elements.hpp"
#include "fixtures.hpp"
#include "mock_backend.hpp"

using namespace mtsatori;

static NativeEntity entity(EntityKind kind, size_t offset, size_t length) {
    NativeEntity e;
    e.kind = kind;
    e.offset = offset;
    e.length = length;
    return e;
}

static bool has_diagnostic(const std::vector<Diagnostic>& ds, ErrorKind kind) {
    for (const auto& d : ds) {
        if (d.kind == kind) return true;
    }
    return false;
}

// ── internal media urls ──────────────────────────────────────────

TEST_CASE("internal_media_url: embeds account and file id", "[codec]") {
    std::string url = internal_media_url(777, "AgACAgIAAxkBAAI");
    REQUIRE(url == "internal:telegram/777/AgACAgIAAxkBAAI");
    int64_t owner = 0;
    auto file = parse_internal_media_url(url, &owner);
    REQUIRE(file.has_value());
    REQUIRE(*file == "AgACAgIAAxkBAAI");
    REQUIRE(owner == 777);
}

TEST_CASE("parse_internal_media_url: rejects other urls", "[codec]") {
    REQUIRE_FALSE(parse_internal_media_url("https://example.com/a.png").has_value());
    REQUIRE_FALSE(parse_internal_media_url("internal:telegram/777/").has_value());
    REQUIRE_FALSE(parse_internal_media_url("internal:telegram/abc/file").has_value());
    REQUIRE_FALSE(parse_internal_media_url("internal:telegram//file").has_value());
}

// ── clip_entities ────────────────────────────────────────────────

TEST_CASE("clip_entities: rebases and trims to the window", "[codec]") {
    std::vector<NativeEntity> es = {entity(EntityKind::Bold, 2, 6),
                                    entity(EntityKind::Italic, 0, 1)};
    auto out = clip_entities(es, 4, 10);
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].kind == EntityKind::Bold);
    REQUIRE(out[0].offset == 0);
    REQUIRE(out[0].length == 4);
}

// ── to_segments ──────────────────────────────────────────────────

TEST_CASE("to_segments: entities become styled text", "[codec]") {
    NativeMessage m;
    m.text = "hello world";
    m.entities = {entity(EntityKind::Bold, 6, 5)};
    auto segs = to_segments(m, CodecContext{});
    REQUIRE(segs.size() == 2);
    REQUIRE(segs[0].text == "hello ");
    REQUIRE(segs[1].text == "world");
    REQUIRE(segs[1].style.bold);
}

TEST_CASE("to_segments: offsets are UTF-16 units", "[codec]") {
    NativeMessage m;
    m.text = "\xF0\x9F\x98\x80 bold";  // emoji takes two units
    m.entities = {entity(EntityKind::Bold, 3, 4)};
    auto segs = to_segments(m, CodecContext{});
    REQUIRE(segs.size() == 2);
    REQUIRE(segs[1].text == "bold");
    REQUIRE(segs[1].style.bold);
}

TEST_CASE("to_segments: mentions become at segments", "[codec]") {
    NativeMessage m;
    m.text = "hi @alice and Bob";
    NativeEntity tm = entity(EntityKind::TextMention, 14, 3);
    tm.user_id = 42;
    m.entities = {entity(EntityKind::Mention, 3, 6), tm};
    auto segs = to_segments(m, CodecContext{});
    REQUIRE(segs.size() == 4);
    REQUIRE(segs[1].kind == SegmentKind::At);
    REQUIRE(segs[1].text == "alice");
    REQUIRE(segs[1].id.empty());
    REQUIRE(segs[3].kind == SegmentKind::At);
    REQUIRE(segs[3].id == "user:42");
    REQUIRE(segs[3].text == "Bob");
}

TEST_CASE("to_segments: reply, media and caption order", "[codec]") {
    NativeMessage m;
    m.reply_to_message_id = 5;
    m.text = "caption";
    NativeMedia media;
    media.kind = MediaKind::Photo;
    media.file_id = "PHOTO1";
    m.media = media;

    CodecContext ctx;
    ctx.self_id = 9;
    auto below = to_segments(m, ctx);
    REQUIRE(below.size() == 3);
    REQUIRE(below[0].kind == SegmentKind::Quote);
    REQUIRE(below[0].id == "message:5");
    REQUIRE(below[1].kind == SegmentKind::Image);
    REQUIRE(below[1].src == "internal:telegram/9/PHOTO1");
    REQUIRE(below[2].text == "caption");

    m.caption_above_media = true;
    auto above = to_segments(m, ctx);
    REQUIRE(above[1].kind == SegmentKind::Text);
    REQUIRE(above[2].kind == SegmentKind::Image);
}

TEST_CASE("to_segments: quote carries the replied author and content", "[codec]") {
    NativeChat chat = make_native_chat(-100, ChatKind::Supergroup, "Group");
    NativeMessage earlier = make_native_message(chat, 5, make_native_user(2, "Alice"), "first");
    earlier.reply_to_message_id = 3;
    NativeButton b;
    b.text = "Go";
    b.callback_data = "go";
    earlier.keyboard = {{b}};

    NativeMessage m = make_native_message(chat, 6, make_native_user(3, "Bob"), "second");
    m.reply_to_message_id = 5;
    m.reply_to = std::make_shared<NativeMessage>(earlier);

    auto segs = to_segments(m, {});
    REQUIRE(segs.size() == 2);
    REQUIRE(segs[0].kind == SegmentKind::Quote);
    REQUIRE(segs[0].id == "message:5");
    REQUIRE(segs[0].author_id == "user:2");
    REQUIRE(segs[0].text == "Alice");
    REQUIRE(segs[0].children.size() == 1);
    REQUIRE(segs[0].children[0].text == "first");
    REQUIRE(segs[1].text == "second");

    REQUIRE(dump_markup(segs) ==
            "<quote id=\"message:5\"><user id=\"user:2\" name=\"Alice\"/>first</quote>second");
}

TEST_CASE("to_segments: reply to an unknown message is a bare quote", "[codec]") {
    NativeMessage m;
    m.reply_to_message_id = 5;
    m.text = "x";
    auto segs = to_segments(m, {});
    REQUIRE(segs[0].kind == SegmentKind::Quote);
    REQUIRE(segs[0].author_id.empty());
    REQUIRE(segs[0].children.empty());
    REQUIRE(dump_markup(segs) == "<quote id=\"message:5\"/>x");
}

TEST_CASE("to_segments: media kinds map onto segment kinds", "[codec]") {
    NativeMessage m;
    NativeMedia media;
    media.file_id = "F";
    media.kind = MediaKind::Voice;
    m.media = media;
    REQUIRE(to_segments(m, {})[0].kind == SegmentKind::Audio);
    m.media->kind = MediaKind::Animation;
    REQUIRE(to_segments(m, {})[0].kind == SegmentKind::Video);
    m.media->kind = MediaKind::Sticker;
    REQUIRE(to_segments(m, {})[0].kind == SegmentKind::Image);
    m.media->kind = MediaKind::Document;
    REQUIRE(to_segments(m, {})[0].kind == SegmentKind::File);
}

TEST_CASE("to_segments: keyboard becomes buttons", "[codec]") {
    NativeMessage m;
    m.text = "pick";
    NativeButton cb;
    cb.text = "Yes";
    cb.callback_data = "yes";
    NativeButton link;
    link.text = "Docs";
    link.url = "https://e.x";
    m.keyboard = {{cb, link}};
    auto segs = to_segments(m, {});
    REQUIRE(segs.size() == 3);
    REQUIRE(segs[1].button_type == "action");
    REQUIRE(segs[1].id == "yes");
    REQUIRE(segs[2].button_type == "link");
    REQUIRE(segs[2].href == "https://e.x");
}

// ── from_segments ────────────────────────────────────────────────

TEST_CASE("from_segments: plain text is one part", "[codec]") {
    auto plan = from_segments(parse_markup("hello <b>there</b>"), 100, TargetCapabilities{});
    REQUIRE(plan.parts.size() == 1);
    REQUIRE(plan.parts[0].chat_id == 100);
    REQUIRE(plan.parts[0].text == "hello there");
    REQUIRE(plan.parts[0].entities.size() == 1);
    REQUIRE(plan.parts[0].entities[0].offset == 6);
    REQUIRE(plan.parts[0].entities[0].length == 5);
    REQUIRE(plan.diagnostics.empty());
}

TEST_CASE("from_segments: 5000 chars split into two sends", "[codec]") {
    Segments segs = {seg::text(std::string(5000, 'x'))};
    auto plan = from_segments(segs, 1, TargetCapabilities{});
    REQUIRE(plan.parts.size() == 2);
    REQUIRE(plan.parts[0].text.size() == 4096);
    REQUIRE(plan.parts[1].text.size() == 904);
}

TEST_CASE("from_segments: entities spanning a split are clipped per part", "[codec]") {
    TextStyle bold;
    bold.bold = true;
    TargetCapabilities caps;
    caps.max_text_length = 10;
    auto plan = from_segments({seg::text("aaaaaaaa"), seg::text("bbbbbbbb", bold)}, 1, caps);
    REQUIRE(plan.parts.size() == 2);
    REQUIRE(plan.parts[0].entities.size() == 1);
    REQUIRE(plan.parts[0].entities[0].offset == 8);
    REQUIRE(plan.parts[0].entities[0].length == 2);
    REQUIRE(plan.parts[1].entities.size() == 1);
    REQUIRE(plan.parts[1].entities[0].offset == 0);
    REQUIRE(plan.parts[1].entities[0].length == 6);
}

TEST_CASE("from_segments: short text becomes the caption", "[codec]") {
    auto plan = from_segments(parse_markup("<img src=\"https://e.x/a.png\"/>nice"), 1,
                              TargetCapabilities{});
    REQUIRE(plan.parts.size() == 1);
    REQUIRE(plan.parts[0].media.size() == 1);
    REQUIRE(plan.parts[0].media[0].file.source == InputFile::Source::Url);
    REQUIRE(plan.parts[0].text == "nice");
    REQUIRE_FALSE(plan.parts[0].caption_above_media);
}

TEST_CASE("from_segments: text before media sets caption above", "[codec]") {
    auto plan = from_segments(parse_markup("look<img src=\"https://e.x/a.png\"/>"), 1,
                              TargetCapabilities{});
    REQUIRE(plan.parts.size() == 1);
    REQUIRE(plan.parts[0].caption_above_media);
}

TEST_CASE("from_segments: caption over the limit goes out as text", "[codec]") {
    TargetCapabilities caps;
    caps.max_caption_length = 5;
    Segments segs = {seg::media(SegmentKind::Image, "https://e.x/a.png"),
                     seg::text("too long caption")};
    auto plan = from_segments(segs, 1, caps);
    REQUIRE(plan.parts.size() == 2);
    REQUIRE(plan.parts[0].media.size() == 1);
    REQUIRE(plan.parts[0].text.empty());
    REQUIRE(plan.parts[1].text == "too long caption");
}

TEST_CASE("from_segments: internal urls are re-sent by file id", "[codec]") {
    Segments segs = {seg::media(SegmentKind::Video, "internal:telegram/3/VID")};
    auto plan = from_segments(segs, 1, TargetCapabilities{});
    REQUIRE(plan.parts[0].media[0].file.source == InputFile::Source::RemoteId);
    REQUIRE(plan.parts[0].media[0].file.value == "VID");
    REQUIRE(plan.parts[0].media[0].kind == MediaKind::Video);
}

TEST_CASE("from_segments: albums respect size cap and media class", "[codec]") {
    TargetCapabilities caps;
    caps.max_album_size = 2;
    Segments segs = {seg::media(SegmentKind::Image, "https://e.x/1"),
                     seg::media(SegmentKind::Image, "https://e.x/2"),
                     seg::media(SegmentKind::Image, "https://e.x/3"),
                     seg::media(SegmentKind::File, "https://e.x/4")};
    auto plan = from_segments(segs, 1, caps);
    REQUIRE(plan.parts.size() == 3);
    REQUIRE(plan.parts[0].media.size() == 2);
    REQUIRE(plan.parts[1].media.size() == 1);
    REQUIRE(plan.parts[2].media[0].kind == MediaKind::Document);
}

TEST_CASE("from_segments: quote sets reply on the first part only", "[codec]") {
    TargetCapabilities caps;
    caps.max_text_length = 4;
    auto plan = from_segments({seg::quote("message:77"), seg::text("abcdefgh")}, 1, caps);
    REQUIRE(plan.parts.size() == 2);
    REQUIRE(plan.parts[0].reply_to_message_id == 77);
    REQUIRE(plan.parts[1].reply_to_message_id == 0);
}

TEST_CASE("from_segments: bad quote is a diagnostic, not a failure", "[codec]") {
    auto plan = from_segments({seg::quote("user:1"), seg::text("x")}, 1, TargetCapabilities{});
    REQUIRE(plan.parts.size() == 1);
    REQUIRE(plan.parts[0].reply_to_message_id == 0);
    REQUIRE(has_diagnostic(plan.diagnostics, ErrorKind::InvalidReference));
}

TEST_CASE("from_segments: mentions become entities", "[codec]") {
    auto plan = from_segments({seg::text("hi "), seg::at("user:42", "Bob"),
                               seg::at("", "alice")}, 1, TargetCapabilities{});
    const auto& p = plan.parts.at(0);
    REQUIRE(p.text == "hi Bob@alice");
    REQUIRE(p.entities.size() == 2);
    REQUIRE(p.entities[0].kind == EntityKind::TextMention);
    REQUIRE(p.entities[0].user_id == 42);
    REQUIRE(p.entities[1].kind == EntityKind::Mention);
    REQUIRE(p.entities[1].offset == 6);
}

TEST_CASE("from_segments: sharp is approximated with a diagnostic", "[codec]") {
    auto plan = from_segments({seg::sharp("chat:1", "general")}, 1, TargetCapabilities{});
    REQUIRE(plan.parts.at(0).text == "#general");
    REQUIRE(has_diagnostic(plan.diagnostics, ErrorKind::UnsupportedSegment));
}

TEST_CASE("from_segments: buttons attach to the last part", "[codec]") {
    TargetCapabilities caps;
    caps.max_text_length = 3;
    caps.max_buttons_per_row = 2;
    Segments segs = {seg::text("abcdef"), seg::button("a", "A"), seg::button("b", "B"),
                     seg::button("c", "C")};
    auto plan = from_segments(segs, 1, caps);
    REQUIRE(plan.parts.size() == 2);
    REQUIRE(plan.parts[0].keyboard.empty());
    REQUIRE(plan.parts[1].keyboard.size() == 2);
    REQUIRE(plan.parts[1].keyboard[0].size() == 2);
    REQUIRE(plan.parts[1].keyboard[1][0].callback_data == "c");
}

TEST_CASE("from_segments: album buttons follow in a text message", "[codec]") {
    Segments segs = {seg::media(SegmentKind::Image, "https://e.x/1"),
                     seg::media(SegmentKind::Image, "https://e.x/2"),
                     seg::text("look"), seg::button("x", "Go")};
    auto plan = from_segments(segs, 1, TargetCapabilities{});
    REQUIRE(plan.diagnostics.empty());
    REQUIRE(plan.parts.size() == 2);
    REQUIRE(plan.parts[0].media.size() == 2);
    REQUIRE(plan.parts[0].text.empty());
    REQUIRE(plan.parts[0].keyboard.empty());
    REQUIRE(plan.parts[1].media.empty());
    REQUIRE(plan.parts[1].text == "look");
    REQUIRE(plan.parts[1].keyboard.size() == 1);
    REQUIRE(plan.parts[1].keyboard[0][0].callback_data == "x");
}

TEST_CASE("from_segments: album buttons without text are reported", "[codec]") {
    Segments segs = {seg::media(SegmentKind::Image, "https://e.x/1"),
                     seg::media(SegmentKind::Image, "https://e.x/2"),
                     seg::button("x", "Go")};
    auto plan = from_segments(segs, 1, TargetCapabilities{});
    REQUIRE(plan.parts.size() == 1);
    REQUIRE(plan.parts[0].keyboard.empty());
    REQUIRE(has_diagnostic(plan.diagnostics, ErrorKind::UnsupportedSegment));
}

TEST_CASE("from_segments: a single media keeps its buttons", "[codec]") {
    Segments segs = {seg::media(SegmentKind::Image, "https://e.x/1"), seg::button("x", "Go")};
    auto plan = from_segments(segs, 1, TargetCapabilities{});
    REQUIRE(plan.parts.size() == 1);
    REQUIRE(plan.parts[0].keyboard.size() == 1);
}

TEST_CASE("from_segments: buttons alone are a diagnostic", "[codec]") {
    auto plan = from_segments({seg::button("a", "A")}, 1, TargetCapabilities{});
    REQUIRE(plan.parts.empty());
    REQUIRE(has_diagnostic(plan.diagnostics, ErrorKind::UnsupportedSegment));
}

TEST_CASE("from_segments: location is its own part", "[codec]") {
    auto plan = from_segments({seg::text("here"), seg::location(1.0, 2.0)}, 1,
                              TargetCapabilities{});
    REQUIRE(plan.parts.size() == 2);
    REQUIRE(plan.parts[1].location.has_value());
    REQUIRE(plan.parts[1].location->longitude == 2.0);
}

// ── edit_text ────────────────────────────────────────────────────

TEST_CASE("edit_text: text and entities of an edit", "[codec]") {
    auto plan = edit_text(parse_markup("<i>new</i> text"), TargetCapabilities{});
    REQUIRE(plan.text == "new text");
    REQUIRE(plan.entities.size() == 1);
    REQUIRE(plan.diagnostics.empty());
}

TEST_CASE("edit_text: media and quote are reported", "[codec]") {
    auto plan = edit_text({seg::quote("message:1"), seg::text("x"),
                           seg::media(SegmentKind::Image, "https://e.x/a")},
                          TargetCapabilities{});
    REQUIRE(plan.text == "x");
    REQUIRE(plan.diagnostics.size() == 2);
}

TEST_CASE("edit_text: overlong text is truncated with a diagnostic", "[codec]") {
    TargetCapabilities caps;
    caps.max_text_length = 4;
    auto plan = edit_text({seg::text("abcdefgh")}, caps);
    REQUIRE(plan.text == "abcd");
    REQUIRE(has_diagnostic(plan.diagnostics, ErrorKind::UnsupportedSegment));
}

// ── native -> segments -> native ─────────────────────────────────

TEST_CASE("sent messages decode to the segments they were built from", "[codec]") {
    MockBackend backend;
    backend.me = make_native_user(1, "Self");
    NativeChat chat = make_native_chat(-100, ChatKind::Supergroup, "Group");
    backend.chats[chat.id] = chat;
    NativeUser alice = make_native_user(2, "Alice");
    CodecContext ctx;
    ctx.self_id = 1;

    auto resend = [&](const NativeMessage& original, Segments& before) {
        before = to_segments(original, ctx);
        SendPlan plan = from_segments(before, chat.id, TargetCapabilities{});
        REQUIRE(plan.diagnostics.empty());
        Segments after;
        for (const auto& part : plan.parts) {
            for (const auto& sent : backend.send(part)) {
                Segments segs = to_segments(sent, ctx);
                after.insert(after.end(), segs.begin(), segs.end());
            }
        }
        return after;
    };

    SECTION("photo with styled caption, mention, reply and buttons") {
        NativeMessage m = make_native_message(chat, 10, alice, "hi Bob, look");
        NativeEntity mention = entity(EntityKind::TextMention, 3, 3);
        mention.user_id = 42;
        m.entities = {entity(EntityKind::Bold, 0, 2), mention};
        m.reply_to_message_id = 7;
        m.reply_to = std::make_shared<NativeMessage>(
            make_native_message(chat, 7, make_native_user(42, "Bob"), "earlier"));
        NativeMedia photo;
        photo.kind = MediaKind::Photo;
        photo.file_id = "PHOTO1";
        photo.file_name = "p.jpg";
        m.media = photo;
        NativeButton vote;
        vote.text = "Vote";
        vote.callback_data = "vote";
        NativeButton docs;
        docs.text = "Docs";
        docs.url = "https://e.x/docs";
        m.keyboard = {{vote, docs}};

        Segments before;
        Segments after = resend(m, before);
        REQUIRE(before.front().children.size() == 1);
        REQUIRE(semantically_equal(before, after));
        REQUIRE(backend.sent.size() == 1);
        REQUIRE(backend.sent[0].reply_to_message_id == 7);
        REQUIRE(backend.sent[0].media.at(0).file.source == InputFile::Source::RemoteId);
    }

    SECTION("location with a reply and a link button") {
        NativeMessage m = make_native_message(chat, 11, alice, "");
        m.location = NativeLocation{55.75, 37.6166};
        m.reply_to_message_id = 3;
        NativeButton docs;
        docs.text = "Map";
        docs.url = "https://e.x/map";
        m.keyboard = {{docs}};

        Segments before;
        Segments after = resend(m, before);
        REQUIRE(before.size() == 3);
        REQUIRE(semantically_equal(before, after));
        REQUIRE(backend.sent.size() == 1);
        REQUIRE(backend.sent[0].location.has_value());
    }
}
