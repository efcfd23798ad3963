#include "codec.hpp"
#include "ids.hpp"
#include "text.hpp"

#include <algorithm>

namespace mtsatori {

static const char* const kInternalPrefix = "internal:telegram/";

std::string internal_media_url(int64_t self_id, const std::string& file_id) {
    return std::string(kInternalPrefix) + std::to_string(self_id) + "/" + file_id;
}

std::optional<std::string> parse_internal_media_url(const std::string& url, int64_t* self_id) {
    const std::string prefix = kInternalPrefix;
    if (url.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    auto slash = url.find('/', prefix.size());
    if (slash == std::string::npos || slash == prefix.size() || slash + 1 >= url.size())
        return std::nullopt;

    auto owner = try_decode_id("user:" + url.substr(prefix.size(), slash - prefix.size()));
    if (!owner) return std::nullopt;
    if (self_id) *self_id = owner->value;
    return url.substr(slash + 1);
}

std::vector<NativeEntity> clip_entities(const std::vector<NativeEntity>& entities,
                                        size_t offset, size_t length) {
    std::vector<NativeEntity> out;
    const size_t end = offset + length;
    for (const auto& e : entities) {
        size_t begin = std::max(e.offset, offset);
        size_t finish = std::min(e.offset + e.length, end);
        if (begin >= finish) continue;
        NativeEntity clipped = e;
        clipped.offset = begin - offset;
        clipped.length = finish - begin;
        out.push_back(std::move(clipped));
    }
    return out;
}

// ── Native -> segments ──────────────────────────────────────────

namespace {

bool is_mention(const NativeEntity& e) {
    return e.kind == EntityKind::Mention || e.kind == EntityKind::TextMention;
}

void apply_entity(TextStyle& style, const NativeEntity& e) {
    switch (e.kind) {
        case EntityKind::Bold:          style.bold = true; break;
        case EntityKind::Italic:        style.italic = true; break;
        case EntityKind::Underline:     style.underline = true; break;
        case EntityKind::Strikethrough: style.strikethrough = true; break;
        case EntityKind::Spoiler:       style.spoiler = true; break;
        case EntityKind::Code:          style.code = true; break;
        case EntityKind::Pre:
            style.pre = true;
            style.language = e.language;
            break;
        case EntityKind::TextUrl:       style.href = e.url; break;
        case EntityKind::Mention:
        case EntityKind::TextMention:
            break;
    }
}

Segments text_segments(const std::string& text, const std::vector<NativeEntity>& entities) {
    Segments out;
    const size_t total = utf16_length(text);
    if (total == 0) return out;

    std::vector<size_t> cuts{0, total};
    for (const auto& e : entities) {
        cuts.push_back(std::min(e.offset, total));
        cuts.push_back(std::min(e.offset + e.length, total));
    }
    std::sort(cuts.begin(), cuts.end());
    cuts.erase(std::unique(cuts.begin(), cuts.end()), cuts.end());

    for (size_t i = 0; i + 1 < cuts.size(); ++i) {
        size_t a = cuts[i];
        size_t b = cuts[i + 1];
        if (a >= b) continue;

        const NativeEntity* mention = nullptr;
        for (const auto& e : entities) {
            if (is_mention(e) && e.offset <= a && a < e.offset + e.length) {
                mention = &e;
                break;
            }
        }
        if (mention) {
            // A mention is atomic; emit it once at its first run
            if (a != mention->offset) continue;
            std::string label = utf16_substr(text, mention->offset, mention->length);
            if (mention->kind == EntityKind::TextMention) {
                out.push_back(seg::at(encode_id(mention->user_id, Scope::User), label));
            } else {
                if (!label.empty() && label[0] == '@') label.erase(0, 1);
                out.push_back(seg::at("", label));
            }
            continue;
        }

        TextStyle style;
        for (const auto& e : entities) {
            if (e.offset <= a && e.offset + e.length >= b) apply_entity(style, e);
        }
        out.push_back(seg::text(utf16_substr(text, a, b - a), style));
    }
    return out;
}

SegmentKind segment_kind_for(MediaKind kind) {
    switch (kind) {
        case MediaKind::Photo:
        case MediaKind::Sticker:   return SegmentKind::Image;
        case MediaKind::Animation:
        case MediaKind::Video:
        case MediaKind::VideoNote: return SegmentKind::Video;
        case MediaKind::Voice:
        case MediaKind::Audio:     return SegmentKind::Audio;
        case MediaKind::Document:  return SegmentKind::File;
    }
    return SegmentKind::File;
}

void append_buttons(const NativeKeyboard& keyboard, Segments& out) {
    for (const auto& row : keyboard) {
        for (const auto& b : row) {
            if (!b.callback_data.empty()) {
                out.push_back(seg::button(b.callback_data, b.text, "action"));
            } else if (!b.url.empty()) {
                Segment s = seg::button("", b.text, "link");
                s.href = b.url;
                out.push_back(std::move(s));
            } else if (!b.switch_query.empty()) {
                Segment s = seg::button("", b.text, "input");
                s.input = b.switch_query;
                out.push_back(std::move(s));
            }
        }
    }
}

} // namespace

Segments to_segments(const NativeMessage& message, const CodecContext& ctx) {
    Segments out;
    if (message.reply_to_message_id != 0) {
        Segment q = seg::quote(encode_id(message.reply_to_message_id, Scope::Message));
        if (message.reply_to) {
            const NativeMessage& replied = *message.reply_to;
            if (replied.sender && replied.sender->id != 0) {
                q.author_id = encode_id(replied.sender->id, Scope::User);
                q.text = replied.sender->display_name();
            }
            // One level deep; the quoted message's own quote and buttons stay out.
            NativeMessage inner = replied;
            inner.reply_to_message_id = 0;
            inner.reply_to.reset();
            inner.keyboard.clear();
            q.children = to_segments(inner, ctx);
        }
        out.push_back(std::move(q));
    }

    Segments body = text_segments(message.text, message.entities);

    Segments attachment;
    if (message.media) {
        const auto& m = *message.media;
        Segment s = seg::media(segment_kind_for(m.kind),
                               internal_media_url(ctx.self_id, m.file_id), m.file_name);
        s.spoiler = m.spoiler;
        attachment.push_back(std::move(s));
    }
    if (message.location) {
        attachment.push_back(seg::location(message.location->latitude,
                                           message.location->longitude));
    }

    if (message.caption_above_media) {
        out.insert(out.end(), body.begin(), body.end());
        out.insert(out.end(), attachment.begin(), attachment.end());
    } else {
        out.insert(out.end(), attachment.begin(), attachment.end());
        out.insert(out.end(), body.begin(), body.end());
    }

    append_buttons(message.keyboard, out);
    return normalize_segments(out);
}

// ── Segments -> native ──────────────────────────────────────────

namespace {

// Accumulates one text run with UTF-16 addressed entities.
class TextBuilder {
public:
    void append(const std::string& s, const TextStyle& style) {
        size_t len = utf16_length(s);
        if (len == 0) return;
        auto add = [&](EntityKind kind) {
            NativeEntity e;
            e.kind = kind;
            e.offset = units_;
            e.length = len;
            entities_.push_back(e);
            return &entities_.back();
        };
        if (style.bold)          add(EntityKind::Bold);
        if (style.italic)        add(EntityKind::Italic);
        if (style.underline)     add(EntityKind::Underline);
        if (style.strikethrough) add(EntityKind::Strikethrough);
        if (style.spoiler)       add(EntityKind::Spoiler);
        if (style.code)          add(EntityKind::Code);
        if (style.pre)           add(EntityKind::Pre)->language = style.language;
        if (!style.href.empty()) add(EntityKind::TextUrl)->url = style.href;
        text_ += s;
        units_ += len;
    }

    void append_entity(const std::string& s, NativeEntity entity) {
        size_t len = utf16_length(s);
        if (len == 0) return;
        entity.offset = units_;
        entity.length = len;
        entities_.push_back(std::move(entity));
        text_ += s;
        units_ += len;
    }

    const std::string& text() const { return text_; }
    const std::vector<NativeEntity>& entities() const { return entities_; }
    size_t units() const { return units_; }

private:
    std::string text_;
    std::vector<NativeEntity> entities_;
    size_t units_ = 0;
};

enum class AlbumClass { Visual, Audio, Document };

AlbumClass album_class(MediaKind kind) {
    switch (kind) {
        case MediaKind::Photo:
        case MediaKind::Video:
        case MediaKind::Animation: return AlbumClass::Visual;
        case MediaKind::Audio:
        case MediaKind::Voice:     return AlbumClass::Audio;
        default:                   return AlbumClass::Document;
    }
}

MediaKind media_kind_for(SegmentKind kind) {
    switch (kind) {
        case SegmentKind::Image: return MediaKind::Photo;
        case SegmentKind::Video: return MediaKind::Video;
        case SegmentKind::Audio: return MediaKind::Audio;
        default:                 return MediaKind::Document;
    }
}

struct Collected {
    TextBuilder body;
    std::vector<OutgoingMedia> media;
    std::vector<NativeLocation> locations;
    NativeKeyboard keyboard;
    int64_t reply_to = 0;
    bool text_before_media = false;
    std::vector<Diagnostic> diagnostics;
};

void add_button(Collected& c, const Segment& s, size_t per_row) {
    NativeButton b;
    b.text = s.text.empty() ? (s.id.empty() ? s.href : s.id) : s.text;
    if (s.button_type == "link") {
        if (s.href.empty()) {
            c.diagnostics.push_back({ErrorKind::UnsupportedSegment, "link button without href"});
            return;
        }
        b.url = s.href;
    } else if (s.button_type == "input") {
        b.switch_query = s.input.empty() ? s.text : s.input;
    } else if (s.button_type == "action" || s.button_type.empty()) {
        if (s.id.empty()) {
            c.diagnostics.push_back({ErrorKind::UnsupportedSegment, "action button without id"});
            return;
        }
        b.callback_data = s.id;
    } else {
        c.diagnostics.push_back({ErrorKind::UnsupportedSegment,
                                 "button type '" + s.button_type + "'"});
        return;
    }
    if (b.text.empty()) b.text = " ";
    if (c.keyboard.empty() || c.keyboard.back().size() >= per_row) c.keyboard.emplace_back();
    c.keyboard.back().push_back(std::move(b));
}

Collected collect(const Segments& segments, const TargetCapabilities& caps) {
    Collected c;
    for (const auto& s : segments) {
        switch (s.kind) {
            case SegmentKind::Text:
                if (c.media.empty() && !s.text.empty()) c.text_before_media = true;
                c.body.append(s.text, s.style);
                break;

            case SegmentKind::At: {
                if (c.media.empty()) c.text_before_media = true;
                auto target = try_decode_id(s.id);
                if (target && target->scope == Scope::User) {
                    NativeEntity e;
                    e.kind = EntityKind::TextMention;
                    e.user_id = target->value;
                    c.body.append_entity(s.text.empty() ? s.id : s.text, e);
                } else if (!s.text.empty()) {
                    NativeEntity e;
                    e.kind = EntityKind::Mention;
                    c.body.append_entity("@" + s.text, e);
                } else {
                    c.diagnostics.push_back({ErrorKind::UnsupportedSegment,
                                             "at without a user reference: '" + s.id + "'"});
                }
                break;
            }

            case SegmentKind::Sharp:
                // No native channel mention; keep a readable hashtag
                if (c.media.empty()) c.text_before_media = true;
                c.body.append("#" + (s.text.empty() ? s.id : s.text), TextStyle{});
                c.diagnostics.push_back({ErrorKind::UnsupportedSegment,
                                         "sharp rendered as plain text"});
                break;

            case SegmentKind::Quote: {
                auto target = try_decode_id(s.id);
                if (!target || target->scope != Scope::Message) {
                    c.diagnostics.push_back({ErrorKind::InvalidReference,
                                             "quote: not a message identifier '" + s.id + "'"});
                    break;
                }
                if (c.reply_to == 0) c.reply_to = target->value;
                break;
            }

            case SegmentKind::Image:
            case SegmentKind::Audio:
            case SegmentKind::Video:
            case SegmentKind::File: {
                if (s.src.empty()) {
                    c.diagnostics.push_back({ErrorKind::UnsupportedSegment,
                                             std::string(segment_kind_name(s.kind)) + " without src"});
                    break;
                }
                OutgoingMedia m;
                m.kind = media_kind_for(s.kind);
                m.spoiler = s.spoiler;
                m.file.name = s.title;
                if (auto file_id = parse_internal_media_url(s.src)) {
                    m.file.source = InputFile::Source::RemoteId;
                    m.file.value = *file_id;
                } else {
                    m.file.source = InputFile::Source::Url;
                    m.file.value = s.src;
                }
                c.media.push_back(std::move(m));
                break;
            }

            case SegmentKind::Location:
                c.locations.push_back(NativeLocation{s.latitude, s.longitude});
                break;

            case SegmentKind::Button:
                add_button(c, s, caps.max_buttons_per_row);
                break;
        }
    }
    return c;
}

std::vector<NativeSendRequest> split_body(const TextBuilder& body, size_t max_units) {
    std::vector<NativeSendRequest> parts;
    for (const auto& chunk : split_text(body.text(), max_units)) {
        NativeSendRequest req;
        req.text = chunk.text;
        req.entities = clip_entities(body.entities(), chunk.offset, chunk.length);
        parts.push_back(std::move(req));
    }
    return parts;
}

std::vector<NativeSendRequest> group_media(const std::vector<OutgoingMedia>& media,
                                           size_t max_album) {
    std::vector<NativeSendRequest> parts;
    if (max_album == 0) max_album = 1;
    for (const auto& m : media) {
        bool join = !parts.empty() && parts.back().media.size() < max_album &&
                    album_class(parts.back().media.front().kind) == album_class(m.kind);
        if (!join) parts.emplace_back();
        parts.back().media.push_back(m);
    }
    return parts;
}

} // namespace

SendPlan from_segments(const Segments& segments, int64_t chat_id,
                       const TargetCapabilities& caps) {
    Collected c = collect(segments, caps);
    SendPlan plan;
    plan.diagnostics = std::move(c.diagnostics);

    std::vector<NativeSendRequest> media_parts = group_media(c.media, caps.max_album_size);
    std::vector<NativeSendRequest> text_parts;

    if (c.body.units() > 0) {
        if (!media_parts.empty() && c.body.units() <= caps.max_caption_length) {
            auto& first = media_parts.front();
            first.text = c.body.text();
            first.entities = c.body.entities();
            first.caption_above_media = c.text_before_media;
        } else {
            text_parts = split_body(c.body, caps.max_text_length);
        }
    }

    if (c.text_before_media) {
        plan.parts = std::move(text_parts);
        plan.parts.insert(plan.parts.end(), media_parts.begin(), media_parts.end());
    } else {
        plan.parts = std::move(media_parts);
        plan.parts.insert(plan.parts.end(), text_parts.begin(), text_parts.end());
    }

    for (const auto& loc : c.locations) {
        NativeSendRequest req;
        req.location = loc;
        plan.parts.push_back(std::move(req));
    }

    if (!c.keyboard.empty()) {
        if (plan.parts.empty()) {
            plan.diagnostics.push_back({ErrorKind::UnsupportedSegment,
                                        "buttons need message content"});
        } else if (plan.parts.back().media.size() > 1) {
            // Albums carry no keyboard; the buttons follow in their own
            // message, taking the album caption along.
            NativeSendRequest& album = plan.parts.back();
            if (album.text.empty()) {
                plan.diagnostics.push_back({ErrorKind::UnsupportedSegment,
                                            "buttons on an album need text"});
            } else {
                NativeSendRequest trailing;
                trailing.text = std::move(album.text);
                trailing.entities = std::move(album.entities);
                trailing.keyboard = std::move(c.keyboard);
                album.text.clear();
                album.entities.clear();
                album.caption_above_media = false;
                plan.parts.push_back(std::move(trailing));
            }
        } else {
            plan.parts.back().keyboard = std::move(c.keyboard);
        }
    }

    for (auto& part : plan.parts) part.chat_id = chat_id;
    if (!plan.parts.empty()) plan.parts.front().reply_to_message_id = c.reply_to;
    return plan;
}

EditPlan edit_text(const Segments& segments, const TargetCapabilities& caps) {
    Collected c = collect(segments, caps);
    EditPlan plan;
    plan.diagnostics = std::move(c.diagnostics);

    if (!c.media.empty()) {
        plan.diagnostics.push_back({ErrorKind::UnsupportedSegment, "media cannot be edited"});
    }
    if (!c.locations.empty()) {
        plan.diagnostics.push_back({ErrorKind::UnsupportedSegment, "location cannot be edited"});
    }
    if (c.reply_to != 0) {
        plan.diagnostics.push_back({ErrorKind::UnsupportedSegment, "quote cannot be edited"});
    }

    if (c.body.units() > caps.max_text_length) {
        auto chunks = split_text(c.body.text(), caps.max_text_length);
        plan.text = chunks.front().text;
        plan.entities = clip_entities(c.body.entities(), 0, chunks.front().length);
        plan.diagnostics.push_back({ErrorKind::UnsupportedSegment,
                                    "edited text truncated to " +
                                    std::to_string(caps.max_text_length) + " units"});
    } else {
        plan.text = c.body.text();
        plan.entities = c.body.entities();
    }
    plan.keyboard = std::move(c.keyboard);
    return plan;
}

} // namespace mtsatori
