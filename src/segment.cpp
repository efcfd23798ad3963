#include "segment.hpp"

namespace mtsatori {

const char* segment_kind_name(SegmentKind kind) {
    switch (kind) {
        case SegmentKind::Text:     return "text";
        case SegmentKind::At:       return "at";
        case SegmentKind::Sharp:    return "sharp";
        case SegmentKind::Image:    return "img";
        case SegmentKind::Audio:    return "audio";
        case SegmentKind::Video:    return "video";
        case SegmentKind::File:     return "file";
        case SegmentKind::Quote:    return "quote";
        case SegmentKind::Location: return "location";
        case SegmentKind::Button:   return "button";
    }
    return "text";
}

bool is_media(SegmentKind kind) {
    return kind == SegmentKind::Image || kind == SegmentKind::Audio ||
           kind == SegmentKind::Video || kind == SegmentKind::File;
}

bool TextStyle::operator==(const TextStyle& o) const {
    return bold == o.bold && italic == o.italic && underline == o.underline &&
           strikethrough == o.strikethrough && spoiler == o.spoiler &&
           code == o.code && pre == o.pre && href == o.href && language == o.language;
}

bool Segment::operator==(const Segment& o) const {
    if (kind != o.kind) return false;
    switch (kind) {
        case SegmentKind::Text:
            return text == o.text && style == o.style;
        case SegmentKind::At:
        case SegmentKind::Sharp:
            return id == o.id && text == o.text;
        case SegmentKind::Image:
        case SegmentKind::Audio:
        case SegmentKind::Video:
        case SegmentKind::File:
            return src == o.src && title == o.title && spoiler == o.spoiler;
        case SegmentKind::Quote:
            return id == o.id;
        case SegmentKind::Location:
            return latitude == o.latitude && longitude == o.longitude;
        case SegmentKind::Button:
            return id == o.id && text == o.text && button_type == o.button_type &&
                   href == o.href && input == o.input;
    }
    return false;
}

namespace seg {

Segment text(std::string content, TextStyle style) {
    Segment s;
    s.kind = SegmentKind::Text;
    s.text = std::move(content);
    s.style = std::move(style);
    return s;
}

Segment at(std::string user_id, std::string name) {
    Segment s;
    s.kind = SegmentKind::At;
    s.id = std::move(user_id);
    s.text = std::move(name);
    return s;
}

Segment sharp(std::string channel_id, std::string name) {
    Segment s;
    s.kind = SegmentKind::Sharp;
    s.id = std::move(channel_id);
    s.text = std::move(name);
    return s;
}

Segment media(SegmentKind kind, std::string src, std::string title) {
    Segment s;
    s.kind = kind;
    s.src = std::move(src);
    s.title = std::move(title);
    return s;
}

Segment quote(std::string message_id) {
    Segment s;
    s.kind = SegmentKind::Quote;
    s.id = std::move(message_id);
    return s;
}

Segment location(double latitude, double longitude) {
    Segment s;
    s.kind = SegmentKind::Location;
    s.latitude = latitude;
    s.longitude = longitude;
    return s;
}

Segment button(std::string id, std::string label, std::string type) {
    Segment s;
    s.kind = SegmentKind::Button;
    s.id = std::move(id);
    s.text = std::move(label);
    s.button_type = std::move(type);
    return s;
}

} // namespace seg

Segments normalize_segments(const Segments& in) {
    Segments out;
    out.reserve(in.size());
    for (const auto& s : in) {
        if (s.kind == SegmentKind::Text) {
            if (s.text.empty()) continue;
            if (!out.empty() && out.back().kind == SegmentKind::Text &&
                out.back().style == s.style) {
                out.back().text += s.text;
                continue;
            }
        }
        out.push_back(s);
    }
    return out;
}

bool semantically_equal(const Segments& a, const Segments& b) {
    return normalize_segments(a) == normalize_segments(b);
}

std::string plain_text(const Segments& segments) {
    std::string out;
    for (const auto& s : segments) {
        switch (s.kind) {
            case SegmentKind::Text:  out += s.text; break;
            case SegmentKind::At:    out += "@" + (s.text.empty() ? s.id : s.text); break;
            case SegmentKind::Sharp: out += "#" + (s.text.empty() ? s.id : s.text); break;
            case SegmentKind::Image: out += "[image]"; break;
            case SegmentKind::Audio: out += "[audio]"; break;
            case SegmentKind::Video: out += "[video]"; break;
            case SegmentKind::File:  out += "[file]"; break;
            case SegmentKind::Location: out += "[location]"; break;
            case SegmentKind::Quote:
            case SegmentKind::Button:
                break;
        }
    }
    return out;
}

} // namespace mtsatori
