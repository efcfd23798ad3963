#include "elements.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace mtsatori {

std::string Element::attr(const std::string& key, const std::string& fallback) const {
    auto it = attrs.find(key);
    return it != attrs.end() ? it->second : fallback;
}

// ── Escaping ────────────────────────────────────────────────────

std::string escape_markup(const std::string& s, bool in_attribute) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"':
                if (in_attribute) out += "&quot;";
                else out += c;
                break;
            default: out += c; break;
        }
    }
    return out;
}

static void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string unescape_markup(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '&') {
            out += s[i];
            continue;
        }
        size_t semi = s.find(';', i);
        if (semi == std::string::npos || semi - i > 10) {
            out += s[i];
            continue;
        }
        std::string name = s.substr(i + 1, semi - i - 1);
        if (name == "amp")       out += '&';
        else if (name == "lt")   out += '<';
        else if (name == "gt")   out += '>';
        else if (name == "quot") out += '"';
        else if (name == "apos") out += '\'';
        else if (name.size() > 1 && name[0] == '#') {
            bool hex = name[1] == 'x' || name[1] == 'X';
            const char* digits = name.c_str() + (hex ? 2 : 1);
            unsigned char first = static_cast<unsigned char>(*digits);
            char* end = nullptr;
            unsigned long cp = 0;
            if (hex ? std::isxdigit(first) : std::isdigit(first)) {
                cp = std::strtoul(digits, &end, hex ? 16 : 10);
            }
            // NUL, surrogates and values past U+10FFFF are not characters.
            if (!end || *end != '\0' || cp == 0 || cp > 0x10FFFF ||
                (cp >= 0xD800 && cp <= 0xDFFF)) {
                out += s[i];
                continue;
            }
            append_utf8(out, cp);
        } else {
            out += s[i];
            continue;
        }
        i = semi;
    }
    return out;
}

// ── Parser ──────────────────────────────────────────────────────

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
           c == ':' || c == '.';
}

bool is_void_element(const std::string& type) {
    return type == "br";
}

void append_text(std::vector<Element>& siblings, const std::string& text) {
    if (text.empty()) return;
    if (!siblings.empty() && siblings.back().type == "text") {
        siblings.back().attrs["content"] += text;
        return;
    }
    Element el;
    el.type = "text";
    el.attrs["content"] = text;
    siblings.push_back(std::move(el));
}

class Parser {
public:
    explicit Parser(const std::string& src) : s_(src) {}

    std::vector<Element> run() {
        std::vector<Element> root;
        std::vector<Element*> stack;

        auto current = [&]() -> std::vector<Element>& {
            return stack.empty() ? root : stack.back()->children;
        };

        while (pos_ < s_.size()) {
            if (s_[pos_] != '<') {
                size_t next = s_.find('<', pos_);
                if (next == std::string::npos) next = s_.size();
                append_text(current(), unescape_markup(s_.substr(pos_, next - pos_)));
                pos_ = next;
                continue;
            }

            if (s_.compare(pos_, 4, "<!--") == 0) {
                size_t end = s_.find("-->", pos_ + 4);
                pos_ = (end == std::string::npos) ? s_.size() : end + 3;
                continue;
            }

            if (pos_ + 1 < s_.size() && s_[pos_ + 1] == '/') {
                size_t end = s_.find('>', pos_);
                if (end == std::string::npos) {
                    append_text(current(), s_.substr(pos_));
                    pos_ = s_.size();
                    continue;
                }
                std::string name = s_.substr(pos_ + 2, end - pos_ - 2);
                while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back())))
                    name.pop_back();
                pos_ = end + 1;
                // Pop to the matching open tag; stray closers are ignored
                for (size_t k = stack.size(); k > 0; --k) {
                    if (stack[k - 1]->type == name) {
                        stack.resize(k - 1);
                        break;
                    }
                }
                continue;
            }

            Element el;
            bool self_closing = false;
            size_t start = pos_;
            if (!parse_open_tag(el, self_closing)) {
                // Not a tag after all: keep the '<' as literal text
                pos_ = start + 1;
                append_text(current(), "<");
                continue;
            }

            auto& siblings = current();
            siblings.push_back(std::move(el));
            Element* added = &siblings.back();
            if (!self_closing && !is_void_element(added->type)) {
                stack.push_back(added);
            }
        }
        return root;
    }

private:
    bool parse_open_tag(Element& el, bool& self_closing) {
        size_t p = pos_ + 1;
        size_t name_start = p;
        while (p < s_.size() && is_name_char(s_[p])) ++p;
        if (p == name_start) return false;
        el.type = s_.substr(name_start, p - name_start);

        while (p < s_.size()) {
            while (p < s_.size() && std::isspace(static_cast<unsigned char>(s_[p]))) ++p;
            if (p >= s_.size()) return false;
            if (s_[p] == '>') {
                pos_ = p + 1;
                return true;
            }
            if (s_[p] == '/' && p + 1 < s_.size() && s_[p + 1] == '>') {
                self_closing = true;
                pos_ = p + 2;
                return true;
            }

            size_t attr_start = p;
            while (p < s_.size() && is_name_char(s_[p])) ++p;
            if (p == attr_start) return false;
            std::string key = s_.substr(attr_start, p - attr_start);

            while (p < s_.size() && std::isspace(static_cast<unsigned char>(s_[p]))) ++p;
            if (p < s_.size() && s_[p] == '=') {
                ++p;
                while (p < s_.size() && std::isspace(static_cast<unsigned char>(s_[p]))) ++p;
                if (p >= s_.size()) return false;
                std::string value;
                if (s_[p] == '"' || s_[p] == '\'') {
                    char quote = s_[p];
                    size_t close = s_.find(quote, p + 1);
                    if (close == std::string::npos) return false;
                    value = s_.substr(p + 1, close - p - 1);
                    p = close + 1;
                } else {
                    size_t v = p;
                    while (p < s_.size() && !std::isspace(static_cast<unsigned char>(s_[p])) &&
                           s_[p] != '>' && !(s_[p] == '/' && p + 1 < s_.size() && s_[p + 1] == '>'))
                        ++p;
                    value = s_.substr(v, p - v);
                }
                el.attrs[key] = unescape_markup(value);
            } else {
                el.attrs[key] = "";
            }
        }
        return false;
    }

    const std::string& s_;
    size_t pos_ = 0;
};

// ── Element tree -> segments ────────────────────────────────────

bool ends_with_newline(const Segments& out) {
    if (out.empty()) return true;
    const auto& last = out.back();
    if (last.kind != SegmentKind::Text) return false;
    return !last.text.empty() && last.text.back() == '\n';
}

std::string children_text(const Element& el) {
    std::string out;
    for (const auto& child : el.children) {
        if (child.type == "text") out += child.attr("content");
        else out += children_text(child);
    }
    return out;
}

void visit(const Element& el, const TextStyle& style, Segments& out);

void visit_children(const Element& el, const TextStyle& style, Segments& out) {
    for (const auto& child : el.children) visit(child, style, out);
}

void visit(const Element& el, const TextStyle& style, Segments& out) {
    const std::string& t = el.type;

    if (t == "text") {
        out.push_back(seg::text(el.attr("content"), style));
        return;
    }
    if (t == "br") {
        out.push_back(seg::text("\n", style));
        return;
    }
    if (t == "p") {
        if (!ends_with_newline(out)) out.push_back(seg::text("\n"));
        visit_children(el, style, out);
        if (!ends_with_newline(out)) out.push_back(seg::text("\n"));
        return;
    }

    TextStyle inner = style;
    if (t == "b" || t == "strong") { inner.bold = true; visit_children(el, inner, out); return; }
    if (t == "i" || t == "em")     { inner.italic = true; visit_children(el, inner, out); return; }
    if (t == "u" || t == "ins")    { inner.underline = true; visit_children(el, inner, out); return; }
    if (t == "s" || t == "del")    { inner.strikethrough = true; visit_children(el, inner, out); return; }
    if (t == "spl")                { inner.spoiler = true; visit_children(el, inner, out); return; }
    if (t == "a") {
        inner.href = el.attr("href");
        visit_children(el, inner, out);
        return;
    }
    if (t == "code") {
        inner.code = true;
        if (el.has_attr("content")) out.push_back(seg::text(el.attr("content"), inner));
        else visit_children(el, inner, out);
        return;
    }
    if (t == "pre" || t == "code-block") {
        inner.pre = true;
        inner.language = el.attr("lang");
        visit_children(el, inner, out);
        return;
    }

    if (t == "at") {
        if (!el.has_attr("id") && !el.has_attr("name")) return;
        out.push_back(seg::at(el.attr("id"), el.attr("name")));
        return;
    }
    if (t == "sharp") {
        out.push_back(seg::sharp(el.attr("id"), el.attr("name")));
        return;
    }

    SegmentKind media_kind = SegmentKind::Text;
    if (t == "img" || t == "image") media_kind = SegmentKind::Image;
    else if (t == "audio")          media_kind = SegmentKind::Audio;
    else if (t == "video")          media_kind = SegmentKind::Video;
    else if (t == "file")           media_kind = SegmentKind::File;
    if (media_kind != SegmentKind::Text) {
        std::string src = el.attr("src", el.attr("url"));
        if (src.empty()) return;
        Segment s = seg::media(media_kind, src, el.attr("title"));
        s.spoiler = el.has_attr("spoiler");
        out.push_back(std::move(s));
        return;
    }

    if (t == "quote") {
        if (el.has_attr("id")) {
            Segment q = seg::quote(el.attr("id"));
            for (const auto& child : el.children) {
                if (child.type == "user" || child.type == "author") {
                    q.author_id = child.attr("id");
                    q.text = child.attr("name");
                } else {
                    visit(child, TextStyle{}, q.children);
                }
            }
            q.children = normalize_segments(q.children);
            out.push_back(std::move(q));
        } else {
            visit_children(el, style, out);
        }
        return;
    }
    if (t == "location") {
        out.push_back(seg::location(std::strtod(el.attr("lat", "0").c_str(), nullptr),
                                    std::strtod(el.attr("lon", "0").c_str(), nullptr)));
        return;
    }
    if (t == "button") {
        Segment s = seg::button(el.attr("id"), children_text(el), el.attr("type", "action"));
        s.href = el.attr("href");
        s.input = el.attr("text");
        out.push_back(std::move(s));
        return;
    }
    if (t == "author") return;

    // message, figure, button-group and unknown elements: render children
    visit_children(el, style, out);
}

std::string format_number(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", v);
    if (std::strtod(buf, nullptr) != v) std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

std::string attr_pair(const std::string& key, const std::string& value) {
    return " " + key + "=\"" + escape_markup(value, true) + "\"";
}

std::string dump_text(const Segment& s) {
    std::string body = escape_markup(s.text);
    const TextStyle& st = s.style;
    if (st.pre) {
        std::string open = "<code-block";
        if (!st.language.empty()) open += attr_pair("lang", st.language);
        body = open + ">" + body + "</code-block>";
    }
    if (st.code)          body = "<code>" + body + "</code>";
    if (st.spoiler)       body = "<spl>" + body + "</spl>";
    if (st.strikethrough) body = "<s>" + body + "</s>";
    if (st.underline)     body = "<u>" + body + "</u>";
    if (st.italic)        body = "<i>" + body + "</i>";
    if (st.bold)          body = "<b>" + body + "</b>";
    if (!st.href.empty()) body = "<a" + attr_pair("href", st.href) + ">" + body + "</a>";
    return body;
}

} // namespace

std::vector<Element> parse_elements(const std::string& markup) {
    return Parser(markup).run();
}

Segments elements_to_segments(const std::vector<Element>& elements) {
    Segments out;
    for (const auto& el : elements) visit(el, TextStyle{}, out);
    return normalize_segments(out);
}

Segments parse_markup(const std::string& markup) {
    return elements_to_segments(parse_elements(markup));
}

std::string dump_markup(const Segments& segments) {
    std::string out;
    for (const auto& s : segments) {
        switch (s.kind) {
            case SegmentKind::Text:
                out += dump_text(s);
                break;
            case SegmentKind::At:
            case SegmentKind::Sharp:
                out += std::string("<") + segment_kind_name(s.kind);
                if (!s.id.empty()) out += attr_pair("id", s.id);
                if (!s.text.empty()) out += attr_pair("name", s.text);
                out += "/>";
                break;
            case SegmentKind::Image:
            case SegmentKind::Audio:
            case SegmentKind::Video:
            case SegmentKind::File:
                out += std::string("<") + segment_kind_name(s.kind) + attr_pair("src", s.src);
                if (!s.title.empty()) out += attr_pair("title", s.title);
                if (s.spoiler) out += " spoiler";
                out += "/>";
                break;
            case SegmentKind::Quote:
                out += "<quote" + attr_pair("id", s.id);
                if (s.author_id.empty() && s.children.empty()) {
                    out += "/>";
                    break;
                }
                out += ">";
                if (!s.author_id.empty()) {
                    out += "<user" + attr_pair("id", s.author_id);
                    if (!s.text.empty()) out += attr_pair("name", s.text);
                    out += "/>";
                }
                out += dump_markup(s.children) + "</quote>";
                break;
            case SegmentKind::Location:
                out += "<location" + attr_pair("lat", format_number(s.latitude)) +
                       attr_pair("lon", format_number(s.longitude)) + "/>";
                break;
            case SegmentKind::Button:
                out += "<button" + attr_pair("type", s.button_type.empty() ? "action" : s.button_type);
                if (!s.id.empty()) out += attr_pair("id", s.id);
                if (!s.href.empty()) out += attr_pair("href", s.href);
                if (!s.input.empty()) out += attr_pair("text", s.input);
                out += ">" + escape_markup(s.text) + "</button>";
                break;
        }
    }
    return out;
}

} // namespace mtsatori
