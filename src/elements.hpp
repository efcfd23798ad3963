#pragma once
#include "segment.hpp"
#include <string>
#include <vector>
#include <map>

namespace mtsatori {

// Gateway message markup: the XML-like element syntax used for message
// content on the gateway side ("hi <at id=\"user:1\"/> <img src=\"...\"/>").

struct Element {
    std::string type;                           // "text" for text nodes
    std::map<std::string, std::string> attrs;   // text nodes keep content in attrs["content"]
    std::vector<Element> children;

    std::string attr(const std::string& key, const std::string& fallback = {}) const;
    bool has_attr(const std::string& key) const { return attrs.count(key) > 0; }
};

// Escape / unescape the five XML entities (plus numeric references on input).
std::string escape_markup(const std::string& s, bool in_attribute = false);
std::string unescape_markup(const std::string& s);

// Lenient parser: unbalanced closing tags are ignored, unclosed tags are
// closed at end of input. Never throws.
std::vector<Element> parse_elements(const std::string& markup);

// Flatten an element tree into segments. Formatting elements become text
// styles, unknown elements contribute their children.
Segments elements_to_segments(const std::vector<Element>& elements);

// Parse markup straight into segments.
Segments parse_markup(const std::string& markup);

// Serialize segments back to markup.
std::string dump_markup(const Segments& segments);

} // namespace mtsatori
