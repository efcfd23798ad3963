#pragma once
#include <string>
#include <vector>

namespace mtsatori {

// One atomic unit of gateway message content. Closed set of kinds; the
// codec is the single place that maps new native content onto them.
enum class SegmentKind {
    Text,
    At,
    Sharp,
    Image,
    Audio,
    Video,
    File,
    Quote,
    Location,
    Button,
};

const char* segment_kind_name(SegmentKind kind);

bool is_media(SegmentKind kind);

struct TextStyle {
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strikethrough = false;
    bool spoiler = false;
    bool code = false;
    bool pre = false;
    std::string href;       // text link target
    std::string language;   // pre block language

    bool plain() const {
        return !bold && !italic && !underline && !strikethrough && !spoiler &&
               !code && !pre && href.empty();
    }
    bool operator==(const TextStyle& o) const;
    bool operator!=(const TextStyle& o) const { return !(*this == o); }
};

struct Segment {
    SegmentKind kind = SegmentKind::Text;

    std::string text;        // Text content, At/Sharp display name, Button label,
                             // Quote author name
    TextStyle style;         // Text only
    std::string id;          // At user, Sharp channel, Quote message, Button callback id
    std::string src;         // media url
    std::string title;       // media file name
    bool spoiler = false;    // media
    double latitude = 0.0;   // Location
    double longitude = 0.0;
    std::string button_type; // "action", "link" or "input"
    std::string href;        // link button target
    std::string input;       // input button prefill
    std::string author_id;   // Quote: author of the quoted message
    std::vector<Segment> children;   // Quote: content of the quoted message

    // A quote is identified by the message it points at; author and
    // children only render that message.

    bool operator==(const Segment& o) const;
    bool operator!=(const Segment& o) const { return !(*this == o); }
};

using Segments = std::vector<Segment>;

namespace seg {

Segment text(std::string content, TextStyle style = {});
Segment at(std::string user_id, std::string name = {});
Segment sharp(std::string channel_id, std::string name = {});
Segment media(SegmentKind kind, std::string src, std::string title = {});
Segment quote(std::string message_id);
Segment location(double latitude, double longitude);
Segment button(std::string id, std::string label, std::string type = "action");

} // namespace seg

// Merge adjacent Text segments with equal style and drop empty ones.
// Two sequences are semantically equal when their normalized forms are.
Segments normalize_segments(const Segments& in);

bool semantically_equal(const Segments& a, const Segments& b);

// Plain text rendering (used for logs and diagnostics).
std::string plain_text(const Segments& segments);

} // namespace mtsatori
