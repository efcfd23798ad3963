#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace mtsatori {

// Telegram measures text and entity offsets in UTF-16 code units while the
// bridge stores UTF-8. These helpers convert between the two.

// Number of UTF-16 code units needed for a UTF-8 string.
size_t utf16_length(const std::string& utf8);

// Byte offset of the code point starting at the given UTF-16 offset.
// Offsets past the end clamp to utf8.size(); offsets inside a surrogate
// pair round up to the next code point.
size_t utf8_offset(const std::string& utf8, size_t utf16_offset);

// Substring addressed in UTF-16 units.
std::string utf16_substr(const std::string& utf8, size_t utf16_offset, size_t utf16_len);

struct TextChunk {
    std::string text;
    size_t offset = 0;  // UTF-16 offset in the original text
    size_t length = 0;  // UTF-16 length
};

// Split text into chunks of at most max_units UTF-16 units, preferring
// newline then space boundaries, never cutting a code point. Concatenating
// the chunks yields the input.
std::vector<TextChunk> split_text(const std::string& text, size_t max_units);

} // namespace mtsatori
