#include "text.hpp"

namespace mtsatori {

namespace {

// Byte length of the UTF-8 sequence starting with lead byte c.
// Invalid lead bytes are treated as single-byte code points.
size_t sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

// Code point boundaries: bytes[i] / units[i] are the byte and UTF-16 offsets
// of code point i; the final entry is the end of the string.
struct Boundaries {
    std::vector<size_t> bytes;
    std::vector<size_t> units;
};

Boundaries index_code_points(const std::string& s) {
    Boundaries b;
    size_t byte = 0;
    size_t unit = 0;
    while (byte < s.size()) {
        b.bytes.push_back(byte);
        b.units.push_back(unit);
        size_t len = sequence_length(static_cast<unsigned char>(s[byte]));
        if (byte + len > s.size()) len = s.size() - byte;
        unit += (len == 4) ? 2 : 1;
        byte += len;
    }
    b.bytes.push_back(s.size());
    b.units.push_back(unit);
    return b;
}

} // namespace

size_t utf16_length(const std::string& utf8) {
    size_t units = 0;
    size_t i = 0;
    while (i < utf8.size()) {
        size_t len = sequence_length(static_cast<unsigned char>(utf8[i]));
        units += (len == 4 && i + len <= utf8.size()) ? 2 : 1;
        i += len;
    }
    return units;
}

size_t utf8_offset(const std::string& utf8, size_t utf16_offset) {
    size_t units = 0;
    size_t i = 0;
    while (i < utf8.size() && units < utf16_offset) {
        size_t len = sequence_length(static_cast<unsigned char>(utf8[i]));
        units += (len == 4 && i + len <= utf8.size()) ? 2 : 1;
        i += len;
    }
    return i < utf8.size() ? i : utf8.size();
}

std::string utf16_substr(const std::string& utf8, size_t utf16_offset, size_t utf16_len) {
    size_t begin = utf8_offset(utf8, utf16_offset);
    size_t end = utf8_offset(utf8, utf16_offset + utf16_len);
    if (end < begin) end = begin;
    return utf8.substr(begin, end - begin);
}

std::vector<TextChunk> split_text(const std::string& text, size_t max_units) {
    std::vector<TextChunk> chunks;
    if (text.empty() || max_units == 0) return chunks;

    Boundaries b = index_code_points(text);
    const size_t count = b.bytes.size() - 1; // number of code points
    size_t i = 0;

    while (i < count) {
        size_t end = count;
        if (b.units[count] - b.units[i] > max_units) {
            // Furthest code point boundary that still fits
            size_t fit = i;
            while (fit < count && b.units[fit + 1] - b.units[i] <= max_units) ++fit;
            if (fit == i) fit = i + 1; // single code point wider than max_units

            end = fit;
            // Prefer splitting after a newline, then after a space
            bool found = false;
            for (size_t k = fit; k > i + 1 && !found; --k) {
                if (text[b.bytes[k] - 1] == '\n') { end = k; found = true; }
            }
            for (size_t k = fit; k > i + 1 && !found; --k) {
                if (text[b.bytes[k] - 1] == ' ') { end = k; found = true; }
            }
        }

        TextChunk chunk;
        chunk.text = text.substr(b.bytes[i], b.bytes[end] - b.bytes[i]);
        chunk.offset = b.units[i];
        chunk.length = b.units[end] - b.units[i];
        chunks.push_back(std::move(chunk));
        i = end;
    }

    return chunks;
}

} // namespace mtsatori
