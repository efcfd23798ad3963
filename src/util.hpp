#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace mtsatori {

// Unix epoch milliseconds (gateway event timestamps)
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lower-case
std::string to_lower(std::string s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to a temp file and rename over path; creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Standard base64 (RFC 4648). decode returns nullopt on invalid input.
std::string base64_encode(const std::string& data);
std::optional<std::string> base64_decode(const std::string& data);

// Guess a MIME type from a file name extension; "application/octet-stream"
// when unknown.
std::string guess_mime(const std::string& filename);

// File extension (with dot) for a MIME type; ".bin" when unknown.
std::string extension_for_mime(const std::string& mime);

} // namespace mtsatori
