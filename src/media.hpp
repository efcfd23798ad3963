#pragma once
#include "http.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace mtsatori {

struct FetchedMedia {
    std::string data;
    std::string name;
    std::string mime;
};

// Resolves outgoing media urls to bytes for upload: "data:<mime>;base64,...",
// "file:" paths and http(s) urls. Anything larger than max_bytes is refused.
class MediaFetcher {
public:
    MediaFetcher(HttpClient& http, uint64_t max_bytes, long timeout_seconds)
        : http_(http), max_bytes_(max_bytes), timeout_seconds_(timeout_seconds) {}

    // nullopt with error set when the url cannot be resolved.
    std::optional<FetchedMedia> fetch(const std::string& url, const std::string& name,
                                      std::string& error) const;

    uint64_t max_bytes() const { return max_bytes_; }

private:
    std::optional<FetchedMedia> fetch_data(const std::string& url, std::string& error) const;
    std::optional<FetchedMedia> fetch_file(const std::string& url, std::string& error) const;
    std::optional<FetchedMedia> fetch_http(const std::string& url, std::string& error) const;

    HttpClient& http_;
    uint64_t max_bytes_;
    long timeout_seconds_;
};

} // namespace mtsatori
