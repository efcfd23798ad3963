#include "media.hpp"
#include "util.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace mtsatori {

std::optional<FetchedMedia> MediaFetcher::fetch(const std::string& url, const std::string& name,
                                                std::string& error) const {
    std::optional<FetchedMedia> media;
    if (url.rfind("data:", 0) == 0) {
        media = fetch_data(url, error);
    } else if (url.rfind("file:", 0) == 0) {
        media = fetch_file(url, error);
    } else if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0) {
        media = fetch_http(url, error);
    } else {
        error = "unsupported media url scheme";
        return std::nullopt;
    }
    if (!media) return std::nullopt;

    if (!name.empty()) media->name = name;
    // "image/gif; charset=binary" -> "image/gif"
    media->mime = to_lower(trim(media->mime.substr(0, media->mime.find(';'))));
    if (media->mime.empty()) media->mime = guess_mime(media->name);
    if (media->name.empty()) media->name = "file" + extension_for_mime(media->mime);
    return media;
}

std::optional<FetchedMedia> MediaFetcher::fetch_data(const std::string& url,
                                                     std::string& error) const {
    // data:<mime>;base64,<payload>
    auto comma = url.find(',');
    if (comma == std::string::npos) {
        error = "malformed data url";
        return std::nullopt;
    }
    std::string header = url.substr(5, comma - 5);
    const std::string marker = ";base64";
    if (header.size() < marker.size() ||
        header.compare(header.size() - marker.size(), marker.size(), marker) != 0) {
        error = "data url is not base64 encoded";
        return std::nullopt;
    }
    // Decoded size is at most 3/4 of the payload
    if ((url.size() - comma - 1) / 4 * 3 > max_bytes_ + 3) {
        error = "media exceeds " + std::to_string(max_bytes_) + " bytes";
        return std::nullopt;
    }
    auto decoded = base64_decode(url.substr(comma + 1));
    if (!decoded) {
        error = "invalid base64 payload";
        return std::nullopt;
    }
    if (decoded->size() > max_bytes_) {
        error = "media exceeds " + std::to_string(max_bytes_) + " bytes";
        return std::nullopt;
    }

    FetchedMedia media;
    media.data = std::move(*decoded);
    media.mime = to_lower(header.substr(0, header.size() - marker.size()));
    return media;
}

std::optional<FetchedMedia> MediaFetcher::fetch_file(const std::string& url,
                                                     std::string& error) const {
    // file:///abs/path, file:/abs/path or file:relative
    std::string path = url.substr(5);
    if (path.rfind("//", 0) == 0) {
        auto slash = path.find('/', 2);
        path = (slash == std::string::npos) ? std::string() : path.substr(slash);
    }
    path = replace_all(path, "%20", " ");

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        error = "cannot read " + path + ": " + ec.message();
        return std::nullopt;
    }
    if (size > max_bytes_) {
        error = "media exceeds " + std::to_string(max_bytes_) + " bytes";
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        error = "cannot open " + path;
        return std::nullopt;
    }
    std::ostringstream buf;
    buf << in.rdbuf();

    FetchedMedia media;
    media.data = buf.str();
    media.name = std::filesystem::path(path).filename().string();
    return media;
}

std::optional<FetchedMedia> MediaFetcher::fetch_http(const std::string& url,
                                                     std::string& error) const {
    auto resp = http_.get(url, {}, timeout_seconds_, static_cast<size_t>(max_bytes_));
    if (resp.status_code == 0) {
        error = "download failed or exceeded " + std::to_string(max_bytes_) + " bytes";
        return std::nullopt;
    }
    if (resp.status_code < 200 || resp.status_code >= 300) {
        error = "download returned HTTP " + std::to_string(resp.status_code);
        return std::nullopt;
    }
    if (resp.body.size() > max_bytes_) {
        error = "media exceeds " + std::to_string(max_bytes_) + " bytes";
        return std::nullopt;
    }

    FetchedMedia media;
    media.data = std::move(resp.body);
    media.mime = resp.content_type;

    std::string path = url.substr(0, url.find_first_of("?#"));
    auto slash = path.rfind('/');
    if (slash != std::string::npos && slash + 1 < path.size() &&
        path.find("://") + 2 != slash) {
        media.name = path.substr(slash + 1);
    }
    return media;
}

} // namespace mtsatori
