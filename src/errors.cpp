#include "errors.hpp"
#include "util.hpp"

#include <cctype>

namespace mtsatori {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidIdentifier:       return "InvalidIdentifier";
        case ErrorKind::InvalidReference:        return "InvalidReference";
        case ErrorKind::UnsupportedSegment:      return "UnsupportedSegment";
        case ErrorKind::NotFound:                return "NotFound";
        case ErrorKind::Forbidden:               return "Forbidden";
        case ErrorKind::RateLimited:             return "RateLimited";
        case ErrorKind::TransientTransportError: return "TransientTransportError";
        case ErrorKind::SessionTerminated:       return "SessionTerminated";
        case ErrorKind::InternalError:           return "InternalError";
    }
    return "InternalError";
}

int error_http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidIdentifier:
        case ErrorKind::InvalidReference:
        case ErrorKind::UnsupportedSegment:      return 400;
        case ErrorKind::NotFound:                return 404;
        case ErrorKind::Forbidden:               return 403;
        case ErrorKind::RateLimited:             return 429;
        case ErrorKind::TransientTransportError:
        case ErrorKind::SessionTerminated:       return 503;
        case ErrorKind::InternalError:           return 500;
    }
    return 500;
}

uint32_t parse_retry_after(const std::string& message) {
    static const char* markers[] = {"FLOOD_WAIT_", "retry after "};
    for (const char* marker : markers) {
        auto pos = message.find(marker);
        if (pos == std::string::npos) continue;
        pos += std::char_traits<char>::length(marker);
        uint32_t value = 0;
        bool any = false;
        while (pos < message.size() && std::isdigit(static_cast<unsigned char>(message[pos]))) {
            value = value * 10 + static_cast<uint32_t>(message[pos] - '0');
            any = true;
            ++pos;
        }
        if (any) return value;
    }
    return 0;
}

ErrorKind classify_backend_error(int code, const std::string& message) {
    std::string upper = message;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    if (code == 420 || code == 429 || upper.find("FLOOD_WAIT") != std::string::npos ||
        upper.find("TOO MANY REQUESTS") != std::string::npos) {
        return ErrorKind::RateLimited;
    }
    if (code == 401 || upper.find("AUTH_KEY_UNREGISTERED") != std::string::npos ||
        upper.find("SESSION_REVOKED") != std::string::npos) {
        return ErrorKind::SessionTerminated;
    }
    if (code == 403) return ErrorKind::Forbidden;
    if (code == 404) return ErrorKind::NotFound;
    if (code == 400) {
        if (upper.find("NOT FOUND") != std::string::npos ||
            upper.find("_INVALID") != std::string::npos ||
            upper.find("NOT_FOUND") != std::string::npos) {
            return ErrorKind::NotFound;
        }
        if (upper.find("FORBIDDEN") != std::string::npos ||
            upper.find("RIGHTS") != std::string::npos ||
            upper.find("NOT ENOUGH") != std::string::npos) {
            return ErrorKind::Forbidden;
        }
        return ErrorKind::InternalError;
    }
    // TDLib reports timeouts and dropped requests as 5xx or negative codes.
    if (code < 0 || code >= 500) return ErrorKind::TransientTransportError;
    return ErrorKind::InternalError;
}

} // namespace mtsatori
