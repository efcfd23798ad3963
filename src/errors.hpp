#pragma once
#include <stdexcept>
#include <string>
#include <cstdint>

namespace mtsatori {

// Error categories surfaced to gateway callers. Native backend codes never
// leave the dispatcher; they are classified into one of these first.
enum class ErrorKind {
    InvalidIdentifier,
    InvalidReference,
    UnsupportedSegment,     // diagnostic only, never thrown
    NotFound,
    Forbidden,
    RateLimited,
    TransientTransportError,
    SessionTerminated,
    InternalError,
};

const char* error_kind_name(ErrorKind kind);

// HTTP status used by the gateway surface for a given kind.
int error_http_status(ErrorKind kind);

class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Raw failure reported by a backend RPC, before classification.
// code follows the backend's convention (TDLib: HTTP-like codes, 420/429
// flood wait, negative for local failures).
class BackendError : public std::runtime_error {
public:
    BackendError(int code, const std::string& message, uint32_t retry_after_sec = 0)
        : std::runtime_error(message), code_(code), retry_after_sec_(retry_after_sec) {}

    int code() const { return code_; }
    uint32_t retry_after_sec() const { return retry_after_sec_; }

private:
    int code_;
    uint32_t retry_after_sec_;
};

// Map a native backend failure to a gateway error kind.
ErrorKind classify_backend_error(int code, const std::string& message);

// Extract N from "FLOOD_WAIT_N" / "Too Many Requests: retry after N"; 0 if absent.
uint32_t parse_retry_after(const std::string& message);

// Non-fatal note attached to a result (e.g. a dropped segment).
struct Diagnostic {
    ErrorKind kind = ErrorKind::UnsupportedSegment;
    std::string detail;
};

} // namespace mtsatori
