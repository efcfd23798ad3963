#include "ids.hpp"
#include "errors.hpp"

#include <charconv>

namespace mtsatori {

const char* scope_name(Scope scope) {
    switch (scope) {
        case Scope::User:    return "user";
        case Scope::Chat:    return "chat";
        case Scope::Channel: return "channel";
        case Scope::Message: return "message";
    }
    return "user";
}

static std::optional<Scope> scope_from_name(const std::string& name) {
    if (name == "user")    return Scope::User;
    if (name == "chat")    return Scope::Chat;
    if (name == "channel") return Scope::Channel;
    if (name == "message") return Scope::Message;
    return std::nullopt;
}

std::string encode_id(int64_t value, Scope scope) {
    return std::string(scope_name(scope)) + ":" + std::to_string(value);
}

std::optional<ScopedId> try_decode_id(const std::string& id) {
    auto colon = id.find(':');
    if (colon == std::string::npos) return std::nullopt;

    auto scope = scope_from_name(id.substr(0, colon));
    if (!scope) return std::nullopt;

    const char* first = id.data() + colon + 1;
    const char* last = id.data() + id.size();
    if (first == last) return std::nullopt;

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) return std::nullopt;

    // Only the canonical spelling round-trips ("007", "-0" are rejected).
    if (std::to_string(value) != std::string(first, last)) return std::nullopt;

    return ScopedId{value, *scope};
}

ScopedId decode_id(const std::string& id) {
    auto decoded = try_decode_id(id);
    if (!decoded) {
        throw BridgeError(ErrorKind::InvalidIdentifier, "Malformed identifier: '" + id + "'");
    }
    return *decoded;
}

int64_t decode_as(const std::string& id, Scope scope, const char* field) {
    auto decoded = try_decode_id(id);
    if (!decoded) {
        throw BridgeError(ErrorKind::InvalidReference,
                          std::string(field) + ": malformed identifier '" + id + "'");
    }
    if (decoded->scope != scope) {
        throw BridgeError(ErrorKind::InvalidReference,
                          std::string(field) + ": expected a " + scope_name(scope) +
                          " identifier, got '" + id + "'");
    }
    return decoded->value;
}

} // namespace mtsatori
