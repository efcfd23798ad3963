#pragma once
#include <string>
#include <cstdint>
#include <optional>

namespace mtsatori {

// Entity category a backend identifier is valid within.
enum class Scope { User, Chat, Channel, Message };

const char* scope_name(Scope scope);

struct ScopedId {
    int64_t value = 0;
    Scope scope = Scope::User;

    bool operator==(const ScopedId& o) const { return value == o.value && scope == o.scope; }
    bool operator!=(const ScopedId& o) const { return !(*this == o); }
};

// Gateway identifiers are "<scope>:<decimal>", e.g. "chat:-1001234".
// encode is pure and injective; decode inverts it and rejects anything
// encode could not have produced (unknown prefix, non-canonical digits).
std::string encode_id(int64_t value, Scope scope);

// Throws BridgeError(InvalidIdentifier) on malformed input.
ScopedId decode_id(const std::string& id);

std::optional<ScopedId> try_decode_id(const std::string& id);

// Decode and require a scope. Malformed input and scope mismatch both
// throw BridgeError(InvalidReference) naming the offending field.
int64_t decode_as(const std::string& id, Scope scope, const char* field);

} // namespace mtsatori
