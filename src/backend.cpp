#include "backend.hpp"

namespace mtsatori {

std::string NativeUser::display_name() const {
    if (last_name.empty()) return first_name;
    if (first_name.empty()) return last_name;
    return first_name + " " + last_name;
}

const char* update_kind_name(UpdateKind kind) {
    switch (kind) {
        case UpdateKind::NewMessage:           return "NewMessage";
        case UpdateKind::EditedMessage:        return "EditedMessage";
        case UpdateKind::DeletedMessage:       return "DeletedMessage";
        case UpdateKind::MemberJoined:         return "MemberJoined";
        case UpdateKind::MemberLeft:           return "MemberLeft";
        case UpdateKind::ReactionAdded:        return "ReactionAdded";
        case UpdateKind::ReactionRemoved:      return "ReactionRemoved";
        case UpdateKind::CallbackQuery:        return "CallbackQuery";
        case UpdateKind::Checkpoint:           return "Checkpoint";
        case UpdateKind::BacklogDrained:       return "BacklogDrained";
        case UpdateKind::ConnectionLost:       return "ConnectionLost";
        case UpdateKind::AuthorizationRevoked: return "AuthorizationRevoked";
        case UpdateKind::Unknown:              return "Unknown";
    }
    return "Unknown";
}

} // namespace mtsatori
