#include "router.hpp"

#include <algorithm>
#include <iostream>

namespace mtsatori {

std::string require_string(const nlohmann::json& params, const char* field) {
    if (!params.is_object() || !params.contains(field) || !params[field].is_string()) {
        throw BridgeError(ErrorKind::InvalidReference,
                          std::string("missing string field '") + field + "'");
    }
    return params[field].get<std::string>();
}

std::string optional_string(const nlohmann::json& params, const char* field) {
    if (!params.is_object() || !params.contains(field) || !params[field].is_string()) return "";
    return params[field].get<std::string>();
}

static ApiResult ok(nlohmann::json body) {
    ApiResult r;
    r.body = std::move(body);
    return r;
}

ApiRouter::ApiRouter(ActionDispatcher& dispatcher, EventBus& bus)
    : dispatcher_(dispatcher), bus_(bus) {
    ActionDispatcher& d = dispatcher_;

    routes_["login.get"] = [&d](const nlohmann::json&) {
        return ok(login_to_json(d.login_get()));
    };

    routes_["user.get"] = [&d](const nlohmann::json& p) {
        return ok(user_to_json(d.user_get(require_string(p, "user_id"))));
    };
    routes_["user.channel.create"] = [&d](const nlohmann::json& p) {
        return ok(channel_to_json(d.user_channel_create(require_string(p, "user_id"))));
    };

    routes_["channel.get"] = [&d](const nlohmann::json& p) {
        return ok(channel_to_json(d.channel_get(require_string(p, "channel_id"))));
    };
    routes_["channel.list"] = [&d](const nlohmann::json& p) {
        auto page = d.channel_list(require_string(p, "guild_id"), optional_string(p, "next"));
        return ok(page_to_json(page.items, page.next, channel_to_json));
    };

    routes_["guild.get"] = [&d](const nlohmann::json& p) {
        return ok(guild_to_json(d.guild_get(require_string(p, "guild_id"))));
    };
    routes_["guild.list"] = [&d](const nlohmann::json& p) {
        auto page = d.guild_list(optional_string(p, "next"));
        return ok(page_to_json(page.items, page.next, guild_to_json));
    };
    routes_["guild.member.get"] = [&d](const nlohmann::json& p) {
        return ok(member_to_json(d.guild_member_get(require_string(p, "guild_id"),
                                                    require_string(p, "user_id"))));
    };
    routes_["guild.member.list"] = [&d](const nlohmann::json& p) {
        auto page = d.guild_member_list(require_string(p, "guild_id"),
                                        optional_string(p, "next"));
        return ok(page_to_json(page.items, page.next, member_to_json));
    };

    routes_["message.create"] = [&d](const nlohmann::json& p) {
        CreateResult created = d.message_create(require_string(p, "channel_id"),
                                                require_string(p, "content"));
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& m : created.messages) arr.push_back(message_to_json(m));
        ApiResult r = ok(std::move(arr));
        r.diagnostics = std::move(created.diagnostics);
        return r;
    };
    routes_["message.get"] = [&d](const nlohmann::json& p) {
        return ok(message_to_json(d.message_get(require_string(p, "channel_id"),
                                                require_string(p, "message_id"))));
    };
    routes_["message.update"] = [&d](const nlohmann::json& p) {
        ApiResult r = ok(nlohmann::json::object());
        r.diagnostics = d.message_update(require_string(p, "channel_id"),
                                         require_string(p, "message_id"),
                                         require_string(p, "content"));
        return r;
    };
    routes_["message.delete"] = [&d](const nlohmann::json& p) {
        d.message_delete(require_string(p, "channel_id"), require_string(p, "message_id"));
        return ok(nlohmann::json::object());
    };
    routes_["message.list"] = [&d](const nlohmann::json& p) {
        auto page = d.message_list(require_string(p, "channel_id"), optional_string(p, "next"));
        return ok(page_to_json(page.items, page.next, message_to_json));
    };
}

std::vector<std::string> ApiRouter::methods() const {
    std::vector<std::string> out;
    out.reserve(routes_.size());
    for (const auto& kv : routes_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

void ApiRouter::check_caller(const CallerIdentity& caller) const {
    if (!caller.platform.empty() && caller.platform != kPlatform) {
        throw BridgeError(ErrorKind::NotFound, "unknown platform '" + caller.platform + "'");
    }
    if (caller.self_id.empty()) return;
    SatoriLogin login = dispatcher_.login_get();
    if (!login.user || login.user->id != caller.self_id) {
        throw BridgeError(ErrorKind::NotFound, "unknown login '" + caller.self_id + "'");
    }
}

ApiResult ApiRouter::failure(const std::string& method, ErrorKind kind,
                             const std::string& message) {
    std::cerr << "[api] " << method << " failed: " << error_kind_name(kind)
              << ": " << message << "\n";

    ActionFailedEvent ev;
    ev.method = method;
    ev.kind = error_kind_name(kind);
    ev.message = message;
    bus_.publish(ev);

    ApiResult r;
    r.status = error_http_status(kind);
    r.body = {{"error", error_kind_name(kind)}, {"message", message}};
    return r;
}

ApiResult ApiRouter::handle(const std::string& method, const nlohmann::json& params,
                            const CallerIdentity& caller) {
    auto it = routes_.find(method);
    if (it == routes_.end()) {
        return failure(method, ErrorKind::NotFound, "unknown method '" + method + "'");
    }
    try {
        check_caller(caller);
        return it->second(params);
    } catch (const BridgeError& e) {
        return failure(method, e.kind(), e.what());
    } catch (const nlohmann::json::exception& e) {
        return failure(method, ErrorKind::InvalidReference, e.what());
    } catch (const std::exception& e) {
        return failure(method, ErrorKind::InternalError, e.what());
    }
}

} // namespace mtsatori
