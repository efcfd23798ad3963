#pragma once
#include "dispatcher.hpp"
#include "event_bus.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace mtsatori {

// Who a gateway call claims to address. Empty fields are not checked.
struct CallerIdentity {
    std::string platform;
    std::string self_id;
};

struct ApiResult {
    int status = 200;
    nlohmann::json body;
    std::vector<Diagnostic> diagnostics;
};

// Maps gateway method names ("message.create", ...) onto the dispatcher.
// Every failure comes back as {"error": <kind>, "message": ...} with the
// status of its kind and is announced on the bus as ActionFailedEvent.
class ApiRouter {
public:
    ApiRouter(ActionDispatcher& dispatcher, EventBus& bus);

    ApiResult handle(const std::string& method, const nlohmann::json& params,
                     const CallerIdentity& caller);

    bool has_method(const std::string& method) const { return routes_.count(method) > 0; }
    std::vector<std::string> methods() const;

private:
    using Route = std::function<ApiResult(const nlohmann::json&)>;

    void check_caller(const CallerIdentity& caller) const;
    ApiResult failure(const std::string& method, ErrorKind kind, const std::string& message);

    ActionDispatcher& dispatcher_;
    EventBus& bus_;
    std::unordered_map<std::string, Route> routes_;
};

// Required string field; throws BridgeError(InvalidReference) when missing.
std::string require_string(const nlohmann::json& params, const char* field);

// Optional string field; "" when missing or not a string.
std::string optional_string(const nlohmann::json& params, const char* field);

} // namespace mtsatori
