#include "api_server.hpp"
#include "util.hpp"

#include <iostream>

namespace mtsatori {

static ServerResponse json_response(int status, const nlohmann::json& body) {
    ServerResponse r;
    r.status = status;
    r.content_type = "application/json";
    r.body = body.dump();
    return r;
}

static ServerResponse error_response(ErrorKind kind, const std::string& message) {
    return json_response(error_http_status(kind),
                         {{"error", error_kind_name(kind)}, {"message", message}});
}

ApiServer::ApiServer(const ServerConfig& config, ApiRouter& router, ActionDispatcher& dispatcher)
    : config_(config), router_(router), dispatcher_(dispatcher) {}

ApiServer::~ApiServer() {
    stop();
}

bool ApiServer::start(std::string& error) {
    server_ = std::make_unique<HttpServer>(
        config_.listen, config_.max_body,
        [this](const HttpRequest& req) { return handle(req); });
    if (!server_->start(error)) {
        server_.reset();
        return false;
    }
    std::cerr << "[api] listening on " << config_.listen << config_.path << "/v1\n";
    return true;
}

void ApiServer::stop() {
    if (server_) {
        server_->stop();
        server_.reset();
    }
}

bool ApiServer::authorized(const HttpRequest& request) const {
    if (config_.token.empty()) return true;
    return request.header("authorization") == "Bearer " + config_.token;
}

ServerResponse ApiServer::handle(const HttpRequest& request) {
    const std::string prefix = config_.path + "/v1/";
    if (request.path.compare(0, prefix.size(), prefix) != 0) {
        return error_response(ErrorKind::NotFound, "no route for " + request.path);
    }
    std::string rest = request.path.substr(prefix.size());

    if (!authorized(request)) {
        return json_response(401, {{"error", "Unauthorized"},
                                   {"message", "missing or invalid token"}});
    }

    const std::string proxy_prefix = "proxy/";
    if (rest.compare(0, proxy_prefix.size(), proxy_prefix) == 0) {
        if (request.method != "GET") {
            return json_response(405, {{"error", "MethodNotAllowed"},
                                       {"message", "proxy accepts GET only"}});
        }
        return proxy(rest.substr(proxy_prefix.size()));
    }

    if (request.method != "POST") {
        return json_response(405, {{"error", "MethodNotAllowed"},
                                   {"message", "actions accept POST only"}});
    }
    return call(rest, request);
}

ServerResponse ApiServer::call(const std::string& method, const HttpRequest& request) {
    nlohmann::json params = nlohmann::json::object();
    if (!trim(request.body).empty()) {
        params = nlohmann::json::parse(request.body, nullptr, false);
        if (params.is_discarded() || !params.is_object()) {
            return error_response(ErrorKind::InvalidReference, "body is not a JSON object");
        }
    }

    CallerIdentity caller;
    caller.platform = request.header("x-platform");
    if (caller.platform.empty()) caller.platform = request.header("satori-platform");
    caller.self_id = request.header("x-self-id");
    if (caller.self_id.empty()) caller.self_id = request.header("satori-user-id");

    ApiResult result = router_.handle(method, params, caller);
    return json_response(result.status, result.body);
}

ServerResponse ApiServer::proxy(const std::string& url) {
    try {
        FetchedMedia media = dispatcher_.download(url);
        ServerResponse r;
        r.content_type = media.mime;
        r.body = std::move(media.data);
        return r;
    } catch (const BridgeError& e) {
        std::cerr << "[api] proxy " << url << " failed: " << e.what() << "\n";
        return error_response(e.kind(), e.what());
    }
}

} // namespace mtsatori
