#pragma once
#include "config.hpp"
#include "dispatcher.hpp"
#include "http_server.hpp"
#include "router.hpp"
#include <memory>
#include <string>

namespace mtsatori {

// HTTP surface of the gateway:
//
//   POST {path}/v1/{method}              JSON params -> JSON result
//   GET  {path}/v1/proxy/internal:...    native file bytes
//
// A configured token must be presented as "Authorization: Bearer <token>".
// The caller identity comes from the X-Platform / X-Self-ID headers (the
// Satori-Platform / Satori-User-ID spellings are accepted too).
class ApiServer {
public:
    ApiServer(const ServerConfig& config, ApiRouter& router, ActionDispatcher& dispatcher);
    ~ApiServer();

    // Socket-free entry point; the listener forwards every request here.
    ServerResponse handle(const HttpRequest& request);

    bool start(std::string& error);
    void stop();

private:
    bool authorized(const HttpRequest& request) const;
    ServerResponse call(const std::string& method, const HttpRequest& request);
    ServerResponse proxy(const std::string& url);

    const ServerConfig& config_;
    ApiRouter& router_;
    ActionDispatcher& dispatcher_;
    std::unique_ptr<HttpServer> server_;
};

} // namespace mtsatori
