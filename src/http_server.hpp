#pragma once
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <thread>
#include <cstdint>

namespace mtsatori {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // URL-decoded, without the query string
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;

    // Return a header value (name in lower case), or "" if absent.
    std::string header(const std::string& name) const;
};

struct ServerResponse {
    int         status       = 200;
    std::string content_type = "text/plain";
    std::string body;
};

// Minimal single-threaded TCP HTTP server for the gateway API. Meant for a
// loopback address or to sit behind a reverse proxy. Handles one connection
// at a time; the accept loop runs in a background thread.
class HttpServer {
public:
    using Handler = std::function<ServerResponse(const HttpRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:5140"
    // max_body:    maximum request body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Signal the accept thread to stop and join it.
    void stop();

private:
    void accept_loop();
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Percent-decoding; '+' becomes a space only when plus_as_space is set.
std::string url_decode(const std::string& s, bool plus_as_space = true);

} // namespace mtsatori
