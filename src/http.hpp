#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace mtsatori {

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;        // 0: connection or protocol failure
    std::string body;
    std::string content_type;    // lowercased, parameters stripped
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;

    // max_body: stop reading and fail (status 0) once the body exceeds
    // this many bytes; 0 means unbounded.
    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30,
                             size_t max_body = 0) = 0;
};

// POSIX sockets + OpenSSL
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30,
                     size_t max_body = 0) override;
};

} // namespace mtsatori
