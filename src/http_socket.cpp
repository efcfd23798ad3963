// HTTP/HTTPS client over POSIX sockets + OpenSSL. One connection per
// request, "Connection: close", chunked and content-length bodies.

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace mtsatori {

static const std::atomic<bool>* g_abort_flag = nullptr;

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_abort_flag = flag;
}

static bool aborted() {
    return g_abort_flag && g_abort_flag->load(std::memory_order_relaxed);
}

// ── URL ─────────────────────────────────────────────────────────

struct Url {
    bool https = false;
    std::string host;     // without brackets
    std::string port;
    std::string target;   // path and query, always starts with '/'
};

static bool split_url(const std::string& text, Url& url) {
    auto sep = text.find("://");
    if (sep == std::string::npos) return false;
    std::string scheme = text.substr(0, sep);
    if (scheme == "https") url.https = true;
    else if (scheme != "http") return false;

    auto authority_begin = sep + 3;
    auto target_begin = text.find_first_of("/?#", authority_begin);
    std::string authority = text.substr(authority_begin, target_begin - authority_begin);
    if (target_begin == std::string::npos) {
        url.target = "/";
    } else {
        url.target = text.substr(target_begin, text.find('#', target_begin) - target_begin);
        if (url.target.empty() || url.target[0] != '/') url.target.insert(0, "/");
    }

    url.port = url.https ? "443" : "80";
    if (!authority.empty() && authority[0] == '[') {
        // [v6addr]:port
        auto close = authority.find(']');
        if (close == std::string::npos) return false;
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return false;
            url.port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) url.port = authority.substr(colon + 1);
    }
    return !url.host.empty() && !url.port.empty();
}

// ── Transport ───────────────────────────────────────────────────

using Clock = std::chrono::steady_clock;

// Wait until fd is ready for events; false on timeout, abort or error.
static bool wait_fd(int fd, short events, Clock::time_point deadline) {
    for (;;) {
        if (aborted()) return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (left <= 0) return false;
        struct pollfd pfd{fd, events, 0};
        // Wake at least once a second to look at the abort flag.
        int rc = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left, 1000)));
        if (rc > 0) return true;
        if (rc < 0 && errno != EINTR) return false;
    }
}

// Non-blocking TCP connect trying each resolved address in turn.
// Returns the connected (still non-blocking) socket or -1.
static int connect_tcp(const Url& url, Clock::time_point deadline) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* found = nullptr;
    if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &found) != 0) return -1;
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addrs(found, freeaddrinfo);

    for (auto* ai = addrs.get(); ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) continue;
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

        bool ok = ::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
        if (!ok && errno == EINPROGRESS && wait_fd(fd, POLLOUT, deadline)) {
            int err = 0;
            socklen_t len = sizeof(err);
            ok = getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0;
        }
        if (ok) return fd;
        ::close(fd);
    }
    return -1;
}

static std::string tls_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

// One request's connection. Every operation gives up at the deadline or
// when the abort flag is raised.
class Transport {
public:
    explicit Transport(Clock::time_point deadline) : deadline_(deadline) {}
    ~Transport() {
        if (ssl_) SSL_shutdown(ssl_.get());
        ssl_.reset();
        if (fd_ >= 0) ::close(fd_);
    }

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    bool open(const Url& url) {
        fd_ = connect_tcp(url, deadline_);
        if (fd_ < 0) return false;
        return !url.https || start_tls(url.host);
    }

    // >0 bytes read, 0 on orderly close, -1 on failure.
    long recv(char* buf, size_t len) {
        for (;;) {
            if (ssl_) {
                int n = SSL_read(ssl_.get(), buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl_.get(), n);
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                // Peer closed without close_notify
                if (err == SSL_ERROR_SYSCALL && n == 0) return 0;
                if (!retry(err)) return -1;
            } else {
                ssize_t n = ::recv(fd_, buf, len, 0);
                if (n >= 0) return static_cast<long>(n);
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) return -1;
                if (!wait_fd(fd_, POLLIN, deadline_)) return -1;
            }
        }
    }

    bool send_all(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            size_t chunk = data.size() - sent;
            if (ssl_) {
                int n = SSL_write(ssl_.get(), data.data() + sent, static_cast<int>(chunk));
                if (n > 0) {
                    sent += static_cast<size_t>(n);
                    continue;
                }
                if (!retry(SSL_get_error(ssl_.get(), n))) return false;
            } else {
                ssize_t n = ::send(fd_, data.data() + sent, chunk, MSG_NOSIGNAL);
                if (n >= 0) {
                    sent += static_cast<size_t>(n);
                    continue;
                }
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) return false;
                if (!wait_fd(fd_, POLLOUT, deadline_)) return false;
            }
        }
        return true;
    }

private:
    struct CtxFree { void operator()(SSL_CTX* c) const { SSL_CTX_free(c); } };
    struct SslFree { void operator()(SSL* s) const { SSL_free(s); } };

    bool start_tls(const std::string& host) {
        ctx_.reset(SSL_CTX_new(TLS_client_method()));
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_.get());
        SSL_CTX_set_min_proto_version(ctx_.get(), TLS1_2_VERSION);

        ssl_.reset(SSL_new(ctx_.get()));
        if (!ssl_) return false;
        SSL_set_fd(ssl_.get(), fd_);
        SSL_set_tlsext_host_name(ssl_.get(), host.c_str());
        SSL_set1_host(ssl_.get(), host.c_str());

        for (;;) {
            int rc = SSL_connect(ssl_.get());
            if (rc == 1) return true;
            if (!retry(SSL_get_error(ssl_.get(), rc))) {
                std::cerr << "[http] TLS handshake with " << host << " failed: "
                          << tls_error() << "\n";
                ssl_.reset();
                return false;
            }
        }
    }

    // Wait for the socket when OpenSSL asks for more I/O.
    bool retry(int ssl_error) {
        if (ssl_error == SSL_ERROR_WANT_READ) return wait_fd(fd_, POLLIN, deadline_);
        if (ssl_error == SSL_ERROR_WANT_WRITE) return wait_fd(fd_, POLLOUT, deadline_);
        return false;
    }

    Clock::time_point deadline_;
    int fd_ = -1;
    std::unique_ptr<SSL_CTX, CtxFree> ctx_;
    std::unique_ptr<SSL, SslFree> ssl_;
};

// ── Request ─────────────────────────────────────────────────────

static std::string format_request(const std::string& method, const Url& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string out = method + " " + url.target + " HTTP/1.1\r\n";
    out += "Host: " + (url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host);
    if (url.port != (url.https ? "443" : "80")) out += ":" + url.port;
    out += "\r\n";

    bool length_given = false;
    for (const auto& [name, value] : headers) {
        out += name + ": " + value + "\r\n";
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "content-length") length_given = true;
    }
    if (method == "POST" && !length_given) {
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

// ── Response ────────────────────────────────────────────────────

// Buffered reader over a Transport. Every method returns false on a
// truncated, malformed or oversized response.
class ResponseReader {
public:
    ResponseReader(Transport& transport, size_t max_body)
        : transport_(transport), max_body_(max_body) {}

    bool read_head(HttpResponse& resp, bool& chunked, long long& length) {
        std::string status;
        if (!line(status)) return false;
        // "HTTP/1.1 200 OK"
        auto space = status.find(' ');
        if (status.compare(0, 5, "HTTP/") != 0 || space == std::string::npos) return false;
        char* end = nullptr;
        long code = std::strtol(status.c_str() + space + 1, &end, 10);
        if (end == status.c_str() + space + 1 || code < 100 || code > 999) return false;
        resp.status_code = code;

        chunked = false;
        length = -1;
        std::string header;
        while (line(header)) {
            if (header.empty()) return true;
            auto colon = header.find(':');
            if (colon == std::string::npos) continue;
            std::string name = lower(header.substr(0, colon));
            std::string value = lower(trim_ows(header.substr(colon + 1)));
            if (name == "transfer-encoding") {
                chunked = value.find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                length = std::strtoll(value.c_str(), nullptr, 10);
            } else if (name == "content-type") {
                resp.content_type = lower(trim_ows(value.substr(0, value.find(';'))));
            }
        }
        return false;
    }

    bool read_body(bool chunked, long long length, std::string& body) {
        if (chunked) {
            std::string size_line;
            while (line(size_line)) {
                // hex size, optionally followed by ";extensions"
                size_t size = std::strtoul(size_line.c_str(), nullptr, 16);
                if (size == 0) return true;
                if (!exact(size, body)) return false;
                std::string crlf;
                if (!exact(2, crlf)) return false;
            }
            return false;
        }
        if (length >= 0) return exact(static_cast<size_t>(length), body);

        // No framing: the body runs until the server closes.
        body.swap(buffer_);
        buffer_.clear();
        if (oversized(body.size())) return false;
        char chunk[4096];
        for (;;) {
            long n = transport_.recv(chunk, sizeof(chunk));
            if (n == 0) return true;
            if (n < 0) return false;
            body.append(chunk, static_cast<size_t>(n));
            if (oversized(body.size())) return false;
        }
    }

private:
    static std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    static std::string trim_ows(const std::string& s) {
        auto begin = s.find_first_not_of(" \t");
        if (begin == std::string::npos) return "";
        return s.substr(begin, s.find_last_not_of(" \t") - begin + 1);
    }

    bool oversized(size_t n) const { return max_body_ > 0 && n > max_body_; }

    bool fill() {
        char chunk[4096];
        long n = transport_.recv(chunk, sizeof(chunk));
        if (n <= 0) return false;
        buffer_.append(chunk, static_cast<size_t>(n));
        return true;
    }

    bool line(std::string& out) {
        size_t nl;
        while ((nl = buffer_.find('\n')) == std::string::npos) {
            if (buffer_.size() > 65536 || !fill()) return false;
        }
        out.assign(buffer_, 0, nl);
        buffer_.erase(0, nl + 1);
        if (!out.empty() && out.back() == '\r') out.pop_back();
        return true;
    }

    // Append n more body bytes to out.
    bool exact(size_t n, std::string& out) {
        if (oversized(out.size() + n)) return false;
        while (buffer_.size() < n) {
            if (!fill()) return false;
        }
        out.append(buffer_, 0, n);
        buffer_.erase(0, n);
        return true;
    }

    Transport& transport_;
    size_t max_body_;
    std::string buffer_;
};

static HttpResponse perform(const std::string& method, const std::string& target,
                            const std::string& body, const std::vector<Header>& headers,
                            long timeout_seconds, size_t max_body) {
    Url url;
    if (!split_url(target, url)) {
        std::cerr << "[http] unsupported url: " << target << "\n";
        return {};
    }

    Transport transport(Clock::now() + std::chrono::seconds(std::max(timeout_seconds, 1L)));
    if (!transport.open(url)) return {};
    if (!transport.send_all(format_request(method, url, body, headers))) return {};

    ResponseReader reader(transport, max_body);
    HttpResponse resp;
    bool chunked = false;
    long long length = -1;
    if (!reader.read_head(resp, chunked, length)) return {};
    if (!reader.read_body(chunked, length, resp.body)) return {};
    return resp;
}

// ── SocketHttpClient ────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return perform("POST", url, body, headers, timeout_seconds, 0);
}

HttpResponse SocketHttpClient::get(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds,
                                   size_t max_body) {
    return perform("GET", url, "", headers, timeout_seconds, max_body);
}

} // namespace mtsatori
