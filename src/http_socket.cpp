// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl): http_init/cleanup
// are no-ops (OpenSSL 1.1+ auto-inits). Every request honours an overall
// deadline of timeout_seconds; a request that runs past it yields status 0.
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

namespace hybridllm {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

using Clock = std::chrono::steady_clock;

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static std::optional<ParsedUrl> parse_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    ParsedUrl result;
    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return std::nullopt;
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    if (host_port.empty()) return std::nullopt;

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

class Connection {
public:
    explicit Connection(Clock::time_point deadline) : deadline_(deadline) {}
    ~Connection() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd_ < 0) continue;
            connected = connect_nonblocking(ai);
            if (!connected) { ::close(fd_); fd_ = -1; }
        }
        freeaddrinfo(res);
        if (!connected) return false;

        if (url.tls) {
            set_socket_timeout(std::max<long>(1, seconds_left()));

            ctx_ = SSL_CTX_new(TLS_client_method());
            if (!ctx_) return false;
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx_);
            SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

            ssl_ = SSL_new(ctx_);
            if (!ssl_) return false;
            SSL_set_fd(ssl_, fd_);
            SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI

            if (SSL_connect(ssl_) != 1) return false;
        }

        // 1-second slices so the abort flag and deadline are polled.
        set_socket_timeout(1);
        return true;
    }

    // >0 bytes read, 0 on EOF, -1 on error, abort or deadline.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (should_stop()) return -1;

            if (ssl_) {
                int n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue;
                return -1;
            }
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return -1;
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (should_stop()) return false;
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd_, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool connect_nonblocking(const struct addrinfo* ai) {
        int flags = fcntl(fd_, F_GETFL, 0);
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno != EINPROGRESS) return false;
        if (rc != 0) {
            fd_set wset;
            FD_ZERO(&wset);
            FD_SET(fd_, &wset);
            struct timeval tv{std::max<long>(1, seconds_left()), 0};
            if (select(fd_ + 1, nullptr, &wset, nullptr, &tv) <= 0) return false;
            int err = 0;
            socklen_t elen = sizeof(err);
            getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
            if (err != 0) return false;
        }
        fcntl(fd_, F_SETFL, flags);
        return true;
    }

    bool should_stop() const {
        if (g_socket_abort_flag && g_socket_abort_flag->load(std::memory_order_relaxed))
            return true;
        return Clock::now() >= deadline_;
    }

    long seconds_left() const {
        auto left = std::chrono::duration_cast<std::chrono::seconds>(deadline_ - Clock::now());
        return static_cast<long>(left.count());
    }

    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
    Clock::time_point deadline_;
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const ParsedUrl& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Buffered reader over a connection; returns false on EOF/error/deadline.
class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    bool read_line(std::string& line) {
        while (true) {
            size_t pos = buffer_.find('\n');
            if (pos != std::string::npos) {
                line = buffer_.substr(0, pos);
                buffer_.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return true;
            }
            if (!fill()) return false;
        }
    }

    bool read_exactly(size_t n, std::string& out) {
        while (buffer_.size() < n) {
            if (!fill()) return false;
        }
        out.append(buffer_, 0, n);
        buffer_.erase(0, n);
        return true;
    }

    bool read_until_eof(std::string& out) {
        while (true) {
            char buf[4096];
            ssize_t n = conn_.read_some(buf, sizeof(buf));
            if (n < 0) return false;
            if (n == 0) break;
            buffer_.append(buf, static_cast<size_t>(n));
        }
        out += buffer_;
        buffer_.clear();
        return true;
    }

private:
    bool fill() {
        char buf[4096];
        ssize_t n = conn_.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        buffer_.append(buf, static_cast<size_t>(n));
        return true;
    }

    Connection& conn_;
    std::string buffer_;
};

struct ResponseHead {
    long status = 0;
    bool chunked = false;
    std::optional<size_t> content_length;
};

static std::string lowercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool read_head(ResponseReader& reader, ResponseHead& head) {
    std::string status_line;
    if (!reader.read_line(status_line)) return false;

    // "HTTP/1.1 200 OK": the three-digit code follows the first space
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || status_line.size() < sp1 + 4) return false;
    char* end = nullptr;
    std::string code = status_line.substr(sp1 + 1, 3);
    head.status = std::strtol(code.c_str(), &end, 10);
    if (end != code.c_str() + 3 || head.status < 100) return false;

    std::string line;
    while (reader.read_line(line)) {
        if (line.empty()) return true; // end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = lowercase(line.substr(0, colon));
        std::string value = lowercase(line.substr(colon + 1));
        value.erase(0, value.find_first_not_of(" \t"));

        if (name == "transfer-encoding") {
            head.chunked = value.find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            head.content_length = std::strtoul(value.c_str(), nullptr, 10);
        }
    }
    return false;
}

static bool read_body(ResponseReader& reader, const ResponseHead& head, std::string& body) {
    if (head.chunked) {
        std::string size_line;
        while (reader.read_line(size_line)) {
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return true;
            std::string crlf;
            if (!reader.read_exactly(chunk_size, body)) return false;
            if (!reader.read_exactly(2, crlf)) return false;
        }
        return false;
    }
    if (head.content_length) {
        return reader.read_exactly(*head.content_length, body);
    }
    return reader.read_until_eof(body);
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    auto parsed = parse_url(url);
    if (!parsed) return {};

    Connection conn(Clock::now() + std::chrono::seconds(std::max<long>(1, timeout_seconds)));
    if (!conn.connect(*parsed)) return {};

    std::string request = build_request(*parsed, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) return {};

    ResponseReader reader(conn);
    ResponseHead head;
    if (!read_head(reader, head)) return {};

    HttpResponse resp;
    if (!read_body(reader, head, resp.body)) return {};
    resp.status_code = head.status;
    return resp;
}

} // namespace hybridllm

#endif // __linux__
