// HTTP/HTTPS client using POSIX sockets + OpenSSL.

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <string>

namespace strata {

namespace {

using Clock = std::chrono::steady_clock;

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

bool parse_url(const std::string& url, ParsedUrl& out) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return false;
    out.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    out.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        out.host = host_port.substr(0, colon);
        out.port = host_port.substr(colon + 1);
    } else {
        out.host = host_port;
        out.port = out.tls ? "443" : "80";
    }
    return !out.host.empty();
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
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Returns an empty string on success, otherwise what failed.
    std::string open(const ParsedUrl& url) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return "cannot resolve " + url.host;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd_ < 0) continue;
            connected = connect_with_deadline(ai);
            if (!connected) { ::close(fd_); fd_ = -1; }
        }
        freeaddrinfo(res);
        if (!connected) return "cannot connect to " + url.host + ":" + url.port;

        // Short receive slices let read_some() enforce the overall deadline.
        set_socket_timeout(1);

        if (url.tls) {
            ctx_ = SSL_CTX_new(TLS_client_method());
            if (!ctx_) return "TLS context allocation failed";
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx_);
            SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

            ssl_ = SSL_new(ctx_);
            if (!ssl_) return "TLS session allocation failed";
            SSL_set_fd(ssl_, fd_);
            SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI

            int rc;
            while ((rc = SSL_connect(ssl_)) != 1) {
                int err = SSL_get_error(ssl_, rc);
                bool again = err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE ||
                             (err == SSL_ERROR_SYSCALL &&
                              (errno == EAGAIN || errno == EWOULDBLOCK));
                if (!again || expired()) return "TLS handshake with " + url.host + " failed";
            }
        }
        return {};
    }

    // >0 bytes read, 0 on EOF, -1 on error or deadline expiry.
    ssize_t read_some(char* buf, size_t len) {
        while (!expired()) {
            ssize_t n;
            if (ssl_) {
                n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n >= 0) return n;
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
                if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue;
                return -1;
            }
            n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return -1;
        }
        return -1;
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (expired()) return false;
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) continue;
                    return false;
                }
            } else {
                n = ::send(fd_, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

    bool expired() const { return Clock::now() >= deadline_; }

private:
    bool connect_with_deadline(const struct addrinfo* ai) {
        int flags = fcntl(fd_, F_GETFL, 0);
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0) {
            if (errno != EINPROGRESS) return false;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline_ - Clock::now()).count();
            if (left <= 0) return false;
            fd_set wset;
            FD_ZERO(&wset);
            FD_SET(fd_, &wset);
            struct timeval tv{static_cast<time_t>(left / 1000),
                              static_cast<suseconds_t>((left % 1000) * 1000)};
            if (select(fd_ + 1, nullptr, &wset, nullptr, &tv) <= 0) return false;
            int err = 0;
            socklen_t elen = sizeof(err);
            getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
            if (err != 0) return false;
        }
        fcntl(fd_, F_SETFL, flags);
        return true;
    }

    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    Clock::time_point deadline_;
    int fd_ = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
};

// ── Request building ───────────────────────────────────────────

std::string build_request(const ParsedUrl& url, const std::string& body,
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

class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    // Status line + headers. Returns 0 if no valid status line arrived.
    long read_head() {
        std::string status_line;
        if (!read_line(status_line)) return 0;

        // "HTTP/1.1 200 OK"
        size_t sp = status_line.find(' ');
        if (sp == std::string::npos || status_line.size() < sp + 4) return 0;
        char* end = nullptr;
        std::string code = status_line.substr(sp + 1, 3);
        long status = std::strtol(code.c_str(), &end, 10);
        if (end != code.c_str() + 3) return 0;

        std::string line;
        while (read_line(line) && !line.empty()) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = lower(line.substr(0, colon));
            std::string value = lower(line.substr(colon + 1));
            value.erase(0, value.find_first_not_of(" \t"));

            if (name == "transfer-encoding") {
                chunked_ = value.find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                content_length_ = std::strtoul(value.c_str(), nullptr, 10);
                has_length_ = true;
            }
        }
        return status;
    }

    std::string read_body() {
        std::string body;
        if (chunked_) {
            std::string size_line;
            while (read_line(size_line)) {
                // Chunk size is hex, may have extensions after ';'
                size_t chunk = std::strtoul(size_line.c_str(), nullptr, 16);
                if (chunk == 0) break;
                if (!read_exactly(chunk, body)) break;
                std::string crlf;
                read_exactly(2, crlf);
            }
        } else if (has_length_) {
            read_exactly(content_length_, body);
        } else {
            body.swap(pending_);
            char buf[4096];
            ssize_t n;
            while ((n = conn_.read_some(buf, sizeof(buf))) > 0) {
                body.append(buf, static_cast<size_t>(n));
            }
        }
        return body;
    }

private:
    static std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        return s;
    }

    bool fill() {
        char buf[4096];
        ssize_t n = conn_.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        pending_.append(buf, static_cast<size_t>(n));
        return true;
    }

    bool read_line(std::string& line) {
        size_t pos;
        while ((pos = pending_.find('\n')) == std::string::npos) {
            if (!fill()) return false;
        }
        line = pending_.substr(0, pos);
        pending_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    bool read_exactly(size_t n, std::string& out) {
        while (pending_.size() < n) {
            if (!fill()) {
                out += pending_;
                pending_.clear();
                return false;
            }
        }
        out.append(pending_, 0, n);
        pending_.erase(0, n);
        return true;
    }

    Connection& conn_;
    std::string pending_;
    bool chunked_ = false;
    bool has_length_ = false;
    size_t content_length_ = 0;
};

} // namespace

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    HttpResponse resp;
    ParsedUrl parsed;
    if (!parse_url(url, parsed)) {
        resp.error = "invalid URL: " + url;
        return resp;
    }

    Connection conn(Clock::now() + std::chrono::seconds(std::max(1L, timeout_seconds)));
    resp.error = conn.open(parsed);
    if (!resp.error.empty()) return resp;

    std::string request = build_request(parsed, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        resp.error = "failed to send request to " + parsed.host;
        return resp;
    }

    ResponseReader reader(conn);
    resp.status_code = reader.read_head();
    if (resp.status_code == 0) {
        resp.error = conn.expired() ? "timed out waiting for " + parsed.host
                                    : "malformed response from " + parsed.host;
        return resp;
    }
    resp.body = reader.read_body();
    return resp;
}

} // namespace strata
