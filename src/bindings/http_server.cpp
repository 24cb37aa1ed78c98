#include "rarity/bindings/http_server.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <string>
#include <new>
#include <system_error>
#include <thread>
#include <utility>

namespace rarity::bindings::http {

using namespace rarity::core;

namespace {
    constexpr int kAcceptPollMs = 200;
    constexpr int kBacklog = 64;
    constexpr int kPeerPollMs = 50;

    [[nodiscard]] Status net_error(int err) noexcept {
        return make_status(StatusDomain::Net, StatusCode::Io, static_cast<u32>(err));
    }

    void set_io_timeout(int fd, u32 timeout_ms) noexcept {
        if (timeout_ms == 0) {
            return;
        }
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout_ms / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    [[nodiscard]] bool send_all(int fd, const char* data, size_t len) noexcept {
        while (len > 0) {
            const ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            data += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

    // Reads up to the end of the header block. Returns false on EOF, timeout or
    // when the header exceeds max_bytes (*too_large set).
    [[nodiscard]] bool read_header(int fd, u32 max_bytes, std::string* out, bool* too_large) {
        char buf[4096];
        while (out->find("\r\n\r\n") == std::string::npos) {
            if (out->size() >= max_bytes) {
                *too_large = true;
                return false;
            }
            const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                return false;
            }
            out->append(buf, static_cast<size_t>(n));
        }
        return true;
    }

    // Unread request bytes would turn close() into a reset and the peer could
    // lose the response, so half-close and drain first.
    void drain_and_close(int fd) noexcept {
        ::shutdown(fd, SHUT_WR);
        char buf[4096];
        for (;;) {
            const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
        }
        ::close(fd);
    }

    // Polls fd for a peer hangup while the request is being handled. Sets
    // *cancel on hangup or once *stopping is set; returns when *done is set.
    void watch_peer(int fd, const std::atomic<bool>* stopping, const std::atomic<bool>* done,
                    std::atomic<bool>* cancel) noexcept {
        while (!done->load()) {
            if (stopping->load()) {
                cancel->store(true);
                return;
            }
            pollfd pfd{fd, POLLRDHUP, 0};
            const int pr = ::poll(&pfd, 1, kPeerPollMs);
            if (pr < 0) {
                if (errno == EINTR) continue;
                return;
            }
            if (pr > 0 && (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR)) != 0) {
                cancel->store(true);
                return;
            }
        }
    }

    // "METHOD SP target SP HTTP/x.y"
    [[nodiscard]] bool parse_request_line(std::string_view head, HttpRequest* out) noexcept {
        const size_t eol = head.find("\r\n");
        const std::string_view line = head.substr(0, eol);
        const size_t sp1 = line.find(' ');
        if (sp1 == std::string_view::npos || sp1 == 0) {
            return false;
        }
        const size_t sp2 = line.find(' ', sp1 + 1);
        if (sp2 == std::string_view::npos || sp2 == sp1 + 1) {
            return false;
        }
        if (line.substr(sp2 + 1, 5) != "HTTP/") {
            return false;
        }
        out->method = line.substr(0, sp1);
        out->path = line.substr(sp1 + 1, sp2 - sp1 - 1);
        return true;
    }

    [[nodiscard]] std::string render_response(const HttpRequest& req, const HttpResponse& resp) {
        std::string out;
        char line[128];
        std::snprintf(line, sizeof(line), "HTTP/1.1 %u %s\r\n", resp.status, reason_phrase(resp.status));
        out += line;
        out += "Connection: close\r\n";
        out += "Access-Control-Allow-Origin: *\r\n";
        if (req.method == "OPTIONS") {
            out += "Access-Control-Allow-Methods: GET, HEAD, OPTIONS\r\n";
            out += "Access-Control-Allow-Headers: *\r\n";
        }
        if (resp.status != 204) {
            out += "Content-Type: " + resp.content_type + "\r\n";
            std::snprintf(line, sizeof(line), "Content-Length: %zu\r\n", resp.body.size());
            out += line;
        }
        out += "\r\n";
        if (resp.status != 204 && req.method != "HEAD") {
            out += resp.body;
        }
        return out;
    }
} // namespace

Status parse_listen_address(std::string_view addr, std::string* host, u16* port) noexcept {
    if (host == nullptr || port == nullptr) {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }
    const size_t colon = addr.rfind(':');
    if (colon == std::string_view::npos || colon + 1 >= addr.size()) {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }

    std::string_view h = addr.substr(0, colon);
    if (h.size() >= 2 && h.front() == '[' && h.back() == ']') {
        h = h.substr(1, h.size() - 2);
    }

    const std::string_view p = addr.substr(colon + 1);
    u16 v = 0;
    const auto r = std::from_chars(p.data(), p.data() + p.size(), v, 10);
    if (r.ec != std::errc() || r.ptr != p.data() + p.size()) {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }

    try {
        host->assign(h);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Config, StatusCode::Unknown);
    }
    *port = v;
    return ok_status();
}

HttpServer::HttpServer(rarity::service::ItemLookup& lookup, ServerConfig cfg)
    : lookup_(lookup), cfg_(std::move(cfg)) {}

HttpServer::~HttpServer() {
    stop();
    std::unique_lock<std::mutex> lock(conn_mutex_);
    conn_cv_.wait(lock, [this] { return active_connections_ == 0; });
    lock.unlock();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

Status HttpServer::listen() noexcept {
    if (listen_fd_ >= 0) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }

    std::string host;
    u16 port = 0;
    Status s = parse_listen_address(cfg_.listen_address, &host, &port);
    if (!is_ok(s)) {
        return s;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    const std::string port_str = std::to_string(port);
    addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        std::fprintf(stderr, "[serve] cannot resolve %s: %s\n", cfg_.listen_address.c_str(), gai_strerror(gai));
        return make_status(StatusDomain::Net, StatusCode::Invalid, static_cast<u32>(gai < 0 ? -gai : gai));
    }

    int last_err = 0;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_err = errno;
            continue;
        }
        int opt = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) != 0 || ::listen(fd, kBacklog) != 0) {
            last_err = errno;
            ::close(fd);
            continue;
        }
        listen_fd_ = fd;
        break;
    }
    ::freeaddrinfo(res);

    if (listen_fd_ < 0) {
        std::fprintf(stderr, "[serve] cannot listen on %s: %s\n", cfg_.listen_address.c_str(), std::strerror(last_err));
        return net_error(last_err);
    }

    sockaddr_storage bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        if (bound.ss_family == AF_INET) {
            port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
        } else if (bound.ss_family == AF_INET6) {
            port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
        }
    }

    std::fprintf(stderr, "[serve] listening on %s (port %u)\n", cfg_.listen_address.c_str(), port_);
    return ok_status();
}

Status HttpServer::run() noexcept {
    if (listen_fd_ < 0) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }

    Status result = ok_status();
    while (!stopping_.load()) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        const int pr = ::poll(&pfd, 1, kAcceptPollMs);
        if (pr < 0) {
            if (errno == EINTR) continue;
            result = net_error(errno);
            break;
        }
        if (pr == 0) {
            continue;
        }

        const int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
            std::fprintf(stderr, "[serve] accept failed: %s\n", std::strerror(errno));
            continue;
        }
        set_io_timeout(fd, cfg_.io_timeout_ms);

        bool full = false;
        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            if (cfg_.max_connections != 0 && active_connections_ >= cfg_.max_connections) {
                full = true;
            } else {
                ++active_connections_;
            }
        }
        if (full) {
            reject_busy(fd);
            continue;
        }
        try {
            std::thread([this, fd] {
                serve_connection(fd);
                std::lock_guard<std::mutex> lock(conn_mutex_);
                --active_connections_;
                conn_cv_.notify_all();
            }).detach();
        } catch (const std::system_error& e) {
            std::fprintf(stderr, "[serve] cannot spawn connection thread: %s\n", e.what());
            ::close(fd);
            std::lock_guard<std::mutex> lock(conn_mutex_);
            --active_connections_;
            conn_cv_.notify_all();
        }
    }

    std::unique_lock<std::mutex> lock(conn_mutex_);
    conn_cv_.wait(lock, [this] { return active_connections_ == 0; });
    return result;
}

void HttpServer::stop() noexcept {
    stopping_.store(true);
}

void HttpServer::reject_busy(int fd) noexcept {
    std::fprintf(stderr, "[serve] connection limit %u reached, rejecting\n", cfg_.max_connections);
    // Discard whatever request bytes already arrived so close() sends a FIN.
    char buf[4096];
    while (::recv(fd, buf, sizeof(buf), MSG_DONTWAIT) > 0) {
    }
    try {
        HttpResponse resp{};
        resp.status = 503;
        resp.body = "server busy";
        const std::string wire = render_response(HttpRequest{}, resp);
        if (!send_all(fd, wire.data(), wire.size())) {
            std::fprintf(stderr, "[serve] write failed: %s\n", std::strerror(errno));
        }
    } catch (const std::bad_alloc&) {
        std::fprintf(stderr, "[serve] out of memory while rejecting a connection\n");
    }
    ::close(fd);
}

void HttpServer::serve_connection(int fd) noexcept {
    try {
        std::string head;
        bool too_large = false;
        HttpRequest req{};
        HttpResponse resp{};

        if (!read_header(fd, cfg_.max_header_bytes, &head, &too_large)) {
            if (too_large) {
                resp.status = 413;
                resp.body = "request header too large";
                const std::string wire = render_response(req, resp);
                if (send_all(fd, wire.data(), wire.size())) {
                    drain_and_close(fd);
                    return;
                }
            }
            ::close(fd);
            return;
        }

        if (!parse_request_line(head, &req)) {
            resp.status = 400;
            resp.body = "malformed request line";
        } else {
            std::atomic<bool> cancel{false};
            std::atomic<bool> done{false};
            std::thread watcher;
            try {
                watcher = std::thread(watch_peer, fd, &stopping_, &done, &cancel);
            } catch (const std::system_error& e) {
                std::fprintf(stderr, "[serve] cannot watch connection, only shutdown cancels: %s\n", e.what());
            }

            (void)handle_http_request(lookup_, req, &resp, watcher.joinable() ? &cancel : &stopping_);
            done.store(true);
            if (watcher.joinable()) {
                watcher.join();
            }

            if (cancel.load() && !stopping_.load()) {
                std::fprintf(stderr, "[serve] %.*s %.*s -> client went away\n",
                             static_cast<int>(req.method.size()), req.method.data(),
                             static_cast<int>(req.path.size()), req.path.data());
                ::close(fd);
                return;
            }
        }

        std::fprintf(stderr, "[serve] %.*s %.*s -> %u\n",
                     static_cast<int>(req.method.size()), req.method.data(),
                     static_cast<int>(req.path.size()), req.path.data(),
                     resp.status);

        const std::string wire = render_response(req, resp);
        if (!send_all(fd, wire.data(), wire.size())) {
            std::fprintf(stderr, "[serve] write failed: %s\n", std::strerror(errno));
        }
    } catch (const std::bad_alloc&) {
        std::fprintf(stderr, "[serve] out of memory while serving a connection\n");
    }
    ::close(fd);
}

} // namespace rarity::bindings::http
