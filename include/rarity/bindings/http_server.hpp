#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <string_view>

#include "rarity/bindings/http.hpp"
#include "rarity/core/errors.hpp"
#include "rarity/service/lookup.hpp"

namespace rarity::bindings::http {

struct ServerConfig {
    std::string listen_address{":1337"}; // [host]:port, port 0 picks a free one
    u32 max_header_bytes{16 * 1024};
    u32 io_timeout_ms{30000};            // per-connection socket read/write timeout
    u32 max_connections{256};            // 0 = unlimited; beyond it new clients get 503
};

// Splits "[host]:port". An empty host means every interface.
[[nodiscard]] rarity::core::Status parse_listen_address(std::string_view addr, std::string* host, u16* port) noexcept;

// HTTP/1.1, one request per connection, one thread per connection. Every
// response carries Access-Control-Allow-Origin: *. A lookup is cancelled when
// its client hangs up (including a half-close) or the server stops.
class HttpServer {
public:
    HttpServer(rarity::service::ItemLookup& lookup, ServerConfig cfg);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    [[nodiscard]] rarity::core::Status listen() noexcept;

    // Accept loop; returns after stop(), once in-flight connections finish.
    [[nodiscard]] rarity::core::Status run() noexcept;

    // Safe from any thread. In-flight fetches are cancelled.
    void stop() noexcept;

    [[nodiscard]] u16 port() const noexcept { return port_; }

private:
    void serve_connection(int fd) noexcept;
    void reject_busy(int fd) noexcept;

    rarity::service::ItemLookup& lookup_;
    ServerConfig cfg_;
    int listen_fd_{-1};
    u16 port_{0};
    std::atomic<bool> stopping_{false};

    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    u32 active_connections_{0};
};

} // namespace rarity::bindings::http
