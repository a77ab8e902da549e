#pragma once
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace mcpd {

/// Streamable HTTP transport (MCP 2025-06-18). Every POST is answered on
/// its own response, either as one SSE event stream or as plain JSON.
class HttpServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "0.0.0.0";
        uint16_t port = 8080;
        std::string mcp_path = "/mcp";
        std::vector<std::string> allowed_origins;  // empty = allow all
        std::chrono::seconds session_timeout{1800};
        size_t max_body_bytes = 4 * 1024 * 1024;
    };

    static constexpr const char* SESSION_HEADER = "Mcp-Session-Id";

    explicit HttpServerTransport(Options opts);
    ~HttpServerTransport() override;

    HttpServerTransport(const HttpServerTransport&) = delete;
    HttpServerTransport& operator=(const HttpServerTransport&) = delete;

    /// Bind without serving yet; returns the bound port (port 0 picks a
    /// free one). Throws McpdTransportError.
    uint16_t bind_and_listen();

    void start(MessageHandler on_message, ErrorCallback on_error = nullptr) override;
    void shutdown() override;
    bool is_connected() const override;

    /// Block until the listener accepts connections or `timeout` elapses.
    bool wait_until_ready(std::chrono::milliseconds timeout) const;

    [[nodiscard]] uint16_t port() const { return bound_port_; }
    [[nodiscard]] size_t session_count() const;

    /// Drop sessions idle for longer than the session timeout; returns how
    /// many were removed.
    size_t reap_idle_sessions();

private:
    struct HttpSession {
        std::string id;
        std::chrono::steady_clock::time_point last_seen;
    };

    void setup_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void handle_delete(const httplib::Request& req, httplib::Response& res);
    void reaper_loop();

    bool validate_origin(const std::string& origin) const;
    std::string create_session();
    /// Refresh and return true when `id` names a live session.
    bool touch_session(const std::string& id);

    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    uint16_t bound_port_ = 0;
    bool bound_ = false;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> listen_returned_{false};

    MessageHandler message_handler_;
    ErrorCallback error_callback_;

    mutable std::mutex sessions_mutex_;
    std::map<std::string, HttpSession> sessions_;

    std::thread reaper_thread_;
    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
};

} // namespace mcpd
