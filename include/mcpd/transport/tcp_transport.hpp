#pragma once
#include "transport.hpp"
#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcpd {

/// Newline-delimited JSON-RPC over raw TCP. Each accepted connection is
/// served by its own thread with the same framing as stdio.
class TcpServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "0.0.0.0";
        uint16_t port = 8080;
        size_t max_connections = 64;
    };

    explicit TcpServerTransport(Options opts);
    ~TcpServerTransport() override;

    TcpServerTransport(const TcpServerTransport&) = delete;
    TcpServerTransport& operator=(const TcpServerTransport&) = delete;

    /// Bind and listen without serving yet; returns the bound port (useful
    /// with port 0). start() calls it if needed. Throws McpdTransportError.
    uint16_t bind_and_listen();

    void start(MessageHandler on_message, ErrorCallback on_error = nullptr) override;
    void shutdown() override;
    bool is_connected() const override;

    [[nodiscard]] uint16_t port() const { return bound_port_; }
    [[nodiscard]] size_t active_connections() const { return active_; }

private:
    struct Connection {
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    void accept_loop(const MessageHandler& on_message, const ErrorCallback& on_error);
    void serve_connection(int fd, std::string peer, const MessageHandler& on_message,
                          const ErrorCallback& on_error, Connection& conn);
    void reap_finished();
    void join_connections();

    Options opts_;
    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    int wakeup_pipe_[2]{-1, -1};

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_{0};

    std::mutex connections_mutex_;
    std::list<std::unique_ptr<Connection>> connections_;
};

} // namespace mcpd
