#pragma once
#include "transport.hpp"
#include <atomic>

namespace mcpd {

/// StdioTransport reads newline-delimited JSON from stdin and writes the
/// replies to stdout, one request at a time. Input EOF ends start().
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The transport takes ownership of both.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    void start(MessageHandler on_message, ErrorCallback on_error = nullptr) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void open_wakeup_pipe();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};

    int wakeup_pipe_[2]{-1, -1};  // interrupts the blocking read on shutdown
};

} // namespace mcpd
