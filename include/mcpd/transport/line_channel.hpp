#pragma once
#include "transport.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace mcpd {

/// Newline-delimited JSON-RPC over a pair of file descriptors. Each
/// complete line is answered, in order, before the next one is read.
/// CRLF line endings are accepted.
class LineChannel {
public:
    static constexpr size_t MAX_LINE_BYTES = 4 * 1024 * 1024;

    /// `wakeup_fd` is polled alongside `read_fd`; once it turns readable
    /// the channel stops. The byte is left unread so that every channel
    /// sharing the descriptor sees it.
    LineChannel(int read_fd, int write_fd, int wakeup_fd);

    /// Returns on EOF, on a read error (reported through `on_error`) or
    /// when woken.
    void run(const MessageHandler& handler, const ErrorCallback& on_error);

    /// Write `payload` followed by '\n'. False if the peer is gone.
    bool write_line(std::string_view payload);

    [[nodiscard]] size_t lines_handled() const { return lines_handled_; }

private:
    void handle_line(std::string_view line, const MessageHandler& handler);

    int read_fd_;
    int write_fd_;
    int wakeup_fd_;
    size_t lines_handled_ = 0;
};

} // namespace mcpd
