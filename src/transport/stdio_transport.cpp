#include "mcpd/transport/stdio_transport.hpp"
#include "mcpd/transport/line_channel.hpp"
#include "mcpd/error.hpp"
#include "mcpd/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace mcpd {

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
    open_wakeup_pipe();
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
    open_wakeup_pipe();
}

void StdioTransport::open_wakeup_pipe() {
    if (::pipe(wakeup_pipe_) < 0) {
        throw McpdTransportError(std::string("Failed to create wakeup pipe: ")
                                 + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageHandler on_message, ErrorCallback on_error) {
    // shutdown() before start(): return without reading anything.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;

    log()->debug("stdio transport started");
    LineChannel channel(read_fd_, write_fd_, wakeup_pipe_[0]);
    channel.run(on_message, on_error);
    running_ = false;
    log()->debug("stdio transport stopped after {} frames", channel.lines_handled());
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    // The byte stays in the pipe, so a start() that has not reached
    // poll() yet still sees it.
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            log()->warn("stdio wakeup failed: {}", std::strerror(errno));
        }
    }
}

bool StdioTransport::is_connected() const {
    return running_;
}

} // namespace mcpd
