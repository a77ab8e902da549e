#include "mcpd/transport/line_channel.hpp"
#include "mcpd/codec.hpp"
#include "mcpd/error.hpp"
#include "mcpd/logging.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mcpd {

namespace {

void report(const ErrorCallback& on_error, const std::string& what) {
    log()->error("{}", what);
    if (on_error) {
        on_error(std::make_exception_ptr(McpdTransportError(what)));
    }
}

} // anonymous namespace

LineChannel::LineChannel(int read_fd, int write_fd, int wakeup_fd)
    : read_fd_(read_fd), write_fd_(write_fd), wakeup_fd_(wakeup_fd) {
}

void LineChannel::run(const MessageHandler& handler, const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);
    char chunk[4096];
    bool discarding = false;

    while (true) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_fd_;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, wakeup_fd_ >= 0 ? 2 : 1, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report(on_error, std::string("poll failed: ") + std::strerror(errno));
            return;
        }

        if (fds[1].revents & POLLIN) return;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            report(on_error, std::string("Read error: ") + std::strerror(errno));
            return;
        }
        if (n == 0) {
            // A final line without a trailing newline is still a frame.
            if (!discarding && !buffer.empty()) handle_line(buffer, handler);
            return;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;
            std::string_view line(buffer.data() + pos, nl - pos);
            pos = nl + 1;
            if (discarding) {
                discarding = false;
                continue;
            }
            handle_line(line, handler);
        }
        buffer.erase(0, pos);

        if (buffer.size() > MAX_LINE_BYTES) {
            if (!discarding) {
                log()->warn("discarding oversized frame ({} bytes so far)", buffer.size());
                if (!write_line(Codec::serialize(JsonRpcResponse::failure(
                        std::nullopt, error::InvalidRequest, "Invalid Request: frame too large")))) {
                    return;
                }
            }
            buffer.clear();
            discarding = true;
        }
    }
}

void LineChannel::handle_line(std::string_view line, const MessageHandler& handler) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.find_first_not_of(" \t") == std::string_view::npos) return;

    ++lines_handled_;
    if (auto reply = handle_frame(line, handler)) {
        if (!write_line(*reply)) {
            log()->warn("peer closed before reply could be written");
        }
    }
}

bool LineChannel::write_line(std::string_view payload) {
    std::string out;
    out.reserve(payload.size() + 1);
    out.append(payload);
    out += '\n';

    const char* data = out.data();
    size_t remaining = out.size();
    bool is_socket = true;
    while (remaining > 0) {
        ssize_t written = is_socket ? ::send(write_fd_, data, remaining, MSG_NOSIGNAL)
                                    : ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            if (is_socket && errno == ENOTSOCK) {
                is_socket = false;
                continue;
            }
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    return true;
}

} // namespace mcpd
