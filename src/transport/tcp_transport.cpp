#include "mcpd/transport/tcp_transport.hpp"
#include "mcpd/transport/line_channel.hpp"
#include "mcpd/error.hpp"
#include "mcpd/logging.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mcpd {

namespace {

std::string peer_name(const sockaddr_storage& addr) {
    char host[NI_MAXHOST] = {0};
    char serv[NI_MAXSERV] = {0};
    if (::getnameinfo(reinterpret_cast<const sockaddr*>(&addr), sizeof(addr), host, sizeof(host),
                      serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "unknown";
    }
    return std::string(host) + ":" + serv;
}

uint16_t local_port(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

} // anonymous namespace

TcpServerTransport::TcpServerTransport(Options opts) : opts_(std::move(opts)) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw McpdTransportError(std::string("Failed to create wakeup pipe: ")
                                 + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

TcpServerTransport::~TcpServerTransport() {
    shutdown();
    join_connections();
    if (listen_fd_ >= 0) ::close(listen_fd_);
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

uint16_t TcpServerTransport::bind_and_listen() {
    if (listen_fd_ >= 0) return bound_port_;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* result = nullptr;
    const std::string service = std::to_string(opts_.port);
    const char* node = opts_.host.empty() ? nullptr : opts_.host.c_str();
    if (int rc = ::getaddrinfo(node, service.c_str(), &hints, &result); rc != 0) {
        throw McpdTransportError("Cannot resolve " + opts_.host + ": " + ::gai_strerror(rc));
    }

    std::string last_error = "no usable address";
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        int yes = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, SOMAXCONN) == 0) {
            listen_fd_ = fd;
            break;
        }
        last_error = std::strerror(errno);
        ::close(fd);
    }
    ::freeaddrinfo(result);

    if (listen_fd_ < 0) {
        throw McpdTransportError("Failed to listen on " + opts_.host + ":"
                                 + std::to_string(opts_.port) + ": " + last_error);
    }
    bound_port_ = local_port(listen_fd_);
    return bound_port_;
}

void TcpServerTransport::start(MessageHandler on_message, ErrorCallback on_error) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;

    try {
        bind_and_listen();
    } catch (const McpdTransportError&) {
        running_ = false;
        throw;
    }
    log()->info("TCP transport listening on {}:{}", opts_.host, bound_port_);

    try {
        accept_loop(on_message, on_error);
    } catch (...) {
        // Connection threads borrow on_message/on_error; stop them first.
        shutdown();
        join_connections();
        running_ = false;
        throw;
    }

    join_connections();
    running_ = false;
}

void TcpServerTransport::join_connections() {
    // Connection threads watch the same wakeup pipe and exit with us.
    std::list<std::unique_ptr<Connection>> remaining;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        remaining.swap(connections_);
    }
    for (auto& conn : remaining) {
        if (conn->thread.joinable()) conn->thread.join();
    }
}

void TcpServerTransport::accept_loop(const MessageHandler& on_message,
                                     const ErrorCallback& on_error) {
    while (true) {
        struct pollfd fds[2];
        fds[0].fd = listen_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, 1000);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw McpdTransportError(std::string("poll failed: ") + std::strerror(errno));
        }
        if (fds[1].revents & POLLIN) return;
        if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            throw McpdTransportError("listening socket on port " + std::to_string(bound_port_)
                                     + " failed");
        }

        reap_finished();
        if (!(fds[0].revents & POLLIN)) continue;

        sockaddr_storage addr{};
        socklen_t len = sizeof(addr);
        int fd = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
            if (errno == EBADF || errno == EINVAL || errno == ENOTSOCK) {
                throw McpdTransportError(std::string("accept failed: ") + std::strerror(errno));
            }
            log()->error("accept failed: {}", std::strerror(errno));
            continue;
        }
        std::string peer = peer_name(addr);

        if (active_.load() >= opts_.max_connections) {
            log()->warn("rejecting connection from {}: limit of {} reached", peer,
                        opts_.max_connections);
            ::close(fd);
            continue;
        }

        ++active_;
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.push_back(std::make_unique<Connection>());
        Connection& conn = *connections_.back();
        conn.thread = std::thread([this, fd, peer, &on_message, &on_error, &conn]() {
            serve_connection(fd, peer, on_message, on_error, conn);
        });
    }
}

void TcpServerTransport::serve_connection(int fd, std::string peer,
                                          const MessageHandler& on_message,
                                          const ErrorCallback& on_error, Connection& conn) {
    log()->info("TCP client connected: {}", peer);
    LineChannel channel(fd, fd, wakeup_pipe_[0]);
    channel.run(on_message, on_error);
    ::close(fd);
    log()->info("TCP client disconnected: {} ({} frames)", peer, channel.lines_handled());
    --active_;
    conn.finished = true;
}

void TcpServerTransport::reap_finished() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if ((*it)->finished) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void TcpServerTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            log()->warn("tcp wakeup failed: {}", std::strerror(errno));
        }
    }
}

bool TcpServerTransport::is_connected() const {
    return running_;
}

} // namespace mcpd
