#include <gtest/gtest.h>
#include "mcpd/codec.hpp"
#include "mcpd/error.hpp"
#include "mcpd/server.hpp"
#include "mcpd/tools/builtin.hpp"
#include "mcpd/transport/tcp_transport.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <future>
#include <thread>

using namespace mcpd;

namespace {

// Minimal line-oriented TCP client.
class LineClient {
public:
    explicit LineClient(uint16_t port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) throw std::runtime_error("socket failed");
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(fd_);
            throw std::runtime_error("connect failed");
        }
    }

    ~LineClient() { close(); }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    void send_line(const std::string& line) {
        std::string out = line + "\n";
        ASSERT_EQ(::send(fd_, out.data(), out.size(), MSG_NOSIGNAL),
                  static_cast<ssize_t>(out.size()));
    }

    /// Next line, or nullopt on EOF or after `timeout`.
    std::optional<std::string> read_line(std::chrono::milliseconds timeout =
                                             std::chrono::milliseconds(5000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto nl = buffer_.find('\n');
            if (nl != std::string::npos) {
                std::string line = buffer_.substr(0, nl);
                buffer_.erase(0, nl + 1);
                return line;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return std::nullopt;
            pollfd pfd{fd_, POLLIN, 0};
            if (::poll(&pfd, 1, static_cast<int>(left.count())) <= 0) return std::nullopt;
            char buf[4096];
            ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n <= 0) return std::nullopt;
            buffer_.append(buf, static_cast<size_t>(n));
        }
    }

    nlohmann::json request(const std::string& line) {
        send_line(line);
        auto reply = read_line();
        if (!reply) return nullptr;
        return nlohmann::json::parse(*reply);
    }

private:
    int fd_ = -1;
    std::string buffer_;
};

// The listening socket bound to `port` in this process, or -1.
int find_listener(uint16_t port) {
    for (int fd = 3; fd < 1024; ++fd) {
        int listening = 0;
        socklen_t len = sizeof(listening);
        if (::getsockopt(fd, SOL_SOCKET, SO_ACCEPTCONN, &listening, &len) < 0 || !listening) {
            continue;
        }
        sockaddr_in addr{};
        socklen_t alen = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &alen) == 0
            && addr.sin_family == AF_INET && ntohs(addr.sin_port) == port) {
            return fd;
        }
    }
    return -1;
}

class TcpE2ETest : public ::testing::Test {
protected:
    void start(size_t max_connections = 8) {
        register_builtin_tools(registry_);
        server_ = std::make_unique<McpServer>(registry_);

        TcpServerTransport::Options opts;
        opts.host = "127.0.0.1";
        opts.port = 0;
        opts.max_connections = max_connections;
        auto transport = std::make_unique<TcpServerTransport>(opts);
        transport_ = transport.get();
        port_ = transport->bind_and_listen();
        ASSERT_GT(port_, 0);

        server_thread_ = std::thread([this, t = std::move(transport)]() mutable {
            server_->serve(std::move(t));
        });
        for (int i = 0; i < 400 && !server_->is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void TearDown() override {
        if (server_) server_->shutdown();
        if (server_thread_.joinable()) server_thread_.join();
    }

    ToolRegistry registry_;
    std::unique_ptr<McpServer> server_;
    TcpServerTransport* transport_ = nullptr;
    uint16_t port_ = 0;
    std::thread server_thread_;
};

} // namespace

TEST_F(TcpE2ETest, InitializeAndCallTool) {
    start();
    LineClient client(port_);

    auto init = client.request(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18","clientInfo":{"name":"tcp-test","version":"1"}}})");
    EXPECT_EQ(init["result"]["serverInfo"]["name"], "mcpd");

    client.send_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    auto listed = client.request(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    ASSERT_EQ(listed["result"]["tools"].size(), 3u);

    auto echoed = client.request(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"echotest","arguments":{"message":"over tcp"}}})");
    EXPECT_EQ(echoed["id"], 3);
    EXPECT_EQ(echoed["result"]["content"][0]["text"], "over tcp");
}

TEST_F(TcpE2ETest, ParseErrorKeepsConnectionOpen) {
    start();
    LineClient client(port_);

    auto err = client.request("this is not json");
    EXPECT_TRUE(err["id"].is_null());
    EXPECT_EQ(err["error"]["code"], -32700);

    auto pong = client.request(R"({"jsonrpc":"2.0","id":"p","method":"ping"})");
    EXPECT_EQ(pong["id"], "p");
    EXPECT_EQ(pong["result"], nlohmann::json::object());
}

TEST_F(TcpE2ETest, ConcurrentClients) {
    start();
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int c = 0; c < 4; ++c) {
        threads.emplace_back([this, c, &ok] {
            LineClient client(port_);
            for (int i = 0; i < 10; ++i) {
                const std::string msg = "client " + std::to_string(c) + " #" + std::to_string(i);
                nlohmann::json req = {
                    {"jsonrpc", "2.0"}, {"id", i}, {"method", "tools/call"},
                    {"params", {{"name", "echotest"}, {"arguments", {{"message", msg}}}}}
                };
                auto reply = client.request(req.dump());
                if (reply.is_object() && reply["result"]["content"][0]["text"] == msg) ++ok;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(ok.load(), 40);
}

TEST_F(TcpE2ETest, ConnectionLimit) {
    start(1);
    LineClient first(port_);
    auto pong = first.request(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    ASSERT_EQ(pong["id"], 1);

    // The second connection is accepted and closed straight away.
    LineClient second(port_);
    EXPECT_FALSE(second.read_line(std::chrono::milliseconds(3000)).has_value());

    // Once the first client leaves, the slot frees up.
    first.close();
    for (int i = 0; i < 400 && transport_->active_connections() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    LineClient third(port_);
    auto again = third.request(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
    EXPECT_EQ(again["id"], 2);
}

TEST_F(TcpE2ETest, ShutdownDisconnectsClients) {
    start();
    LineClient client(port_);
    auto pong = client.request(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    ASSERT_EQ(pong["id"], 1);

    server_->shutdown();
    server_thread_.join();
    EXPECT_FALSE(server_->is_running());
    EXPECT_FALSE(client.read_line(std::chrono::milliseconds(2000)).has_value());
}

TEST_F(TcpE2ETest, ToolResultsMatchInProcessHandling) {
    start();
    LineClient client(port_);

    const std::string line =
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"timeserver","arguments":{"timezone":"Nowhere/Special"}}})";
    auto over_tcp = client.request(line);

    auto direct = server_->handle(Codec::decode(nlohmann::json::parse(line)));
    ASSERT_TRUE(direct.has_value());
    EXPECT_EQ(over_tcp, nlohmann::json::parse(Codec::serialize(*direct)));

    const std::string echo =
        R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"echotest","arguments":{"message":"same"}}})";
    auto direct_echo = server_->handle(Codec::decode(nlohmann::json::parse(echo)));
    ASSERT_TRUE(direct_echo.has_value());
    EXPECT_EQ(client.request(echo), nlohmann::json::parse(Codec::serialize(*direct_echo)));
}

TEST(TcpListenerFailure, ClientsAreClosedBeforeErrorPropagates) {
    ToolRegistry registry;
    register_builtin_tools(registry);
    McpServer server(registry);

    TcpServerTransport::Options opts;
    opts.host = "127.0.0.1";
    opts.port = 0;
    auto transport = std::make_unique<TcpServerTransport>(opts);
    const uint16_t port = transport->bind_and_listen();
    ASSERT_GT(port, 0);

    std::promise<std::string> failure;
    auto failed = failure.get_future();
    std::thread runner([&server, &failure, t = std::move(transport)]() mutable {
        try {
            server.serve(std::move(t));
            failure.set_value("");
        } catch (const McpdTransportError& e) {
            failure.set_value(e.what());
        }
    });

    LineClient client(port);
    auto pong = client.request(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(pong["id"], 1);

    const int listener = find_listener(port);
    EXPECT_GE(listener, 0);
    if (listener >= 0) ::shutdown(listener, SHUT_RDWR);

    if (failed.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        ADD_FAILURE() << "serve() kept running after the listener failed";
        server.shutdown();
    }
    runner.join();
    EXPECT_FALSE(failed.get().empty());
    EXPECT_FALSE(server.is_running());
    // The connection thread was stopped and joined, which closed the socket.
    EXPECT_FALSE(client.read_line(std::chrono::milliseconds(2000)).has_value());
}
