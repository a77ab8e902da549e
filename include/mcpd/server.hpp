#pragma once
#include "dispatcher.hpp"
#include "json_rpc.hpp"
#include "registry.hpp"
#include "types.hpp"
#include "transport/http_transport.hpp"
#include "transport/tcp_transport.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <optional>
#include <string>

namespace mcpd {

/// JSON-RPC front end of the tool engine: answers the MCP lifecycle
/// methods and routes `tools/call` to the Dispatcher. One instance serves
/// one transport at a time; handle() is safe to call concurrently.
class McpServer {
public:
    struct Options {
        Implementation server_info;
        std::optional<std::string> instructions;
        size_t page_size = 50;

        Options();
    };

    explicit McpServer(const ToolRegistry& registry);
    McpServer(Options opts, const ToolRegistry& registry);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Process one message; returns the reply for requests.
    [[nodiscard]] std::optional<JsonRpcMessage> handle(const JsonRpcMessage& msg) const;

    [[nodiscard]] const Dispatcher& dispatcher() const;

    // ---- Transport ----
    void serve_stdio();
    void serve_tcp(TcpServerTransport::Options opts);
    void serve_http(HttpServerTransport::Options opts);
    /// Blocks until the transport stops.
    void serve(std::unique_ptr<ITransport> transport);
    void shutdown();

    bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpd
