#include "mcpd/server.hpp"
#include "mcpd/error.hpp"
#include "mcpd/logging.hpp"
#include "mcpd/router.hpp"
#include "mcpd/version.hpp"
#include "mcpd/transport/stdio_transport.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>

namespace mcpd {

// ----------- Pager helper -----------

namespace {

/// Cursor-based paging over a fixed list; the cursor is the decimal
/// index of the first item of the next page.
template<typename T>
std::pair<std::vector<T>, std::optional<std::string>>
page(const std::vector<T>& items, size_t page_size, const std::optional<std::string>& cursor) {
    size_t start = 0;
    if (cursor) {
        if (cursor->empty() || cursor->find_first_not_of("0123456789") != std::string::npos
            || cursor->size() > 18) {
            throw McpdProtocolError(error::InvalidParams, "Invalid cursor: " + *cursor);
        }
        start = static_cast<size_t>(std::stoull(*cursor));
    }
    if (start >= items.size()) {
        return {{}, std::nullopt};
    }
    size_t end = std::min(start + page_size, items.size());
    std::vector<T> page_items(items.begin() + static_cast<std::ptrdiff_t>(start),
                              items.begin() + static_cast<std::ptrdiff_t>(end));
    std::optional<std::string> next;
    if (end < items.size()) next = std::to_string(end);
    return {std::move(page_items), next};
}

} // anonymous namespace

McpServer::Options::Options()
    : server_info{std::string(SERVER_NAME), std::string(LIBRARY_VERSION)} {
}

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    Dispatcher dispatcher;
    Router router;

    ITransport* transport{nullptr};
    std::mutex transport_mutex;
    std::atomic<bool> running{false};
    std::atomic<bool> shutdown_requested{false};

    Impl(Options o, const ToolRegistry& registry)
        : opts(std::move(o)), dispatcher(registry) {
        if (opts.page_size == 0) opts.page_size = 1;
    }

    void setup_handlers() {
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            std::string client_name = "unknown";
            if (auto it = params.find("clientInfo"); it != params.end() && it->is_object()) {
                client_name = it->value("name", client_name);
            }
            std::string client_proto = params.value("protocolVersion", std::string());
            log()->info("initialize from {} (protocol {})", client_name,
                        client_proto.empty() ? "unspecified" : client_proto);

            InitializeResult result;
            result.protocol_version = std::string(PROTOCOL_VERSION);
            result.capabilities.tools = nlohmann::json{{"listChanged", false}};
            result.server_info = opts.server_info;
            result.instructions = opts.instructions;

            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        router.on_notification("notifications/initialized", [](const nlohmann::json&) {
            log()->debug("client initialized");
        });

        router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });

        router.on_request("tools/list", [this](const nlohmann::json& params) -> HandlerResult {
            std::optional<std::string> cursor;
            if (auto it = params.find("cursor"); it != params.end() && !it->is_null()) {
                if (!it->is_string()) {
                    return JsonRpcError{error::InvalidParams, "cursor must be a string",
                                        std::nullopt};
                }
                cursor = it->get<std::string>();
            }
            auto [items, next] = page(dispatcher.registry().list(), opts.page_size, cursor);
            nlohmann::json result = {{"tools", items}};
            if (next) result["nextCursor"] = *next;
            return result;
        });

        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            auto name_it = params.find("name");
            if (name_it == params.end() || !name_it->is_string()) {
                return JsonRpcError{error::InvalidParams, "Missing tool name", std::nullopt};
            }
            const std::string name = name_it->get<std::string>();

            std::string raw_arguments;
            if (auto args = params.find("arguments"); args != params.end()) {
                raw_arguments = args->dump(-1, ' ', false,
                                           nlohmann::json::error_handler_t::replace);
            }

            CallToolResult result = dispatcher.invoke(name, raw_arguments);
            nlohmann::json j;
            to_json(j, result);
            return j;
        });
    }
};

McpServer::McpServer(const ToolRegistry& registry)
    : McpServer(Options{}, registry) {
}

McpServer::McpServer(Options opts, const ToolRegistry& registry)
    : impl_(std::make_unique<Impl>(std::move(opts), registry)) {
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

std::optional<JsonRpcMessage> McpServer::handle(const JsonRpcMessage& msg) const {
    return impl_->router.dispatch(msg);
}

const Dispatcher& McpServer::dispatcher() const {
    return impl_->dispatcher;
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        if (impl_->shutdown_requested) return;
        impl_->transport = transport.get();
        impl_->running = true;
    }

    try {
        transport->start(
            [this](const JsonRpcMessage& msg) { return handle(msg); },
            [](std::exception_ptr ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    log()->error("transport error: {}", e.what());
                }
            });
    } catch (...) {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->running = false;
        impl_->transport = nullptr;
        throw;
    }

    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    impl_->running = false;
    impl_->transport = nullptr;
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::serve_tcp(TcpServerTransport::Options opts) {
    serve(std::make_unique<TcpServerTransport>(std::move(opts)));
}

void McpServer::serve_http(HttpServerTransport::Options opts) {
    serve(std::make_unique<HttpServerTransport>(std::move(opts)));
}

void McpServer::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    impl_->shutdown_requested = true;
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

} // namespace mcpd
