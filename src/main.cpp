/// mcpd: MCP tool server.
/// Usage: ./mcpd [--mode stdio|tcp|http] [--host H] [--port P] ...
/// Run with --help for the full option list.

#include "mcpd/config.hpp"
#include "mcpd/error.hpp"
#include "mcpd/logging.hpp"
#include "mcpd/registry.hpp"
#include "mcpd/server.hpp"
#include "mcpd/tools/builtin.hpp"
#include "mcpd/version.hpp"

#include <csignal>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>

namespace {

std::string tool_names(const mcpd::ToolRegistry& registry) {
    std::string names;
    for (const auto& def : registry.list()) {
        if (!names.empty()) names += ", ";
        names += def.name;
    }
    return names;
}

int run_once(const mcpd::ServerConfig& cfg, const mcpd::ToolRegistry& registry) {
    mcpd::Dispatcher dispatcher(registry);
    auto result = dispatcher.invoke(*cfg.call_tool, cfg.call_arguments);
    std::cout << mcpd::joined_text(result) << std::endl;
    return 0;
}

/// SIGINT/SIGTERM are blocked in every thread and collected here, so
/// shutdown() runs in a normal thread context.
class SignalWatcher {
public:
    explicit SignalWatcher(mcpd::McpServer& server) {
        sigemptyset(&set_);
        sigaddset(&set_, SIGINT);
        sigaddset(&set_, SIGTERM);
        sigaddset(&set_, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &set_, nullptr);
        thread_ = std::thread([this, &server] {
            int sig = 0;
            while (sigwait(&set_, &sig) == 0) {
                if (sig == SIGUSR1) return;
                mcpd::log()->info("received signal {}, shutting down", sig);
                server.shutdown();
                return;
            }
        });
    }

    ~SignalWatcher() {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

private:
    sigset_t set_;
    std::thread thread_;
};

} // anonymous namespace

int main(int argc, char** argv) {
    mcpd::ServerConfig cfg;
    try {
        cfg = mcpd::parse_args(argc, argv);
    } catch (const mcpd::ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << mcpd::usage(argv[0]);
        return 2;
    }

    if (cfg.show_help) {
        std::cout << mcpd::usage(argv[0]);
        return 0;
    }
    if (cfg.show_version) {
        std::cout << mcpd::SERVER_NAME << " v" << mcpd::LIBRARY_VERSION
                  << " (MCP " << mcpd::PROTOCOL_VERSION << ")\n";
        return 0;
    }

    mcpd::init_logging(cfg.log_level);
    std::signal(SIGPIPE, SIG_IGN);

    mcpd::ToolRegistry registry;
    mcpd::register_builtin_tools(registry);

    if (cfg.call_tool) {
        return run_once(cfg, registry);
    }

    auto log = mcpd::log();
    log->info("{} v{} starting (transport={})", mcpd::SERVER_NAME, mcpd::LIBRARY_VERSION,
              mcpd::mode_name(cfg.mode));
    log->info("Registered tools: {}", tool_names(registry));

    mcpd::McpServer server(registry);
    SignalWatcher watcher(server);

    try {
        switch (cfg.mode) {
            case mcpd::TransportMode::Stdio:
                log->info("Serving MCP over stdio");
                server.serve_stdio();
                break;
            case mcpd::TransportMode::Tcp: {
                mcpd::TcpServerTransport::Options opts;
                opts.host = cfg.host;
                opts.port = cfg.port;
                opts.max_connections = cfg.max_connections;
                log->info("Serving MCP over TCP on {}:{}", cfg.host, cfg.port);
                server.serve_tcp(std::move(opts));
                break;
            }
            case mcpd::TransportMode::Http: {
                mcpd::HttpServerTransport::Options opts;
                opts.host = cfg.host;
                opts.port = cfg.port;
                opts.session_timeout = cfg.session_timeout;
                opts.allowed_origins = cfg.allowed_origins;
                log->info("Serving MCP over Streamable HTTP on http://{}:{}/mcp", cfg.host,
                          cfg.port);
                log->info("Health check on http://{}:{}/health", cfg.host, cfg.port);
                server.serve_http(std::move(opts));
                break;
            }
        }
    } catch (const mcpd::McpdError& e) {
        log->critical("{}", e.what());
        return 1;
    }

    log->info("{} stopped", mcpd::SERVER_NAME);
    return 0;
}
