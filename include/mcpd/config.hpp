#pragma once
#include <spdlog/common.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpd {

enum class TransportMode { Stdio, Tcp, Http };

[[nodiscard]] std::string_view mode_name(TransportMode mode);

/// Throws ConfigError for anything but "stdio", "tcp" or "http".
[[nodiscard]] TransportMode parse_mode(std::string_view name);

struct ServerConfig {
    TransportMode mode = TransportMode::Stdio;
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    spdlog::level::level_enum log_level = spdlog::level::info;
    size_t max_connections = 64;
    std::chrono::seconds session_timeout{1800};
    std::vector<std::string> allowed_origins;

    // One-shot invocation (--call)
    std::optional<std::string> call_tool;
    std::string call_arguments;

    bool show_help = false;
    bool show_version = false;
};

/// Parse command-line arguments (without the program name). Accepts
/// `--flag value` and `--flag=value`. Throws ConfigError.
[[nodiscard]] ServerConfig parse_args(const std::vector<std::string>& args);
[[nodiscard]] ServerConfig parse_args(int argc, const char* const* argv);

[[nodiscard]] std::string usage(std::string_view program);

} // namespace mcpd
