#pragma once
#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace mcpd {

/// Configure the process-wide "mcpd" logger. It always writes to stderr:
/// stdout belongs to the stdio transport.
void init_logging(spdlog::level::level_enum level);

/// The "mcpd" logger; created with defaults on first use if
/// init_logging() was never called.
[[nodiscard]] std::shared_ptr<spdlog::logger> log();

/// Parse "trace|debug|info|warn|error|critical|off". Throws ConfigError.
[[nodiscard]] spdlog::level::level_enum parse_log_level(std::string_view name);

} // namespace mcpd
