#include "mcpd/logging.hpp"
#include "mcpd/error.hpp"
#include "mcpd/version.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>

namespace mcpd {

namespace {

constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e - [%l] %v";

std::mutex logger_mutex;

std::shared_ptr<spdlog::logger> get_or_create() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    const std::string name(SERVER_NAME);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(name);
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::level::info);
    return logger;
}

} // anonymous namespace

void init_logging(spdlog::level::level_enum level) {
    auto logger = get_or_create();
    logger->set_level(level);
    logger->set_pattern(kPattern);
    logger->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> log() {
    // Cached after the first lookup; the registry keeps the logger alive.
    static std::shared_ptr<spdlog::logger> logger = get_or_create();
    return logger;
}

spdlog::level::level_enum parse_log_level(std::string_view name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    throw ConfigError("Invalid log level: " + std::string(name));
}

} // namespace mcpd
