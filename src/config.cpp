#include "mcpd/config.hpp"
#include "mcpd/error.hpp"
#include "mcpd/logging.hpp"
#include <limits>
#include <sstream>

namespace mcpd {

namespace {

bool is_flag(const std::string& s) {
    return s.size() > 1 && s[0] == '-';
}

long long parse_integer(const std::string& flag, const std::string& value,
                        long long min, long long max) {
    long long v = 0;
    size_t pos = 0;
    try {
        v = std::stoll(value, &pos, 10);
    } catch (const std::exception&) {
        throw ConfigError(flag + ": not an integer: '" + value + "'");
    }
    if (pos != value.size()) {
        throw ConfigError(flag + ": not an integer: '" + value + "'");
    }
    if (v < min || v > max) {
        throw ConfigError(flag + ": " + value + " is out of range [" + std::to_string(min)
                          + ", " + std::to_string(max) + "]");
    }
    return v;
}

/// Walks argv, splitting `--flag=value` forms as it goes.
class ArgCursor {
public:
    explicit ArgCursor(const std::vector<std::string>& args) : args_(args) {}

    bool next() {
        if (i_ >= args_.size()) return false;
        const std::string& raw = args_[i_++];
        inline_value_.reset();
        auto eq = raw.find('=');
        if (raw.rfind("--", 0) == 0 && eq != std::string::npos) {
            flag_ = raw.substr(0, eq);
            inline_value_ = raw.substr(eq + 1);
        } else {
            flag_ = raw;
        }
        return true;
    }

    const std::string& flag() const { return flag_; }

    std::string value() {
        if (inline_value_) return *inline_value_;
        if (i_ >= args_.size() || is_flag(args_[i_])) {
            throw ConfigError(flag_ + " requires a value");
        }
        return args_[i_++];
    }

    /// Optional positional value (no inline form); consumed if present.
    std::optional<std::string> optional_positional() {
        if (i_ < args_.size() && !is_flag(args_[i_])) return args_[i_++];
        return std::nullopt;
    }

private:
    const std::vector<std::string>& args_;
    size_t i_ = 0;
    std::string flag_;
    std::optional<std::string> inline_value_;
};

} // anonymous namespace

std::string_view mode_name(TransportMode mode) {
    switch (mode) {
        case TransportMode::Stdio: return "stdio";
        case TransportMode::Tcp:   return "tcp";
        case TransportMode::Http:  return "http";
    }
    return "stdio";
}

TransportMode parse_mode(std::string_view name) {
    if (name == "stdio") return TransportMode::Stdio;
    if (name == "tcp") return TransportMode::Tcp;
    if (name == "http") return TransportMode::Http;
    throw ConfigError("--mode: expected stdio, tcp or http, got '" + std::string(name) + "'");
}

ServerConfig parse_args(const std::vector<std::string>& args) {
    ServerConfig cfg;
    ArgCursor cur(args);
    while (cur.next()) {
        const std::string& flag = cur.flag();
        if (flag == "--help" || flag == "-h") {
            cfg.show_help = true;
        } else if (flag == "--version" || flag == "-V") {
            cfg.show_version = true;
        } else if (flag == "--mode") {
            cfg.mode = parse_mode(cur.value());
        } else if (flag == "--host") {
            cfg.host = cur.value();
            if (cfg.host.empty()) throw ConfigError("--host must not be empty");
        } else if (flag == "--port") {
            cfg.port = static_cast<uint16_t>(parse_integer(flag, cur.value(), 1, 65535));
        } else if (flag == "--log-level") {
            cfg.log_level = parse_log_level(cur.value());
        } else if (flag == "--max-connections") {
            cfg.max_connections = static_cast<size_t>(
                parse_integer(flag, cur.value(), 1, 65536));
        } else if (flag == "--session-timeout") {
            cfg.session_timeout = std::chrono::seconds(
                parse_integer(flag, cur.value(), 1, std::numeric_limits<int32_t>::max()));
        } else if (flag == "--allow-origin") {
            cfg.allowed_origins.push_back(cur.value());
        } else if (flag == "--call") {
            cfg.call_tool = cur.value();
            if (auto json = cur.optional_positional()) cfg.call_arguments = *json;
        } else {
            throw ConfigError("unknown option: " + flag);
        }
    }
    return cfg;
}

ServerConfig parse_args(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse_args(args);
}

std::string usage(std::string_view program) {
    std::ostringstream out;
    out << "Usage:\n";
    out << "  " << program << " [--mode stdio|tcp|http] [options]\n";
    out << "  " << program << " --call <tool> [json-arguments]\n";
    out << "\n";
    out << "Options:\n";
    out << "  --mode <m>               Transport: stdio (default), tcp or http\n";
    out << "  --host <addr>            Bind address for tcp/http (default 0.0.0.0)\n";
    out << "  --port <n>               Port for tcp/http (default 8080)\n";
    out << "  --log-level <lvl>        trace|debug|info|warn|error|critical|off (default info)\n";
    out << "  --max-connections <n>    Concurrent TCP connections (default 64)\n";
    out << "  --session-timeout <s>    Idle HTTP session lifetime in seconds (default 1800)\n";
    out << "  --allow-origin <origin>  Accepted HTTP Origin; repeatable (default: any)\n";
    out << "  --call <tool> [json]     Invoke one tool, print its text and exit\n";
    out << "  --version                Print version and exit\n";
    out << "  --help                   Show this help\n";
    return out.str();
}

} // namespace mcpd
