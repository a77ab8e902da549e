#include "mcpd/tools/time_tool.hpp"
#include "mcpd/error.hpp"
#include "mcpd/logging.hpp"
#include "mcpd/zoneinfo.hpp"
#include <ctime>

namespace mcpd {

namespace {

int32_t local_offset_at(std::time_t t) {
    std::tm tm{};
    if (!localtime_r(&t, &tm)) {
        return 0;
    }
    return static_cast<int32_t>(tm.tm_gmtoff);
}

} // anonymous namespace

TimeServerTool::TimeServerTool() : TimeServerTool(Options{}) {}

TimeServerTool::TimeServerTool(Options opts) : opts_(std::move(opts)) {
    if (opts_.search_path.empty()) {
        opts_.search_path = TimeZone::default_search_path();
    }
    if (!opts_.clock) {
        opts_.clock = [] { return std::chrono::system_clock::now(); };
    }
}

ToolDefinition TimeServerTool::definition() {
    ToolDefinition def;
    def.name = std::string(NAME);
    def.description = "Return current time; optional IANA tz via timezone arg";
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"timezone", {{"type", "string"}, {"description", "IANA timezone, e.g. Europe/Kyiv"}}}
        }}
    };
    return def;
}

ToolOutcome TimeServerTool::operator()(const ToolRequest& request) const {
    std::string zone;
    auto it = request.arguments.find("timezone");
    if (it != request.arguments.end() && it->is_string()) {
        zone = it->get<std::string>();
    }

    const auto now = opts_.clock();
    const int64_t unix_seconds =
        std::chrono::floor<std::chrono::seconds>(now.time_since_epoch()).count();

    int32_t offset = 0;
    std::string label;
    if (zone.empty()) {
        label = "Local";
        offset = local_offset_at(static_cast<std::time_t>(unix_seconds));
    } else {
        try {
            offset = TimeZone::load(zone, opts_.search_path).offset_at(unix_seconds).seconds;
        } catch (const InvalidTimezoneError& e) {
            log()->debug("timezone lookup failed: {}", e.what());
            return ToolFailure{ErrorKind::InvalidTimezone,
                               "Error: invalid timezone '" + zone + "'"};
        }
        label = zone;
    }

    std::string text = "now_local=" + format_iso8601(now, offset) + " (tz=" + label + ")\n";
    text += "now_utc=" + format_iso8601(now, 0) + "\n";
    text += "unix=" + std::to_string(unix_seconds);

    log()->info("TOOL: timeserver (tz={})", label);
    return CallToolResult::text(std::move(text));
}

} // namespace mcpd
