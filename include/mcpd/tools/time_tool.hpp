#pragma once
#include "../tool.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpd {

/// `timeserver`: current time in UTC and in a requested IANA zone (or the
/// host's local zone when none is given).
class TimeServerTool {
public:
    static constexpr std::string_view NAME = "timeserver";

    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct Options {
        std::vector<std::string> search_path;  // empty = TimeZone::default_search_path()
        Clock clock;                           // empty = system_clock::now
    };

    TimeServerTool();
    explicit TimeServerTool(Options opts);

    [[nodiscard]] static ToolDefinition definition();

    ToolOutcome operator()(const ToolRequest& request) const;

private:
    Options opts_;
};

} // namespace mcpd
