#pragma once
#include "../tool.hpp"
#include <string_view>

namespace mcpd {

/// `echotest`: returns `message` verbatim. Without a string `message`
/// it echoes the raw argument payload instead.
class EchoTool {
public:
    static constexpr std::string_view NAME = "echotest";

    [[nodiscard]] static ToolDefinition definition();

    ToolOutcome operator()(const ToolRequest& request) const;
};

} // namespace mcpd
