#include "mcpd/tools/echo_tool.hpp"
#include "mcpd/logging.hpp"

namespace mcpd {

ToolDefinition EchoTool::definition() {
    ToolDefinition def;
    def.name = std::string(NAME);
    def.description = "Echo back the provided message";
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"message", {{"type", "string"}, {"description", "Message to echo back"}}}
        }},
        {"required", {"message"}}
    };
    return def;
}

ToolOutcome EchoTool::operator()(const ToolRequest& request) const {
    auto it = request.arguments.find("message");
    if (it == request.arguments.end() || !it->is_string()) {
        log()->info("TOOL: echotest (raw) -> {}", request.raw_arguments);
        return CallToolResult::text(request.raw_arguments);
    }
    std::string message = it->get<std::string>();
    log()->info("TOOL: echotest -> {}", message);
    return CallToolResult::text(std::move(message));
}

} // namespace mcpd
