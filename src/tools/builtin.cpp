#include "mcpd/tools/builtin.hpp"
#include "mcpd/tools/echo_tool.hpp"
#include "mcpd/tools/fetch_tool.hpp"
#include "mcpd/tools/time_tool.hpp"

namespace mcpd {

void register_builtin_tools(ToolRegistry& registry) {
    registry.add(EchoTool::definition(), EchoTool{});
    registry.add(TimeServerTool::definition(), TimeServerTool{});
    registry.add(FetchTool::definition(), FetchTool{});
}

} // namespace mcpd
