#pragma once
#include "../registry.hpp"

namespace mcpd {

/// Register `echotest`, `timeserver` and `fetch`, in that order.
void register_builtin_tools(ToolRegistry& registry);

} // namespace mcpd
