#pragma once
#include "types.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace mcpd {

/// Failure categories a tool invocation can end in. Each one is reported
/// to the client as text; none is thrown past the Dispatcher.
enum class ErrorKind {
    UnknownTool,
    InvalidArguments,
    InvalidTimezone,
    NetworkProtocolError,
    NetworkTransportError,
    InternalError
};

std::string_view error_kind_name(ErrorKind kind);

/// A tool failure. `message` is the exact text delivered to the client.
struct ToolFailure {
    ErrorKind kind;
    std::string message;

    bool operator==(const ToolFailure& o) const {
        return kind == o.kind && message == o.message;
    }
};

using ToolOutcome = std::variant<CallToolResult, ToolFailure>;

/// One invocation. `arguments` is always a JSON object; `raw_arguments`
/// keeps the payload exactly as it arrived.
struct ToolRequest {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
    std::string raw_arguments;
};

using ToolHandler = std::function<ToolOutcome(const ToolRequest& request)>;

} // namespace mcpd
