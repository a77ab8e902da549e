#include "mcpd/registry.hpp"
#include "mcpd/error.hpp"

namespace mcpd {

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownTool:           return "UnknownTool";
        case ErrorKind::InvalidArguments:      return "InvalidArguments";
        case ErrorKind::InvalidTimezone:       return "InvalidTimezone";
        case ErrorKind::NetworkProtocolError:  return "NetworkProtocolError";
        case ErrorKind::NetworkTransportError: return "NetworkTransportError";
        case ErrorKind::InternalError:         return "InternalError";
    }
    return "InternalError";
}

void ToolRegistry::add(ToolDefinition def, ToolHandler handler) {
    if (handlers_.count(def.name) > 0) {
        throw DuplicateToolError(def.name);
    }
    handlers_.emplace(def.name, std::move(handler));
    definitions_.push_back(std::move(def));
}

const ToolHandler& ToolRegistry::lookup(const std::string& name) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        throw UnknownToolError(name);
    }
    return it->second;
}

const ToolHandler* ToolRegistry::find(const std::string& name) const {
    auto it = handlers_.find(name);
    return it == handlers_.end() ? nullptr : &it->second;
}

bool ToolRegistry::contains(const std::string& name) const {
    return handlers_.count(name) > 0;
}

} // namespace mcpd
