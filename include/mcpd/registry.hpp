#pragma once
#include "tool.hpp"
#include "types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpd {

/// Catalogue of tools. Populated once at startup and only read afterwards,
/// so concurrent lookups need no locking.
class ToolRegistry {
public:
    /// Throws DuplicateToolError if `def.name` is already registered.
    void add(ToolDefinition def, ToolHandler handler);

    /// Throws UnknownToolError if `name` is not registered.
    [[nodiscard]] const ToolHandler& lookup(const std::string& name) const;

    /// Non-throwing lookup; nullptr when absent.
    [[nodiscard]] const ToolHandler* find(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const;

    /// Definitions in registration order.
    [[nodiscard]] const std::vector<ToolDefinition>& list() const { return definitions_; }

    [[nodiscard]] size_t size() const { return definitions_.size(); }

private:
    std::vector<ToolDefinition> definitions_;
    std::unordered_map<std::string, ToolHandler> handlers_;
};

} // namespace mcpd
