#pragma once
#include "registry.hpp"
#include "types.hpp"
#include <string>
#include <string_view>

namespace mcpd {

/// Transport-independent invocation engine. Every outcome, including
/// unknown tools, bad arguments and handler faults, comes back as a
/// CallToolResult; nothing is thrown to the caller.
class Dispatcher {
public:
    explicit Dispatcher(const ToolRegistry& registry) : registry_(registry) {}

    /// `raw_arguments` is the JSON text of the arguments object. Empty
    /// input and `null` are treated as `{}`.
    [[nodiscard]] CallToolResult invoke(const std::string& name,
                                        std::string_view raw_arguments) const noexcept;

    [[nodiscard]] const ToolRegistry& registry() const { return registry_; }

private:
    const ToolRegistry& registry_;
};

} // namespace mcpd
