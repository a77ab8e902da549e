#include "mcpd/dispatcher.hpp"
#include "mcpd/codec.hpp"
#include "mcpd/logging.hpp"

namespace mcpd {

namespace {

bool is_blank(std::string_view s) {
    return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

CallToolResult fold(ToolOutcome outcome, const std::string& tool) {
    if (auto* failure = std::get_if<ToolFailure>(&outcome)) {
        log()->error("tool {} failed ({}): {}", tool, error_kind_name(failure->kind),
                     failure->message);
        return CallToolResult::text(std::move(failure->message));
    }
    auto result = std::get<CallToolResult>(std::move(outcome));
    if (result.content.empty()) {
        log()->error("tool {} returned no content", tool);
        return CallToolResult::text("Error: tool returned no content");
    }
    return result;
}

} // anonymous namespace

CallToolResult Dispatcher::invoke(const std::string& name,
                                  std::string_view raw_arguments) const noexcept {
    try {
        const ToolHandler* handler = registry_.find(name);
        if (!handler) {
            log()->warn("unknown tool requested: {}", name);
            return CallToolResult::text("Unknown tool: " + name);
        }

        ToolRequest request;
        request.name = name;
        request.raw_arguments = std::string(raw_arguments);
        if (!is_blank(raw_arguments)) {
            nlohmann::json decoded;
            try {
                decoded = Codec::parse_json(raw_arguments);
            } catch (const McpdParseError& e) {
                log()->error("tool {}: invalid arguments: {}", name, e.what());
                return CallToolResult::text("Error: Invalid JSON arguments");
            }
            if (decoded.is_object()) {
                request.arguments = std::move(decoded);
            } else if (!decoded.is_null()) {
                log()->error("tool {}: arguments are not a JSON object", name);
                return CallToolResult::text("Error: Invalid JSON arguments");
            }
        }

        return fold((*handler)(request), name);
    } catch (const std::exception& e) {
        log()->error("tool {} raised: {}", name, e.what());
        return CallToolResult::text(std::string("Error: ") + e.what());
    } catch (...) {
        log()->error("tool {} raised a non-standard exception", name);
        return CallToolResult::text("Error: unknown internal failure");
    }
}

} // namespace mcpd
