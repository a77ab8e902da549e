#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpd {

// ---------- Content types ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

/// Tagged union of content kinds. Visit it; never probe for members.
using Content = std::variant<TextContent>;

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && is_error == o.is_error;
    }

    static CallToolResult text(std::string s) {
        CallToolResult r;
        r.content.emplace_back(TextContent{std::move(s)});
        return r;
    }
};

/// Concatenate the text items of a result, one per line.
std::string joined_text(const CallToolResult& result);

// ---------- Handshake ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
};

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

// Handshake types are only ever sent.
void to_json(nlohmann::json& j, const ServerCapabilities& t);
void to_json(nlohmann::json& j, const Implementation& t);
void to_json(nlohmann::json& j, const InitializeResult& t);

} // namespace mcpd
