#include "mcpd/types.hpp"
#include <stdexcept>

namespace mcpd {

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
}

// ---------- Content ----------

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    const std::string type = j.at("type").get<std::string>();
    if (type == "text") {
        c = j.get<TextContent>();
    } else {
        throw std::invalid_argument("Unsupported content type: " + type);
    }
}

std::string joined_text(const CallToolResult& result) {
    std::string out;
    for (const auto& c : result.content) {
        if (!out.empty()) out += '\n';
        std::visit([&out](const TextContent& t) { out += t.text; }, c);
    }
    return out;
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (!t.description.empty()) j["description"] = t.description;
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.input_schema = j.at("inputSchema");
    t.description = j.value("description", std::string());
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(cj);
    }
    if (t.is_error) j["isError"] = t.is_error;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    if (j.contains("content")) {
        for (const auto& cj : j.at("content")) {
            Content c;
            from_json(cj, c);
            t.content.push_back(std::move(c));
        }
    }
    if (j.contains("isError")) t.is_error = j.at("isError").get<bool>();
}

// ---------- Handshake ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

} // namespace mcpd
