#pragma once
#include <string_view>

namespace mcpd {

constexpr std::string_view SERVER_NAME         = "mcpd";
constexpr std::string_view LIBRARY_VERSION     = "1.1.0";
constexpr std::string_view PROTOCOL_VERSION    = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

} // namespace mcpd
