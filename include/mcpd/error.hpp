#pragma once
#include <stdexcept>
#include <string>

namespace mcpd {

class McpdError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class McpdParseError : public McpdError {
public:
    using McpdError::McpdError;
};

class McpdProtocolError : public McpdError {
public:
    int code;
    McpdProtocolError(int code, const std::string& msg)
        : McpdError(msg), code(code) {}
};

class McpdTransportError : public McpdError {
public:
    using McpdError::McpdError;
};

class DuplicateToolError : public McpdError {
public:
    explicit DuplicateToolError(const std::string& name)
        : McpdError("Tool already registered: " + name) {}
};

class UnknownToolError : public McpdError {
public:
    explicit UnknownToolError(const std::string& name)
        : McpdError("Unknown tool: " + name) {}
};

class InvalidTimezoneError : public McpdError {
public:
    using McpdError::McpdError;
};

class ConfigError : public McpdError {
public:
    using McpdError::McpdError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace mcpd
