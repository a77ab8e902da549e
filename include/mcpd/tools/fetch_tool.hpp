#pragma once
#include "../tool.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace mcpd {

/// `fetch`: HTTP(S) GET of a URL, returning status line, byte count and a
/// bounded prefix of the body.
class FetchTool {
public:
    static constexpr std::string_view NAME = "fetch";

    static constexpr int64_t DEFAULT_MAX_BYTES = 4096;
    static constexpr int64_t MIN_BYTES = 256;
    static constexpr int64_t MAX_BYTES = 65536;

    struct Options {
        std::string user_agent = "mcpd/1.1.0 (+https://example.local)";
        std::chrono::milliseconds timeout{10000};
    };

    FetchTool() = default;
    explicit FetchTool(Options opts) : opts_(std::move(opts)) {}

    [[nodiscard]] static ToolDefinition definition();

    /// `v <= 0` selects the default; anything else is bounded to
    /// [MIN_BYTES, MAX_BYTES].
    [[nodiscard]] static int64_t clamp_max_bytes(int64_t v);

    ToolOutcome operator()(const ToolRequest& request) const;

private:
    Options opts_;
};

} // namespace mcpd
