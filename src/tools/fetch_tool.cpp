#include "mcpd/tools/fetch_tool.hpp"
#include "mcpd/logging.hpp"
#include "mcpd/utf8.hpp"
#include <httplib.h>
#include <algorithm>
#include <condition_variable>
#include <limits>
#include <mutex>
#include <optional>
#include <thread>

namespace mcpd {

namespace {

struct UrlParts {
    std::string origin;  // scheme://authority
    std::string target;  // path?query, at least "/"
};

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

UrlParts split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    auto rest_start = scheme_end + 3;
    auto path_start = url.find_first_of("/?#", rest_start);

    UrlParts parts;
    parts.origin = url.substr(0, path_start);
    if (path_start != std::string::npos) {
        parts.target = url.substr(path_start);
        auto hash = parts.target.find('#');
        if (hash != std::string::npos) parts.target.erase(hash);
    }
    if (parts.target.empty() || parts.target.front() != '/') {
        parts.target.insert(0, "/");
    }
    return parts;
}

// A Content-Length value that is not a plain non-negative integer is
// treated as absent.
std::optional<int64_t> parse_content_length(const std::string& value) {
    if (value.empty() || value.size() > 18
        || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    return std::stoll(value);
}

std::optional<int64_t> requested_max_bytes(const nlohmann::json& args) {
    auto it = args.find("max_bytes");
    if (it == args.end()) return std::nullopt;
    if (it->is_number_unsigned()) {
        auto v = it->get<uint64_t>();
        return static_cast<int64_t>(
            std::min<uint64_t>(v, static_cast<uint64_t>(std::numeric_limits<int64_t>::max())));
    }
    if (it->is_number_integer()) return it->get<int64_t>();
    return std::nullopt;
}

enum class StopReason { None, ByteCap, HttpError, Deadline };

// Stops the client once the overall deadline passes, whatever phase the
// request is in (connect, status line, headers or body).
class DeadlineWatch {
public:
    DeadlineWatch(httplib::Client& cli, std::chrono::steady_clock::time_point deadline)
        : thread_([this, &cli, deadline] {
              std::unique_lock<std::mutex> lock(mutex_);
              auto done = [this] { return done_; };
              if (cv_.wait_until(lock, deadline, done)) return;
              fired_ = true;
              // stop() is a no-op until a socket exists, so repeat it.
              do {
                  lock.unlock();
                  cli.stop();
                  lock.lock();
              } while (!cv_.wait_for(lock, std::chrono::milliseconds(50), done));
          }) {}

    ~DeadlineWatch() { disarm(); }

    DeadlineWatch(const DeadlineWatch&) = delete;
    DeadlineWatch& operator=(const DeadlineWatch&) = delete;

    void disarm() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    bool fired() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fired_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    bool fired_ = false;
    std::thread thread_;
};

ToolFailure fail(ErrorKind kind, std::string text, const std::string& url) {
    log()->warn("fetch error: {} (url={})", text, url);
    return ToolFailure{kind, std::move(text)};
}

} // anonymous namespace

ToolDefinition FetchTool::definition() {
    ToolDefinition def;
    def.name = std::string(NAME);
    def.description =
        "Fetch content from a URL (HTTP/HTTPS). Optional max_bytes to limit response size";
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"url", {{"type", "string"}, {"description", "URL to fetch (must be http or https)"}}},
            {"max_bytes", {
                {"type", "integer"},
                {"description", "Limit response body bytes (default 4096, min 256, max 65536)"}
            }}
        }},
        {"required", {"url"}}
    };
    return def;
}

int64_t FetchTool::clamp_max_bytes(int64_t v) {
    if (v <= 0) return DEFAULT_MAX_BYTES;
    return std::clamp(v, MIN_BYTES, MAX_BYTES);
}

ToolOutcome FetchTool::operator()(const ToolRequest& request) const {
    std::string url;
    auto it = request.arguments.find("url");
    if (it != request.arguments.end() && it->is_string()) {
        url = it->get<std::string>();
    }
    if (url.empty()) {
        return ToolFailure{ErrorKind::InvalidArguments, "Error: URL is required"};
    }
    if (!starts_with(url, "http://") && !starts_with(url, "https://")) {
        return ToolFailure{ErrorKind::InvalidArguments,
                           "Error: URL must start with http:// or https://"};
    }
    const int64_t max_bytes = clamp_max_bytes(requested_max_bytes(request.arguments).value_or(0));

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (starts_with(url, "https://")) {
        return fail(ErrorKind::NetworkTransportError,
                    "URL Error: https is not supported by this build", url);
    }
#endif

    const UrlParts parts = split_url(url);
    httplib::Client cli(parts.origin);
    if (!cli.is_valid()) {
        return fail(ErrorKind::InternalError, "Fetch error: invalid URL '" + url + "'", url);
    }

    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(opts_.timeout);
    const auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(opts_.timeout - secs);
    cli.set_connection_timeout(secs.count(), usecs.count());
    cli.set_read_timeout(secs.count(), usecs.count());
    cli.set_write_timeout(secs.count(), usecs.count());
    cli.set_follow_location(true);
    cli.set_keep_alive(false);
    cli.set_decompress(false);

    const auto started = std::chrono::steady_clock::now();
    auto expired = [&] { return std::chrono::steady_clock::now() - started >= opts_.timeout; };

    int status = 0;
    std::string reason;
    std::optional<int64_t> content_length;
    std::string body;
    StopReason stop = StopReason::None;

    // Identity encoding keeps Content-Length comparable with the bytes read.
    httplib::Headers headers = {
        {"User-Agent", opts_.user_agent},
        {"Accept-Encoding", "identity"}
    };

    auto on_response = [&](const httplib::Response& res) {
        if (expired()) {
            stop = StopReason::Deadline;
            return false;
        }
        status = res.status;
        reason = res.reason.empty() ? httplib::status_message(res.status) : res.reason;
        if (res.has_header("Content-Length")) {
            content_length = parse_content_length(res.get_header_value("Content-Length"));
        }
        if (status >= 400) {
            stop = StopReason::HttpError;
            return false;
        }
        return true;
    };

    auto on_content = [&](const char* data, size_t len) {
        if (expired()) {
            stop = StopReason::Deadline;
            return false;
        }
        auto room = static_cast<size_t>(max_bytes) - body.size();
        body.append(data, std::min(len, room));
        if (body.size() >= static_cast<size_t>(max_bytes)) {
            stop = StopReason::ByteCap;
            return false;
        }
        return true;
    };

    DeadlineWatch watch(cli, started + opts_.timeout);
    auto res = cli.Get(parts.target.c_str(), headers, on_response, on_content);
    watch.disarm();
    const auto err = res.error();

    if (stop == StopReason::HttpError || (res && res->status >= 400)) {
        return fail(ErrorKind::NetworkProtocolError,
                    "HTTP Error " + std::to_string(status) + ": " + reason, url);
    }
    if (stop == StopReason::Deadline || watch.fired()) {
        return fail(ErrorKind::NetworkTransportError, "URL Error: timed out", url);
    }
    const bool complete = err == httplib::Error::Success
                          || (err == httplib::Error::Canceled && stop == StopReason::ByteCap);
    if (!complete) {
        switch (err) {
            case httplib::Error::Connection:
            case httplib::Error::ConnectionTimeout:
            case httplib::Error::Read:
            case httplib::Error::Write:
            case httplib::Error::BindIPAddress:
            case httplib::Error::SSLConnection:
            case httplib::Error::SSLLoadingCerts:
            case httplib::Error::SSLServerVerification:
            case httplib::Error::ExceedRedirectCount:
            case httplib::Error::ProxyConnection:
                if (expired()) {
                    return fail(ErrorKind::NetworkTransportError, "URL Error: timed out", url);
                }
                return fail(ErrorKind::NetworkTransportError,
                            "URL Error: " + httplib::to_string(err), url);
            default:
                return fail(ErrorKind::InternalError,
                            "Fetch error: " + httplib::to_string(err), url);
        }
    }

    if (status == 0 && res) {
        status = res->status;
        reason = res->reason;
    }

    const bool truncated = content_length && *content_length > max_bytes;
    std::string text = "URL: " + url + "\n";
    text += "Status: " + std::to_string(status) + " " + reason + "\n";
    text += "Bytes: " + std::to_string(body.size()) + (truncated ? " (truncated)" : "") + "\n\n";
    text += sanitize_utf8(body);

    log()->info("TOOL: fetch -> {} ({} bytes)", url, body.size());
    return CallToolResult::text(std::move(text));
}

} // namespace mcpd
