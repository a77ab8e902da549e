#include "mcpd/transport/http_transport.hpp"
#include "mcpd/codec.hpp"
#include "mcpd/error.hpp"
#include "mcpd/logging.hpp"
#include "mcpd/version.hpp"

#include <httplib.h>

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace mcpd {

namespace {

std::string generate_uuid() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    // Format as UUID v4
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

bool is_supported_protocol(const std::string& version) {
    return version == PROTOCOL_VERSION || version == "2025-03-26";
}

void set_error(httplib::Response& res, int status, int code, const std::string& message) {
    res.status = status;
    res.set_content(Codec::serialize(JsonRpcResponse::failure(std::nullopt, code, message)),
                    "application/json");
}

bool opens_session(const Frame& frame) {
    for (const auto& m : frame.messages) {
        if (const auto* req = std::get_if<JsonRpcRequest>(&m)) {
            if (req->method == "initialize") return true;
        }
    }
    return false;
}

std::string health_body() {
    nlohmann::json j = {
        {"status", "ok"},
        {"service", std::string(SERVER_NAME)},
        {"version", "v" + std::string(LIBRARY_VERSION)}
    };
    return j.dump();
}

} // anonymous namespace

HttpServerTransport::HttpServerTransport(Options opts)
    : opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
}

HttpServerTransport::~HttpServerTransport() {
    shutdown();
    if (reaper_thread_.joinable()) reaper_thread_.join();
}

bool HttpServerTransport::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    return std::find(opts_.allowed_origins.begin(), opts_.allowed_origins.end(), origin)
           != opts_.allowed_origins.end();
}

std::string HttpServerTransport::create_session() {
    HttpSession session;
    session.id = generate_uuid();
    session.last_seen = std::chrono::steady_clock::now();
    std::string id = session.id;
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.emplace(id, std::move(session));
    return id;
}

bool HttpServerTransport::touch_session(const std::string& id) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;
    if (now - it->second.last_seen > opts_.session_timeout) {
        sessions_.erase(it);
        return false;
    }
    it->second.last_seen = now;
    return true;
}

size_t HttpServerTransport::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

size_t HttpServerTransport::reap_idle_sessions() {
    const auto now = std::chrono::steady_clock::now();
    size_t removed = 0;
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second.last_seen > opts_.session_timeout) {
            log()->info("session {} expired", it->first);
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void HttpServerTransport::reaper_loop() {
    // A shutdown() that ran before listen_after_bind() marked the server
    // running found nothing to stop; repeat it once the listener is up.
    while (!server_->is_running() && !listen_returned_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (shutdown_requested_) server_->stop();

    const auto period = std::clamp<std::chrono::seconds>(
        opts_.session_timeout / 2, std::chrono::seconds(1), std::chrono::seconds(60));
    std::unique_lock<std::mutex> lock(reaper_mutex_);
    while (!shutdown_requested_) {
        reaper_cv_.wait_for(lock, period, [this] { return shutdown_requested_.load(); });
        if (shutdown_requested_) break;
        lock.unlock();
        reap_idle_sessions();
        lock.lock();
    }
}

void HttpServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    // DNS rebinding protection
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !validate_origin(origin)) {
        log()->warn("rejected origin {}", origin);
        set_error(res, 403, error::InvalidRequest, "Invalid origin");
        return;
    }

    auto proto_ver = req.get_header_value("MCP-Protocol-Version");
    if (!proto_ver.empty() && !is_supported_protocol(proto_ver)) {
        set_error(res, 400, error::InvalidRequest, "Unsupported protocol version: " + proto_ver);
        return;
    }

    Frame frame = decode_frame(req.body);
    if (frame.messages.empty()) {
        // Nothing usable: answer with the decode errors alone.
        std::vector<JsonRpcMessage> replies(frame.rejects.begin(), frame.rejects.end());
        res.status = 400;
        res.set_content(encode_replies(replies, frame.batch).value_or("{}"), "application/json");
        return;
    }

    std::string session_id = req.get_header_value(SESSION_HEADER);
    if (session_id.empty()) {
        if (!opens_session(frame)) {
            set_error(res, 400, error::InvalidRequest, "Bad Request: missing session ID");
            return;
        }
        session_id = create_session();
        log()->info("session {} created", session_id);
    } else if (!touch_session(session_id)) {
        set_error(res, 404, error::InvalidRequest, "Session not found");
        return;
    }
    res.set_header(SESSION_HEADER, session_id);

    std::vector<JsonRpcMessage> replies(frame.rejects.begin(), frame.rejects.end());
    for (const auto& msg : frame.messages) {
        if (auto reply = message_handler_(msg)) {
            replies.push_back(std::move(*reply));
        }
    }

    if (!frame.has_requests() && replies.empty()) {
        res.status = 202;
        return;
    }

    auto payload = encode_replies(replies, frame.batch);
    if (!payload) {
        res.status = 202;
        return;
    }

    const bool want_sse = req.get_header_value("Accept").find("text/event-stream")
                          != std::string::npos;
    if (!want_sse) {
        res.set_content(*payload, "application/json");
        return;
    }

    res.set_header("Cache-Control", "no-cache");
    std::string event = "event: message\ndata: " + *payload + "\n\n";
    res.set_chunked_content_provider("text/event-stream",
        [event = std::move(event)](size_t /*offset*/, httplib::DataSink& sink) -> bool {
            if (!sink.write(event.data(), event.size())) return false;
            sink.done();
            return true;
        });
}

void HttpServerTransport::handle_delete(const httplib::Request& req, httplib::Response& res) {
    std::string session_id = req.get_header_value(SESSION_HEADER);
    if (session_id.empty()) {
        set_error(res, 400, error::InvalidRequest, "Bad Request: missing session ID");
        return;
    }
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        set_error(res, 404, error::InvalidRequest, "Session not found");
        return;
    }
    sessions_.erase(it);
    log()->info("session {} terminated by client", session_id);
    res.status = 200;
}

void HttpServerTransport::setup_routes() {
    const std::string path = opts_.mcp_path;

    server_->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        try {
            handle_post(req, res);
        } catch (const std::exception& e) {
            log()->error("POST {} failed: {}", req.path, e.what());
            if (error_callback_) error_callback_(std::current_exception());
            set_error(res, 500, error::InternalError, "Internal server error");
        }
    });

    // No server-initiated stream is offered.
    server_->Get(path, [](const httplib::Request&, httplib::Response& res) {
        res.status = 405;
        res.set_header("Allow", "POST, DELETE");
    });

    server_->Delete(path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_delete(req, res);
    });

    auto health = [](const httplib::Request&, httplib::Response& res) {
        res.set_content(health_body(), "application/json");
    };
    server_->Get("/health", health);
    server_->Get("/healthz", health);

    server_->set_payload_max_length(opts_.max_body_bytes);

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        log()->info("[REQUEST] Method={} Path={} RemoteAddr={}:{} UserAgent={}", req.method,
                    req.path, req.remote_addr, req.remote_port,
                    req.has_header("User-Agent") ? req.get_header_value("User-Agent")
                                                 : std::string("Unknown"));
        log()->info("[RESPONSE] Path={} Status={}", req.path, res.status);
    });
}

uint16_t HttpServerTransport::bind_and_listen() {
    if (bound_) return bound_port_;
    if (opts_.port == 0) {
        int port = server_->bind_to_any_port(opts_.host);
        if (port < 0) {
            throw McpdTransportError("Failed to bind HTTP server on " + opts_.host);
        }
        bound_port_ = static_cast<uint16_t>(port);
    } else {
        if (!server_->bind_to_port(opts_.host, opts_.port)) {
            throw McpdTransportError("Failed to bind HTTP server on " + opts_.host + ":"
                                     + std::to_string(opts_.port));
        }
        bound_port_ = opts_.port;
    }
    bound_ = true;
    return bound_port_;
}

void HttpServerTransport::start(MessageHandler on_message, ErrorCallback on_error) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;

    message_handler_ = std::move(on_message);
    error_callback_ = std::move(on_error);

    setup_routes();
    try {
        bind_and_listen();
    } catch (const McpdTransportError&) {
        running_ = false;
        throw;
    }

    reaper_thread_ = std::thread([this] { reaper_loop(); });
    log()->info("HTTP transport listening on http://{}:{}{}", opts_.host, bound_port_,
                opts_.mcp_path);

    // Blocks until stop()
    bool ok = server_->listen_after_bind();
    listen_returned_ = true;
    running_ = false;

    shutdown_requested_ = true;
    reaper_cv_.notify_all();
    if (reaper_thread_.joinable()) reaper_thread_.join();

    if (!ok) {
        throw McpdTransportError("HTTP server on " + opts_.host + ":"
                                 + std::to_string(bound_port_) + " stopped unexpectedly");
    }
}

bool HttpServerTransport::wait_until_ready(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (server_->is_running()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return server_->is_running();
}

void HttpServerTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
    }
    reaper_cv_.notify_all();
    server_->stop();
}

bool HttpServerTransport::is_connected() const {
    return running_;
}

} // namespace mcpd
