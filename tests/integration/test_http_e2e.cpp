#include <gtest/gtest.h>
#include "mcpd/error.hpp"
#include "mcpd/server.hpp"
#include "mcpd/tools/builtin.hpp"
#include "mcpd/transport/http_transport.hpp"
#include <httplib.h>
#include <chrono>
#include <future>
#include <thread>

using namespace mcpd;

namespace {

const char* INIT_BODY =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-06-18","clientInfo":{"name":"http-test","version":"1"}}})";

} // namespace

class HttpE2ETest : public ::testing::Test {
protected:
    void start(HttpServerTransport::Options opts = {}) {
        register_builtin_tools(registry_);
        server_ = std::make_unique<McpServer>(registry_);

        opts.host = "127.0.0.1";
        opts.port = 0;
        auto transport = std::make_unique<HttpServerTransport>(opts);
        transport_ = transport.get();
        port_ = transport->bind_and_listen();
        ASSERT_GT(port_, 0);

        server_thread_ = std::thread([this, t = std::move(transport)]() mutable {
            server_->serve(std::move(t));
        });
        ASSERT_TRUE(transport_->wait_until_ready(std::chrono::milliseconds(5000)));

        client_ = std::make_unique<httplib::Client>("127.0.0.1", port_);
        client_->set_read_timeout(10, 0);
    }

    void TearDown() override {
        if (server_) server_->shutdown();
        if (server_thread_.joinable()) server_thread_.join();
    }

    httplib::Result post(const std::string& body, const httplib::Headers& headers = {}) {
        return client_->Post("/mcp", headers, body, "application/json");
    }

    /// Initialize and return the session id.
    std::string open_session() {
        auto res = post(INIT_BODY);
        EXPECT_TRUE(res);
        if (!res) return {};
        EXPECT_EQ(res->status, 200);
        return res->get_header_value("Mcp-Session-Id");
    }

    ToolRegistry registry_;
    std::unique_ptr<McpServer> server_;
    HttpServerTransport* transport_ = nullptr;
    uint16_t port_ = 0;
    std::thread server_thread_;
    std::unique_ptr<httplib::Client> client_;
};

TEST_F(HttpE2ETest, Health) {
    start();
    for (const char* path : {"/health", "/healthz"}) {
        auto res = client_->Get(path);
        ASSERT_TRUE(res) << path;
        EXPECT_EQ(res->status, 200);
        auto body = nlohmann::json::parse(res->body);
        EXPECT_EQ(body["status"], "ok");
        EXPECT_EQ(body["service"], "mcpd");
        EXPECT_EQ(body["version"], "v1.1.0");
    }
}

TEST_F(HttpE2ETest, InitializeCreatesSession) {
    start();
    auto res = post(INIT_BODY);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    const auto session = res->get_header_value("Mcp-Session-Id");
    EXPECT_EQ(session.size(), 36u);
    EXPECT_EQ(transport_->session_count(), 1u);

    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["id"], 1);
    EXPECT_EQ(body["result"]["protocolVersion"], "2025-06-18");
    EXPECT_EQ(body["result"]["serverInfo"]["name"], "mcpd");
}

TEST_F(HttpE2ETest, CallToolWithinSession) {
    start();
    auto session = open_session();
    httplib::Headers headers = {{"Mcp-Session-Id", session}};

    auto note = post(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", headers);
    ASSERT_TRUE(note);
    EXPECT_EQ(note->status, 202);
    EXPECT_TRUE(note->body.empty());

    auto res = post(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echotest","arguments":{"message":"via http"}}})",
                    headers);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Mcp-Session-Id"), session);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["result"]["content"][0]["text"], "via http");
}

TEST_F(HttpE2ETest, MissingAndUnknownSession) {
    start();
    auto missing = post(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 400);

    auto unknown = post(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})",
                        {{"Mcp-Session-Id", "no-such-session"}});
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown->status, 404);
    EXPECT_EQ(nlohmann::json::parse(unknown->body)["error"]["message"], "Session not found");
}

TEST_F(HttpE2ETest, EventStreamReply) {
    start();
    auto session = open_session();
    httplib::Headers headers = {{"Mcp-Session-Id", session},
                                {"Accept", "application/json, text/event-stream"}};
    auto res = post(R"({"jsonrpc":"2.0","id":5,"method":"ping"})", headers);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Content-Type"), "text/event-stream");

    const std::string prefix = "event: message\ndata: ";
    ASSERT_EQ(res->body.rfind(prefix, 0), 0u) << res->body;
    ASSERT_GE(res->body.size(), prefix.size() + 2);
    EXPECT_EQ(res->body.substr(res->body.size() - 2), "\n\n");
    auto data = nlohmann::json::parse(
        res->body.substr(prefix.size(), res->body.size() - prefix.size() - 2));
    EXPECT_EQ(data["id"], 5);
    EXPECT_EQ(data["result"], nlohmann::json::object());
}

TEST_F(HttpE2ETest, BatchReply) {
    start();
    auto session = open_session();
    auto res = post(R"([{"jsonrpc":"2.0","id":1,"method":"ping"},{"jsonrpc":"2.0","id":2,"method":"tools/list"}])",
                    {{"Mcp-Session-Id", session}});
    ASSERT_TRUE(res);
    auto body = nlohmann::json::parse(res->body);
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 2u);
    EXPECT_EQ(body[1]["result"]["tools"].size(), 3u);
}

TEST_F(HttpE2ETest, MalformedBody) {
    start();
    auto res = post("{oops");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"]["code"], -32700);
    EXPECT_TRUE(body["id"].is_null());
}

TEST_F(HttpE2ETest, ProtocolVersionHeader) {
    start();
    auto session = open_session();
    auto old = post(R"({"jsonrpc":"2.0","id":1,"method":"ping"})",
                    {{"Mcp-Session-Id", session}, {"MCP-Protocol-Version", "2025-03-26"}});
    ASSERT_TRUE(old);
    EXPECT_EQ(old->status, 200);

    auto bogus = post(R"({"jsonrpc":"2.0","id":1,"method":"ping"})",
                      {{"Mcp-Session-Id", session}, {"MCP-Protocol-Version", "1999-01-01"}});
    ASSERT_TRUE(bogus);
    EXPECT_EQ(bogus->status, 400);
}

TEST_F(HttpE2ETest, GetStreamNotOffered) {
    start();
    auto res = client_->Get("/mcp");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 405);
    EXPECT_EQ(res->get_header_value("Allow"), "POST, DELETE");
}

TEST_F(HttpE2ETest, DeleteEndsSession) {
    start();
    auto session = open_session();

    auto no_header = client_->Delete("/mcp");
    ASSERT_TRUE(no_header);
    EXPECT_EQ(no_header->status, 400);

    httplib::Headers headers = {{"Mcp-Session-Id", session}};
    auto del = client_->Delete("/mcp", headers);
    ASSERT_TRUE(del);
    EXPECT_EQ(del->status, 200);
    EXPECT_EQ(transport_->session_count(), 0u);

    auto again = client_->Delete("/mcp", headers);
    ASSERT_TRUE(again);
    EXPECT_EQ(again->status, 404);

    auto after = post(R"({"jsonrpc":"2.0","id":2,"method":"ping"})", headers);
    ASSERT_TRUE(after);
    EXPECT_EQ(after->status, 404);
}

TEST_F(HttpE2ETest, OriginAllowList) {
    HttpServerTransport::Options opts;
    opts.allowed_origins = {"http://good.example"};
    start(opts);

    auto bad = post(INIT_BODY, {{"Origin", "http://evil.example"}});
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 403);

    auto good = post(INIT_BODY, {{"Origin", "http://good.example"}});
    ASSERT_TRUE(good);
    EXPECT_EQ(good->status, 200);

    // Non-browser clients send no Origin at all.
    auto none = post(INIT_BODY);
    ASSERT_TRUE(none);
    EXPECT_EQ(none->status, 200);
}

TEST_F(HttpE2ETest, IdleSessionsExpire) {
    HttpServerTransport::Options opts;
    opts.session_timeout = std::chrono::seconds(1);
    start(opts);
    auto session = open_session();
    EXPECT_EQ(transport_->session_count(), 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    auto res = post(R"({"jsonrpc":"2.0","id":2,"method":"ping"})", {{"Mcp-Session-Id", session}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(transport_->reap_idle_sessions() + transport_->session_count(), 0u);
}

TEST_F(HttpE2ETest, FetchToolAgainstOwnHealthEndpoint) {
    start();
    auto session = open_session();
    nlohmann::json req = {
        {"jsonrpc", "2.0"}, {"id", 9}, {"method", "tools/call"},
        {"params", {{"name", "fetch"},
                    {"arguments", {{"url", "http://127.0.0.1:" + std::to_string(port_) + "/health"}}}}}
    };
    auto res = post(req.dump(), {{"Mcp-Session-Id", session}});
    ASSERT_TRUE(res);
    auto text = nlohmann::json::parse(res->body)["result"]["content"][0]["text"].get<std::string>();
    EXPECT_NE(text.find("Status: 200 OK"), std::string::npos) << text;
    EXPECT_NE(text.find(R"("service":"mcpd")"), std::string::npos) << text;
}

TEST(HttpTransportShutdown, ShutdownDuringStartupIsNotLost) {
    for (int i = 0; i < 20; ++i) {
        HttpServerTransport::Options opts;
        opts.host = "127.0.0.1";
        opts.port = 0;
        auto transport = std::make_unique<HttpServerTransport>(opts);

        auto finished = std::make_shared<std::promise<void>>();
        auto done = finished->get_future();
        std::thread runner([t = transport.get(), finished] {
            try {
                t->start([](const JsonRpcMessage&) -> std::optional<JsonRpcMessage> {
                    return std::nullopt;
                });
            } catch (const McpdTransportError& e) {
                ADD_FAILURE() << e.what();
            }
            finished->set_value();
        });

        // Land the shutdown at different points of startup.
        std::this_thread::sleep_for(std::chrono::microseconds(200 * i));
        transport->shutdown();

        if (done.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            ADD_FAILURE() << "start() did not return after shutdown (iteration " << i << ")";
            runner.detach();
            (void)transport.release();
            return;
        }
        runner.join();
        EXPECT_FALSE(transport->is_connected());
    }
}
