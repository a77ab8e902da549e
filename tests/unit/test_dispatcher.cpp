#include <gtest/gtest.h>
#include "mcpd/dispatcher.hpp"
#include "mcpd/error.hpp"
#include <stdexcept>

using namespace mcpd;

namespace {

ToolDefinition make_def(const std::string& name) {
    ToolDefinition def;
    def.name = name;
    def.input_schema = {{"type", "object"}};
    return def;
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.add(make_def("args"), [](const ToolRequest& req) -> ToolOutcome {
            return CallToolResult::text(req.arguments.dump() + "|" + req.raw_arguments);
        });
        registry_.add(make_def("fails"), [](const ToolRequest&) -> ToolOutcome {
            return ToolFailure{ErrorKind::InvalidTimezone, "Error: invalid timezone 'X'"};
        });
        registry_.add(make_def("throws"), [](const ToolRequest&) -> ToolOutcome {
            throw std::runtime_error("boom");
        });
        registry_.add(make_def("empty"), [](const ToolRequest&) -> ToolOutcome {
            return CallToolResult{};
        });
    }

    std::string call(const std::string& name, std::string_view raw) const {
        Dispatcher dispatcher(registry_);
        return joined_text(dispatcher.invoke(name, raw));
    }

    ToolRegistry registry_;
};

} // namespace

TEST_F(DispatcherTest, UnknownTool) {
    EXPECT_EQ(call("nope", "{}"), "Unknown tool: nope");
}

TEST_F(DispatcherTest, EmptyArgumentsBecomeObject) {
    EXPECT_EQ(call("args", ""), "{}|");
    EXPECT_EQ(call("args", "  \n"), "{}|  \n");
}

TEST_F(DispatcherTest, NullArgumentsBecomeObject) {
    EXPECT_EQ(call("args", "null"), "{}|null");
}

TEST_F(DispatcherTest, ObjectArgumentsDecoded) {
    EXPECT_EQ(call("args", R"({"k":1})"), R"({"k":1}|{"k":1})");
}

TEST_F(DispatcherTest, MalformedArguments) {
    EXPECT_EQ(call("args", "{not json"), "Error: Invalid JSON arguments");
}

TEST_F(DispatcherTest, NonObjectArguments) {
    EXPECT_EQ(call("args", "[1,2]"), "Error: Invalid JSON arguments");
    EXPECT_EQ(call("args", "\"text\""), "Error: Invalid JSON arguments");
}

TEST_F(DispatcherTest, FailureFoldedIntoText) {
    Dispatcher dispatcher(registry_);
    auto result = dispatcher.invoke("fails", "{}");
    EXPECT_EQ(joined_text(result), "Error: invalid timezone 'X'");
    EXPECT_FALSE(result.is_error);
}

TEST_F(DispatcherTest, ThrowingHandlerContained) {
    EXPECT_EQ(call("throws", "{}"), "Error: boom");
}

TEST_F(DispatcherTest, EmptyContentReplaced) {
    EXPECT_EQ(call("empty", "{}"), "Error: tool returned no content");
}

TEST_F(DispatcherTest, NeverReturnsEmptyContent) {
    Dispatcher dispatcher(registry_);
    for (const char* name : {"args", "fails", "throws", "empty", "missing"}) {
        EXPECT_FALSE(dispatcher.invoke(name, "{}").content.empty()) << name;
    }
}
