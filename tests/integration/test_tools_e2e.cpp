#include <gtest/gtest.h>
#include "mcpgate/session.hpp"
#include "mcpgate/error.hpp"
#include "support/pipe_peer.hpp"
#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>

using namespace mcpgate;

namespace {

class Calculator : public ToolHandler {
public:
    CallToolResult call(const RequestContext&, const nlohmann::json& args) override {
        ++calls;
        const std::string op = args.at("operation").get<std::string>();
        double a = args.at("a").get<double>();
        double b = args.at("b").get<double>();
        double value;
        if (op == "add") value = a + b;
        else if (op == "multiply") value = a * b;
        else if (op == "divide") {
            if (b == 0) throw std::invalid_argument("division by zero");
            value = a / b;
        } else {
            throw std::invalid_argument("unsupported operation " + op);
        }
        CallToolResult r;
        r.content.push_back(TextContent{nlohmann::json(value).dump()});
        return r;
    }

    std::atomic<int> calls{0};
};

class ToolsE2ETest : public ::testing::Test {
protected:
    std::shared_ptr<Calculator> calculator_ = std::make_shared<Calculator>();
    std::unique_ptr<Session> session_;
    std::unique_ptr<mcpgate::testing::ServedSession> served_;

    void SetUp() override {
        Session::Options opts;
        opts.identity = {"tools-server", "1.0"};
        opts.worker_threads = 4;
        session_ = std::make_unique<Session>(opts);

        ToolDefinition calc;
        calc.name = "calculator";
        calc.description = "Perform basic arithmetic";
        calc.input_schema = {
            {"type", "object"},
            {"properties", {{"operation", {{"type", "string"}}},
                            {"a", {{"type", "number"}}},
                            {"b", {{"type", "number"}}}}},
            {"required", {"operation", "a", "b"}}
        };
        session_->add_tool(calc, calculator_);

        ToolDefinition echo;
        echo.name = "echo";
        session_->add_tool(echo, [](const RequestContext&, const nlohmann::json& args) {
            CallToolResult r;
            r.content.push_back(TextContent{args.value("text", std::string())});
            return r;
        });

        served_ = std::make_unique<mcpgate::testing::ServedSession>(*session_);
        served_->start();
        served_->handshake();
    }

    void TearDown() override {
        served_.reset();
        session_.reset();
    }

    nlohmann::json calc(const nlohmann::json& id, const std::string& op, double a, double b) {
        return served_->call(id, "tools/call",
                             {{"name", "calculator"},
                              {"arguments", {{"operation", op}, {"a", a}, {"b", b}}}});
    }
};

} // namespace

TEST_F(ToolsE2ETest, ListTools) {
    auto resp = served_->call(1, "tools/list");
    const auto& tools = resp["result"]["tools"];
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["name"], "calculator");
    EXPECT_EQ(tools[0]["description"], "Perform basic arithmetic");
    EXPECT_EQ(tools[0]["inputSchema"]["required"][0], "operation");
    EXPECT_EQ(tools[1]["name"], "echo");
    EXPECT_EQ(tools[1]["inputSchema"], (nlohmann::json{{"type", "object"}}));
}

TEST_F(ToolsE2ETest, Calculate) {
    auto resp = calc(1, "multiply", 6, 7);
    EXPECT_EQ(resp["result"]["isError"], false);
    EXPECT_EQ(resp["result"]["content"][0]["text"], "42.0");
}

TEST_F(ToolsE2ETest, DivideByZeroIsReportedInBand) {
    auto resp = calc(2, "divide", 1, 0);
    ASSERT_FALSE(resp.contains("error"));
    EXPECT_EQ(resp["result"]["isError"], true);
    EXPECT_EQ(resp["result"]["content"][0]["type"], "text");
    EXPECT_EQ(resp["result"]["content"][0]["text"], "Error: division by zero");
}

TEST_F(ToolsE2ETest, UnknownTool) {
    auto resp = served_->call(3, "tools/call", {{"name", "nope"}});
    EXPECT_EQ(resp["error"]["code"], error::InvalidParams);
    EXPECT_EQ(resp["error"]["message"], "Tool not found: nope");
}

TEST_F(ToolsE2ETest, ArgumentsDefaultToEmptyObject) {
    auto resp = served_->call(4, "tools/call", {{"name", "echo"}});
    EXPECT_EQ(resp["result"]["content"][0]["text"], "");
}

TEST_F(ToolsE2ETest, ManyConcurrentCallsEachGetTheirOwnResponse) {
    constexpr int kCalls = 64;
    for (int i = 0; i < kCalls; ++i) {
        served_->peer.request(1000 + i, "tools/call",
                              {{"name", "calculator"},
                               {"arguments", {{"operation", "add"}, {"a", i}, {"b", 0}}}});
    }

    std::set<int64_t> seen;
    for (int i = 0; i < kCalls; ++i) {
        auto msg = served_->peer.read_json();
        ASSERT_TRUE(msg.has_value());
        int64_t id = (*msg)["id"].get<int64_t>();
        double value = std::stod((*msg)["result"]["content"][0]["text"].get<std::string>());
        EXPECT_DOUBLE_EQ(value, static_cast<double>(id - 1000));
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), static_cast<size_t>(kCalls));
    EXPECT_EQ(calculator_->calls.load(), kCalls);
}

TEST_F(ToolsE2ETest, ReplacedToolTakesEffect) {
    ToolDefinition echo;
    echo.name = "echo";
    session_->add_tool(echo, [](const RequestContext&, const nlohmann::json&) {
        CallToolResult r;
        r.content.push_back(TextContent{"v2"});
        return r;
    });

    auto resp = served_->call(5, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "x"}}}});
    EXPECT_EQ(resp["result"]["content"][0]["text"], "v2");

    auto list = served_->call(6, "tools/list");
    EXPECT_EQ(list["result"]["tools"].size(), 2u);
    EXPECT_EQ(list["result"]["tools"][1]["name"], "echo");
}
