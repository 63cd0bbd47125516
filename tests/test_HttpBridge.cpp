/**
 * HttpBridge 单元测试：绑定临时端口, 用 httplib::Client 发请求。
 */
#include <gtest/gtest.h>
#include <chrono>
#include <optional>
#include <string>
#include "httplib.h"

#include "broker/CorrelationBroker.h"
#include "mcp/HttpBridge.h"
#include "TestSupport.h"

using namespace std::chrono_literals;

class HttpBridgeTest : public ::testing::Test {
protected:
    EventLoop loop;
    RecordingSink sink;
    CorrelationBroker broker{loop, sink, 30s};
    ToolStats stats;
    HttpBridge bridge{broker, stats, "127.0.0.1", 0};
    std::optional<Settlement> settled;

    void SetUp() override { bridge.start(); }
    void TearDown() override { bridge.stop(); }

    httplib::Client client() { return httplib::Client("127.0.0.1", bridge.getPort()); }

    std::string waitForAnswer() {
        return broker.request("ui.showInputDialog", nlohmann::json::array(),
                              [this](const Settlement& s) { settled = s; });
    }
};

TEST_F(HttpBridgeTest, BindsEphemeralPort) {
    EXPECT_GT(bridge.getPort(), 0);
    auto res = client().Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(nlohmann::json::parse(res->body)["status"], "ok");
}

TEST_F(HttpBridgeTest, ResolveSettlesWaiterOnLoop) {
    std::string id = waitForAnswer();
    nlohmann::json body = {{"requestId", id}, {"value", {{"continue", true}, {"instruction", "go"}}}};

    auto res = client().Post("/resolve", body.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(nlohmann::json::parse(res->body)["resolved"].get<bool>());

    loop.runUntilIdle();
    ASSERT_TRUE(settled.has_value());
    EXPECT_EQ(settled->value["instruction"], "go");
}

TEST_F(HttpBridgeTest, UnknownIdIsNotAnError) {
    nlohmann::json body = {{"requestId", "req_0_0"}, {"value", 1}};
    auto res = client().Post("/resolve", body.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_FALSE(nlohmann::json::parse(res->body)["resolved"].get<bool>());
}

TEST_F(HttpBridgeTest, CancelAndPending) {
    std::string id = waitForAnswer();

    auto pending = client().Get("/pending");
    ASSERT_TRUE(pending);
    auto listed = nlohmann::json::parse(pending->body);
    EXPECT_EQ(listed["count"], 1);
    EXPECT_EQ(listed["pending"][0]["requestId"], id);

    auto res = client().Post("/cancel", nlohmann::json{{"requestId", id}}.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_TRUE(nlohmann::json::parse(res->body)["cancelled"].get<bool>());

    loop.runUntilIdle();
    ASSERT_TRUE(settled.has_value());
    EXPECT_EQ(settled->status, SettlementStatus::Cancelled);
}

TEST_F(HttpBridgeTest, MalformedBodyIsBadRequest) {
    auto res = client().Post("/resolve", "{oops", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(HttpBridgeTest, StatsReportsCounters) {
    stats.askUserCalls = 3;
    auto res = client().Get("/stats");
    ASSERT_TRUE(res);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["askUserCalls"], 3);
}
