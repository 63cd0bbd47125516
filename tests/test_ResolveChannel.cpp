/**
 * ResolveChannel 单元测试：逐行结算, 以及 FIFO / 普通文件上的读线程 (仅 POSIX)。
 */
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#ifndef _WIN32
    #include <fcntl.h>
    #include <sys/stat.h>
    #include <unistd.h>
#endif

#include "broker/CorrelationBroker.h"
#include "mcp/ResolveChannel.h"
#include "TestSupport.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ResolveChannelTest : public ::testing::Test {
protected:
    EventLoop loop;
    RecordingSink sink;
    CorrelationBroker broker{loop, sink, 30s};
    std::optional<Settlement> settled;

    std::string waitForAnswer() {
        return broker.request("ui.showInputDialog", nlohmann::json::array(),
                              [this](const Settlement& s) { settled = s; });
    }

    static std::string resolveLine(const std::string& id, const nlohmann::json& value) {
        return nlohmann::json{{"method", "resolve"}, {"params", {{"requestId", id}, {"value", value}}}}.dump();
    }
};

TEST_F(ResolveChannelTest, ResolveLineSettlesWaiter) {
    std::string id = waitForAnswer();
    EXPECT_TRUE(ResolveChannel::applyLine(broker, resolveLine(id, {{"continue", true}})));
    loop.runUntilIdle();

    ASSERT_TRUE(settled.has_value());
    EXPECT_EQ(settled->status, SettlementStatus::Fulfilled);
    EXPECT_EQ(settled->value["continue"], true);
}

TEST_F(ResolveChannelTest, CancelLineCancelsWaiter) {
    std::string id = waitForAnswer();
    std::string line = nlohmann::json{{"method", "cancel"}, {"params", {{"requestId", id}}}}.dump();
    EXPECT_TRUE(ResolveChannel::applyLine(broker, line));
    loop.runUntilIdle();

    ASSERT_TRUE(settled.has_value());
    EXPECT_EQ(settled->status, SettlementStatus::Cancelled);
}

TEST_F(ResolveChannelTest, MalformedOrUnknownLinesAreIgnored) {
    std::string id = waitForAnswer();

    EXPECT_FALSE(ResolveChannel::applyLine(broker, "not json"));
    EXPECT_FALSE(ResolveChannel::applyLine(broker, ""));
    EXPECT_FALSE(ResolveChannel::applyLine(broker, R"({"method":"resolve"})"));
    EXPECT_FALSE(ResolveChannel::applyLine(broker, R"({"method":"resolve","params":{"requestId":7}})"));
    EXPECT_FALSE(ResolveChannel::applyLine(broker, R"({"method":"shout","params":{"requestId":"x"}})"));
    EXPECT_FALSE(ResolveChannel::applyLine(broker, resolveLine("req_0_0", "stranger")));

    EXPECT_TRUE(broker.isPending(id));
    loop.runUntilIdle();
    EXPECT_FALSE(settled.has_value());
}

TEST_F(ResolveChannelTest, ResolveWithoutValueDeliversNull) {
    std::string id = waitForAnswer();
    std::string line = nlohmann::json{{"method", "resolve"}, {"params", {{"requestId", id}}}}.dump();
    EXPECT_TRUE(ResolveChannel::applyLine(broker, line));
    loop.runUntilIdle();
    ASSERT_TRUE(settled.has_value());
    EXPECT_TRUE(settled->value.is_null());
}

#ifndef _WIN32
TEST_F(ResolveChannelTest, RejectsStdinAndBadDescriptions) {
    ResolveChannel stdinChannel(loop, broker, "fd:0");
    EXPECT_THROW(stdinChannel.start(), TetherError);

    ResolveChannel garbage(loop, broker, "fd:x");
    EXPECT_THROW(garbage.start(), TetherError);

    ResolveChannel missing(loop, broker, (fs::temp_directory_path() / "tether_no_dir" / "resolve").string());
    EXPECT_THROW(missing.start(), TetherError);
}

TEST_F(ResolveChannelTest, ReadsAnswersFromFifo) {
    fs::path fifo = fs::temp_directory_path() / "tether_resolve_test.fifo";
    fs::remove(fifo);
    ASSERT_EQ(mkfifo(fifo.c_str(), 0600), 0);

    std::string id = waitForAnswer();
    ResolveChannel channel(loop, broker, fifo.string());
    channel.start();

    int writer = open(fifo.c_str(), O_WRONLY);
    ASSERT_GE(writer, 0);
    std::string payload = resolveLine(id, "typed in the panel") + "\n";
    ASSERT_EQ(write(writer, payload.data(), payload.size()), static_cast<ssize_t>(payload.size()));
    close(writer);

    for (int i = 0; i < 20 && !settled; ++i) {
        loop.runFor(50ms);
    }
    channel.stop();
    fs::remove(fifo);

    ASSERT_TRUE(settled.has_value());
    EXPECT_EQ(settled->value, "typed in the panel");
}

TEST_F(ResolveChannelTest, TailsRegularFile) {
    fs::path file = fs::temp_directory_path() / "tether_resolve_test.jsonl";
    std::string id = waitForAnswer();
    {
        std::ofstream out(file, std::ios::trunc);
        out << "garbage line\n" << resolveLine(id, 42) << "\n";
    }

    ResolveChannel channel(loop, broker, file.string());
    channel.start();
    for (int i = 0; i < 20 && !settled; ++i) {
        loop.runFor(50ms);
    }
    channel.stop();
    fs::remove(file);

    ASSERT_TRUE(settled.has_value());
    EXPECT_EQ(settled->value, 42);
}
#endif
