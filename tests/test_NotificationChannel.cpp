#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#ifndef _WIN32
    #include <sys/stat.h>
#endif

#include "core/Errors.h"
#include "mcp/NotificationChannel.h"

namespace fs = std::filesystem;

TEST(NotificationMessages, CollectInputShape) {
    auto message = makeCollectInputMessage("ui.showInputDialog", {"req_1_1", "Title", "Body"});
    EXPECT_EQ(message["jsonrpc"], "2.0");
    EXPECT_EQ(message["method"], "collect-input");
    EXPECT_FALSE(message.contains("id"));
    EXPECT_EQ(message["params"]["command"], "ui.showInputDialog");
    EXPECT_EQ(message["params"]["arguments"][0], "req_1_1");
}

TEST(NotificationMessages, ShowNotificationShape) {
    auto message = makeShowNotificationMessage("error", "Disk full");
    EXPECT_EQ(message["method"], "show-notification");
    EXPECT_EQ(message["params"]["level"], "error");
    EXPECT_EQ(message["params"]["message"], "Disk full");
}

TEST(StreamNotificationSink, WritesOneLinePerMessage) {
    std::ostringstream out;
    StreamNotificationSink sink(out, "test");
    sink.emit(makeShowNotificationMessage("info", "one\ntwo"));
    sink.emit(makeShowNotificationMessage("info", "three"));

    std::istringstream lines(out.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        auto parsed = nlohmann::json::parse(line);
        EXPECT_EQ(parsed["method"], "show-notification");
        count++;
    }
    EXPECT_EQ(count, 2);
    EXPECT_EQ(sink.describe(), "test");
}

TEST(StreamNotificationSink, BrokenStreamIsCollaboratorUnavailable) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamNotificationSink sink(out);
    try {
        sink.emit(makeShowNotificationMessage("info", "x"));
        FAIL() << "expected CollaboratorUnavailable";
    } catch (const TetherError& e) {
        EXPECT_EQ(e.getKind(), ErrorKind::CollaboratorUnavailable);
    }
}

TEST(MakeNotificationSink, SelectsByDescription) {
    EXPECT_EQ(makeNotificationSink("stderr")->describe(), "stderr");
    EXPECT_EQ(makeNotificationSink("")->describe(), "stderr");
    EXPECT_EQ(makeNotificationSink("fd:3")->describe(), "fd:3");
    EXPECT_EQ(makeNotificationSink("/tmp/tether.notify")->describe(), "/tmp/tether.notify");
}

TEST(MakeNotificationSink, RejectsStdoutAndGarbage) {
    EXPECT_THROW(makeNotificationSink("fd:1"), TetherError);
    EXPECT_THROW(makeNotificationSink("fd:abc"), TetherError);
}

TEST(FdNotificationSink, AppendsToRegularFile) {
    fs::path file = fs::temp_directory_path() / "tether_notify_test.jsonl";
    fs::remove(file);
    {
        FdNotificationSink sink(file.string());
        sink.emit(makeShowNotificationMessage("info", "a"));
        sink.emit(makeShowNotificationMessage("warning", "b"));
    }

    std::ifstream in(file);
    std::string first, second;
    ASSERT_TRUE(std::getline(in, first));
    ASSERT_TRUE(std::getline(in, second));
    EXPECT_EQ(nlohmann::json::parse(first)["params"]["message"], "a");
    EXPECT_EQ(nlohmann::json::parse(second)["params"]["level"], "warning");
    in.close();
    fs::remove(file);
}

TEST(FdNotificationSink, MissingDirectoryIsCollaboratorUnavailable) {
    fs::path file = fs::temp_directory_path() / "tether_no_such_dir" / "notify";
    FdNotificationSink sink(file.string());
    try {
        sink.emit(makeShowNotificationMessage("info", "x"));
        FAIL() << "expected CollaboratorUnavailable";
    } catch (const TetherError& e) {
        EXPECT_EQ(e.getKind(), ErrorKind::CollaboratorUnavailable);
    }
}

#ifndef _WIN32
TEST(FdNotificationSink, FifoWithoutReaderIsUnavailableNotBlocking) {
    fs::path fifo = fs::temp_directory_path() / "tether_notify_test.fifo";
    fs::remove(fifo);
    ASSERT_EQ(mkfifo(fifo.c_str(), 0600), 0);

    FdNotificationSink sink(fifo.string());
    EXPECT_THROW(sink.emit(makeShowNotificationMessage("info", "x")), TetherError);
    fs::remove(fifo);
}
#endif
