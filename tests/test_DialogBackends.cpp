/**
 * 对话框后端单元测试：FakeCommandRunner 代替真实进程, 验证 argv、输出解析与临时文件清理。
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <regex>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "dialog/DialogBackend.h"
#include "utils/ProcessRunner.h"
#include "TestSupport.h"

namespace fs = std::filesystem;

namespace {

DialogRequest makeRequest(DialogKind kind, const std::string& body = "Body", const std::string& title = "Title") {
    DialogRequest request;
    request.kind = kind;
    request.bodyText = body;
    request.title = title;
    return request;
}

// -EncodedCommand 参数还原为脚本; 测试里的脚本只含 ASCII
std::string decodeEncodedCommand(const std::string& encoded) {
    static const std::string alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string bytes;
    uint32_t chunk = 0;
    int bits = 0;
    for (char c : encoded) {
        size_t value = alphabet.find(c);
        if (value == std::string::npos) break;
        chunk = (chunk << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes += static_cast<char>((chunk >> bits) & 0xFF);
        }
    }
    std::string script;
    for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
        script += bytes[i];
    }
    return script;
}

// 从 PowerShell 命令参数中取出结果文件路径
std::string resultPathFromScript(const std::string& encoded) {
    std::string script = decodeEncodedCommand(encoded);
    std::smatch match;
    static const std::regex pattern("-FilePath '([^']+)'");
    if (std::regex_search(script, match, pattern)) return match[1].str();
    return "";
}

} // namespace

// ==================== zenity ====================

TEST(ZenityBackend, BuildsArgvPerKind) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->result = FakeCommandRunner::exited(0, "answer\n");
    ZenityDialogBackend backend(runner);

    backend.show(makeRequest(DialogKind::FreeText, "a <b> & c"));
    backend.show(makeRequest(DialogKind::YesNo));
    backend.show(makeRequest(DialogKind::InfoOnly, "x", ""));

    ASSERT_EQ(runner->calls.size(), 3u);
    EXPECT_EQ(runner->calls[0], (std::vector<std::string>{"zenity", "--entry", "--title=Title",
                                                          "--text=a &lt;b&gt; &amp; c"}));
    EXPECT_EQ(runner->calls[1][1], "--question");
    EXPECT_EQ(runner->calls[2][1], "--info");
    EXPECT_EQ(runner->calls[2][2], "--title=Tether");
}

TEST(ZenityBackend, MapsExitCodes) {
    auto runner = std::make_shared<FakeCommandRunner>();
    ZenityDialogBackend backend(runner);

    runner->result = FakeCommandRunner::exited(0, "hello\n");
    DialogAnswer text = backend.show(makeRequest(DialogKind::FreeText));
    EXPECT_TRUE(text.answered);
    EXPECT_EQ(text.text, "hello");

    runner->result = FakeCommandRunner::exited(1);
    EXPECT_FALSE(backend.show(makeRequest(DialogKind::FreeText)).answered);

    DialogAnswer no = backend.show(makeRequest(DialogKind::YesNo));
    EXPECT_TRUE(no.answered);
    EXPECT_FALSE(no.confirmed);

    runner->result = FakeCommandRunner::exited(0);
    EXPECT_TRUE(backend.show(makeRequest(DialogKind::YesNo)).confirmed);

    runner->result = FakeCommandRunner::exited(5);
    EXPECT_FALSE(backend.show(makeRequest(DialogKind::YesNo)).answered);

    runner->result = FakeCommandRunner::exited(255);
    EXPECT_THROW(backend.show(makeRequest(DialogKind::FreeText)), TetherError);
}

TEST(ZenityBackend, MissingProgramIsDialogFailure) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->result = CommandResult{};
    ZenityDialogBackend backend(runner);
    try {
        backend.show(makeRequest(DialogKind::InfoOnly));
        FAIL() << "expected DialogFailure";
    } catch (const TetherError& e) {
        EXPECT_EQ(e.getKind(), ErrorKind::DialogFailure);
    }
}

// ==================== osascript ====================

TEST(OsaScriptBackend, EscapesQuotesInScript) {
    std::string script = OsaScriptDialogBackend::buildScript(makeRequest(DialogKind::YesNo, "say \"hi\" \\ now"));
    EXPECT_NE(script.find("display dialog \"say \\\"hi\\\" \\\\ now\""), std::string::npos) << script;
}

TEST(OsaScriptBackend, ParsesOutput) {
    auto runner = std::make_shared<FakeCommandRunner>();
    OsaScriptDialogBackend backend(runner);

    runner->result = FakeCommandRunner::exited(0, "OK:typed text\n");
    DialogAnswer text = backend.show(makeRequest(DialogKind::FreeText));
    EXPECT_TRUE(text.answered);
    EXPECT_EQ(text.text, "typed text");
    EXPECT_EQ(runner->calls[0][0], "osascript");
    EXPECT_EQ(runner->calls[0][1], "-e");

    runner->result = FakeCommandRunner::exited(0, "CANCEL\n");
    EXPECT_FALSE(backend.show(makeRequest(DialogKind::FreeText)).answered);

    runner->result = FakeCommandRunner::exited(0, "true\n");
    EXPECT_TRUE(backend.show(makeRequest(DialogKind::YesNo)).confirmed);

    runner->result = FakeCommandRunner::exited(0, "false\n");
    EXPECT_FALSE(backend.show(makeRequest(DialogKind::YesNo)).confirmed);

    runner->result = FakeCommandRunner::exited(1);
    EXPECT_THROW(backend.show(makeRequest(DialogKind::InfoOnly)), TetherError);
}

// ==================== PowerShell ====================

TEST(PowerShellBackend, EscapesSingleQuotes) {
    EXPECT_EQ(PowerShellDialogBackend::escapeSingleQuoted("it's `x`"), "it''s ``x``");
}

TEST(PowerShellBackend, ReadsResultFileAndRemovesIt) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->result = FakeCommandRunner::exited(0);
    std::string resultPath;
    runner->sideEffect = [&resultPath](const std::vector<std::string>& argv) {
        resultPath = resultPathFromScript(argv.back());
        std::ofstream out(fs::u8path(resultPath), std::ios::binary);
        out << "\xEF\xBB\xBF" << "from windows\r\n";
    };
    PowerShellDialogBackend backend(runner);

    DialogAnswer answer = backend.show(makeRequest(DialogKind::FreeText));
    EXPECT_TRUE(answer.answered);
    EXPECT_EQ(answer.text, "from windows");

    ASSERT_FALSE(resultPath.empty());
    EXPECT_FALSE(fs::exists(fs::u8path(resultPath)));
    EXPECT_EQ(runner->calls[0][0], "powershell");
}

TEST(PowerShellBackend, RemovesResultFileWhenParsingFails) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->result = FakeCommandRunner::exited(0);
    std::string resultPath;
    runner->sideEffect = [&resultPath](const std::vector<std::string>& argv) {
        resultPath = resultPathFromScript(argv.back());
        std::ofstream out(fs::u8path(resultPath));
        out << "true";
    };
    PowerShellDialogBackend backend(runner);

    runner->result.launched = false;
    EXPECT_THROW(backend.show(makeRequest(DialogKind::YesNo)), TetherError);
    ASSERT_FALSE(resultPath.empty());
    EXPECT_FALSE(fs::exists(fs::u8path(resultPath)));
}

TEST(PowerShellBackend, MissingResultFileIsDialogFailure) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->result = FakeCommandRunner::exited(1);
    PowerShellDialogBackend backend(runner);
    EXPECT_THROW(backend.show(makeRequest(DialogKind::YesNo)), TetherError);
}

TEST(PowerShellBackend, EncodesScriptAsUtf16Base64) {
    EXPECT_EQ(PowerShellDialogBackend::encodeCommand("A\n"), "QQAKAA==");
    EXPECT_EQ(PowerShellDialogBackend::encodeCommand("\xC3\xA9"), "6QA=");
    EXPECT_EQ(PowerShellDialogBackend::encodeCommand(""), "");
}

TEST(PowerShellBackend, CommandLineCarriesNoRawNewlines) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->result = FakeCommandRunner::exited(0);
    PowerShellDialogBackend backend(runner);

    for (DialogKind kind : {DialogKind::FreeText, DialogKind::YesNo, DialogKind::InfoOnly}) {
        EXPECT_THROW(backend.show(makeRequest(kind, "line one\nline two")), TetherError);
    }
    ASSERT_EQ(runner->calls.size(), 3u);
    for (const auto& argv : runner->calls) {
        ASSERT_GE(argv.size(), 2u);
        EXPECT_EQ(argv[argv.size() - 2], "-EncodedCommand");
        std::string commandLine = ProcessRunner::buildCommandLine(argv);
        EXPECT_EQ(commandLine.find('\n'), std::string::npos) << commandLine;
        EXPECT_EQ(commandLine.find('\r'), std::string::npos) << commandLine;
        EXPECT_NE(decodeEncodedCommand(argv.back()).find("line one\nline two"), std::string::npos);
    }
}

TEST(ProcessRunnerCommandLine, QuotesLikeCommandLineToArgv) {
    EXPECT_EQ(ProcessRunner::buildCommandLine({"powershell", "-NoProfile"}), "powershell -NoProfile");
    EXPECT_EQ(ProcessRunner::buildCommandLine({"a b", ""}), "\"a b\" \"\"");
    EXPECT_EQ(ProcessRunner::buildCommandLine({"say \"hi\""}), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(ProcessRunner::buildCommandLine({"C:\\dir\\"}), "C:\\dir\\");
    EXPECT_EQ(ProcessRunner::buildCommandLine({"C:\\my dir\\"}), "\"C:\\my dir\\\\\"");
}

#ifndef _WIN32
TEST(ProcessRunnerPosix, CapturesStdoutAndExitCode) {
    ProcessRunner runner;
    CommandResult ok = runner.run({"sh", "-c", "echo hello; exit 3"});
    EXPECT_TRUE(ok.launched);
    EXPECT_EQ(ok.exitCode, 3);
    EXPECT_EQ(ok.output, "hello\n");

    EXPECT_FALSE(runner.run({"tether-no-such-program"}).launched);
}

// 并发启动的长寿命子进程不能持有另一个子进程的管道写端
TEST(ProcessRunnerPosix, ConcurrentChildDoesNotHoldPipeOpen) {
    ProcessRunner runner;
    std::thread sibling([&runner] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        runner.run({"sleep", "3"});
    });

    auto started = std::chrono::steady_clock::now();
    CommandResult result = runner.run({"sh", "-c", "sleep 0.3; echo done"});
    auto elapsed = std::chrono::steady_clock::now() - started;
    sibling.join();

    EXPECT_EQ(result.output, "done\n");
    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
}
#endif

// ==================== selection ====================

TEST(DialogBackendSelection, AutoFollowsPlatform) {
    auto runner = std::make_shared<FakeCommandRunner>();
    EXPECT_EQ(makeDialogBackend("auto", PlatformId::Linux, runner)->getName(), "zenity");
    EXPECT_EQ(makeDialogBackend("auto", PlatformId::MacOS, runner)->getName(), "osascript");
    EXPECT_EQ(makeDialogBackend("auto", PlatformId::Windows, runner)->getName(), "powershell");
}

TEST(DialogBackendSelection, ExplicitNameWinsAndUnknownThrows) {
    auto runner = std::make_shared<FakeCommandRunner>();
    EXPECT_EQ(makeDialogBackend("osascript", PlatformId::Linux, runner)->getName(), "osascript");
    EXPECT_THROW(makeDialogBackend("kdialog", PlatformId::Linux, runner), TetherError);
}
