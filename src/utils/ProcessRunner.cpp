#include "utils/ProcessRunner.h"
#include "utils/Logger.h"
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <filesystem>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <unistd.h>
    #include <sys/types.h>
    #include <sys/wait.h>
    #include <fcntl.h>
#endif

namespace fs = std::filesystem;

namespace {
#ifndef _WIN32
constexpr int EXEC_FAILED = 127;
#else
std::wstring toWide(const std::string& text) {
    if (text.empty()) return std::wstring();
    int len = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
    std::wstring out(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), &out[0], len);
    return out;
}
#endif
} // namespace

// CommandLineToArgvW 的逆过程: 反斜杠只在引号前需要翻倍
std::string ProcessRunner::buildCommandLine(const std::vector<std::string>& argv) {
    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) cmd += ' ';
        if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
            cmd += arg;
            continue;
        }
        cmd += '"';
        size_t backslashes = 0;
        for (char c : arg) {
            if (c == '\\') {
                ++backslashes;
                continue;
            }
            if (c == '"') {
                cmd.append(backslashes * 2 + 1, '\\');
            } else {
                cmd.append(backslashes, '\\');
            }
            backslashes = 0;
            cmd += c;
        }
        cmd.append(backslashes * 2, '\\');
        cmd += '"';
    }
    return cmd;
}

#ifndef _WIN32
CommandResult ProcessRunner::run(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) return result;

    // fork 之后子进程只能调用 async-signal-safe 函数, 参数表提前准备好
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int outPipe[2];
    if (pipe(outPipe) != 0) {
        Logger::getInstance().error("pipe() failed for " + argv[0]);
        return result;
    }
    // 并发的对话框进程不能继承彼此的管道, 否则读端等不到 EOF
    fcntl(outPipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(outPipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        close(outPipe[0]);
        close(outPipe[1]);
        Logger::getInstance().error("fork() failed for " + argv[0]);
        return result;
    }

    if (pid == 0) {
        // dup2 得到的描述符不带 FD_CLOEXEC
        dup2(outPipe[1], STDOUT_FILENO);
        // The child must never write into the RPC or notification streams.
        int devNull = open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDERR_FILENO);
        }
        execvp(args[0], args.data());
        _exit(EXEC_FAILED);
    }

    close(outPipe[1]);
    char buffer[4096];
    while (true) {
        ssize_t n = read(outPipe[0], buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        result.output.append(buffer, static_cast<size_t>(n));
    }
    close(outPipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            Logger::getInstance().error("waitpid() failed for " + argv[0]);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        result.launched = result.exitCode != EXEC_FAILED;
    } else {
        result.exitCode = -1;
        result.launched = true;
    }
    return result;
}
#else
// 直接 CreateProcessW, 不经过 cmd.exe
CommandResult ProcessRunner::run(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) return result;

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE readEnd = nullptr;
    HANDLE writeEnd = nullptr;
    if (!CreatePipe(&readEnd, &writeEnd, &sa, 0)) {
        Logger::getInstance().error("CreatePipe() failed for " + argv[0]);
        return result;
    }
    SetHandleInformation(readEnd, HANDLE_FLAG_INHERIT, 0);

    HANDLE nul = CreateFileW(L"NUL", GENERIC_READ | GENERIC_WRITE, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                             OPEN_EXISTING, 0, nullptr);

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdOutput = writeEnd;
    si.hStdInput = nul;
    si.hStdError = nul;

    PROCESS_INFORMATION pi{};
    std::wstring cmd = toWide(buildCommandLine(argv));
    BOOL created = CreateProcessW(nullptr, &cmd[0], nullptr, nullptr, TRUE, CREATE_NO_WINDOW, nullptr, nullptr,
                                  &si, &pi);
    DWORD createError = created ? 0 : GetLastError();
    CloseHandle(writeEnd);
    if (nul != INVALID_HANDLE_VALUE) CloseHandle(nul);

    if (!created) {
        CloseHandle(readEnd);
        Logger::getInstance().error("CreateProcessW() failed for " + argv[0] + ": " + std::to_string(createError));
        return result;
    }

    char buffer[4096];
    DWORD n = 0;
    while (ReadFile(readEnd, buffer, sizeof(buffer), &n, nullptr) && n > 0) {
        result.output.append(buffer, n);
    }
    CloseHandle(readEnd);

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD code = 0;
    GetExitCodeProcess(pi.hProcess, &code);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);

    result.exitCode = static_cast<int>(code);
    result.launched = true;
    return result;
}
#endif

bool ProcessRunner::commandExists(const std::string& name) {
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return false;
    std::string paths = pathEnv;
#ifdef _WIN32
    const char sep = ';';
#else
    const char sep = ':';
#endif
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(sep, start);
        std::string dir = (end == std::string::npos) ? paths.substr(start) : paths.substr(start, end - start);
        if (!dir.empty()) {
            fs::path candidate = fs::path(dir) / name;
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) return true;
#ifdef _WIN32
            for (const std::string& ext : {".exe", ".cmd", ".bat"}) {
                fs::path script = candidate;
                script += ext;
                if (fs::is_regular_file(script, ec)) return true;
            }
#endif
        }
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return false;
}
