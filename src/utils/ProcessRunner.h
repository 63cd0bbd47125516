#pragma once
#include <string>
#include <vector>

struct CommandResult {
    int exitCode = -1;
    std::string output;   // 标准输出
    bool launched = false;  // false: 可执行文件不存在或 fork/exec 失败
};

/**
 * @brief 外部命令执行接口
 *
 * 对话框后端通过它启动短生命周期的进程, 测试中替换为假实现。
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

/**
 * @brief 真实进程执行
 *
 * POSIX: fork + execvp, 通过管道读取 stdout, stderr 丢弃。
 * Windows: CreateProcessW, 命令行按 CommandLineToArgvW 规则拼接。
 */
class ProcessRunner : public ICommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv) override;

    // 按 Windows 规则把 argv 拼成一行命令
    static std::string buildCommandLine(const std::vector<std::string>& argv);

    // 在 PATH 中查找可执行文件
    static bool commandExists(const std::string& name);
};
