#pragma once
#include <memory>
#include <string>
#include "dialog/DialogTypes.h"
#include "utils/Platform.h"
#include "utils/ProcessRunner.h"

/**
 * @brief 操作系统原生对话框后端
 *
 * 每个后端都必须支持三种对话框: 自由文本输入、是/否确认、仅提示。
 * 实现方式统一为启动一个短生命周期的外部进程, 从 stdout 或临时文件读取结果。
 *
 * show() 是同步阻塞的, 只应在后台线程调用。
 * 后端不可用 (进程无法启动、异常退出) 时抛出 TetherError(DialogFailure);
 * 用户取消返回 answered=false 的 DialogAnswer。
 */
class IDialogBackend {
public:
    virtual ~IDialogBackend() = default;
    virtual std::string getName() const = 0;
    virtual DialogAnswer show(const DialogRequest& request) = 0;
};

// Linux: zenity, 结果来自 stdout 与退出码
class ZenityDialogBackend : public IDialogBackend {
public:
    explicit ZenityDialogBackend(std::shared_ptr<ICommandRunner> runner);

    std::string getName() const override { return "zenity"; }
    DialogAnswer show(const DialogRequest& request) override;

    static std::string escapeMarkup(const std::string& text);

private:
    std::shared_ptr<ICommandRunner> runner;
};

// macOS: osascript, 结果来自 stdout
class OsaScriptDialogBackend : public IDialogBackend {
public:
    explicit OsaScriptDialogBackend(std::shared_ptr<ICommandRunner> runner);

    std::string getName() const override { return "osascript"; }
    DialogAnswer show(const DialogRequest& request) override;

    static std::string escapeAppleScript(const std::string& text);
    static std::string buildScript(const DialogRequest& request);

private:
    std::shared_ptr<ICommandRunner> runner;
};

/**
 * @brief Windows: PowerShell + WinForms
 *
 * 结果通过临时文件回传; 临时文件在任何退出路径上都会被删除。
 */
class PowerShellDialogBackend : public IDialogBackend {
public:
    explicit PowerShellDialogBackend(std::shared_ptr<ICommandRunner> runner);

    std::string getName() const override { return "powershell"; }
    DialogAnswer show(const DialogRequest& request) override;

    static std::string escapeSingleQuoted(const std::string& text);
    static std::string buildScript(const DialogRequest& request, const std::string& resultPath);
    // -EncodedCommand 的参数: UTF-16LE 再 base64, 多行脚本因此不含换行
    static std::string encodeCommand(const std::string& script);

private:
    std::shared_ptr<ICommandRunner> runner;
};

// 纯函数: 平台 id → 后端
std::unique_ptr<IDialogBackend> makeDialogBackend(PlatformId platform, std::shared_ptr<ICommandRunner> runner);

/**
 * @brief 按配置名创建后端
 * @param name "auto" 时按平台选择, 否则 zenity / osascript / powershell
 */
std::unique_ptr<IDialogBackend> makeDialogBackend(const std::string& name, PlatformId platform,
                                                  std::shared_ptr<ICommandRunner> runner);
