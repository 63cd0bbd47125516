#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "ITool.h"
#include "ToolStats.h"
#include "agent/ContinueDecision.h"
#include "broker/FallbackDialogResolver.h"
#include "mcp/NotificationChannel.h"

/**
 * @brief 需要人工参与的工具
 *
 * 三个工具都不阻塞事件循环: 先经 UI 宿主收集输入,
 * UI 宿主不可用或超时则降级到本机对话框, 最后落到保守默认值。
 */

/**
 * @brief ask_user - 请求用户输入或确认
 *
 * 返回: input 为原文, confirm 为 confirmed / declined, info 为 acknowledged。
 */
class AskUserTool : public ITool {
public:
    AskUserTool(FallbackDialogResolver& resolver, ToolStats& stats);

    std::string getName() const override { return "ask_user"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    void execute(const ToolCallPtr& call) override;

    static ToolResult toResult(DialogKind kind, const DialogAnswer& answer);

private:
    FallbackDialogResolver& resolver;
    ToolStats& stats;
};

/**
 * @brief notify - 单向通知, 不登记等待者
 *
 * 通知通道不可用时在后台弹出本机提示框, 但不等待它关闭。
 */
class NotifyTool : public ITool {
public:
    NotifyTool(INotificationSink& sink, FallbackDialogResolver& resolver, ToolStats& stats);

    std::string getName() const override { return "notify"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    void execute(const ToolCallPtr& call) override;

private:
    INotificationSink& sink;
    FallbackDialogResolver& resolver;
    ToolStats& stats;
};

/**
 * @brief ask_continue - 任务结束时询问是否继续
 *
 * 结果文本遵循 ContinueProtocol, 由调用方 Agent 解析。
 */
class AskContinueTool : public ITool {
public:
    AskContinueTool(FallbackDialogResolver& resolver, ToolStats& stats);

    std::string getName() const override { return ContinueProtocol::TOOL_NAME; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    void execute(const ToolCallPtr& call) override;

    // 降级流程: 先 Yes/No, 选 Yes 再收集可选的新指令
    static DialogAnswer runFallbackFlow(IDialogBackend& dialog, const std::string& reason);

private:
    FallbackDialogResolver& resolver;
    ToolStats& stats;
};
