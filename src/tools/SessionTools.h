#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "ITool.h"
#include "memory/CommandHistory.h"
#include "memory/ContextSummary.h"

/**
 * @brief 会话辅助工具
 *
 * 全部是本地同步操作, 不经过 UI 宿主。
 */

// optimize_command - 本地规范化指令文本
class OptimizeCommandTool : public SyncTool {
public:
    std::string getName() const override { return "optimize_command"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;

    /**
     * @brief 规范化
     *
     * 去首尾空白, 折叠连续空白, 缺少结尾标点时补 '.';
     * level=high 时首字母大写。
     */
    static std::string optimize(const std::string& command, const std::string& level);

protected:
    ToolResult run(const nlohmann::json& args) override;
};

class SaveCommandHistoryTool : public SyncTool {
public:
    explicit SaveCommandHistoryTool(CommandHistory& history) : history(history) {}

    std::string getName() const override { return "save_command_history"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;

protected:
    ToolResult run(const nlohmann::json& args) override;

private:
    CommandHistory& history;
};

class GetCommandHistoryTool : public SyncTool {
public:
    static constexpr size_t DEFAULT_LIMIT = 10;

    explicit GetCommandHistoryTool(CommandHistory& history) : history(history) {}

    std::string getName() const override { return "get_command_history"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;

protected:
    ToolResult run(const nlohmann::json& args) override;

private:
    CommandHistory& history;
};

class UpdateContextSummaryTool : public SyncTool {
public:
    explicit UpdateContextSummaryTool(ContextSummary& summary) : summary(summary) {}

    std::string getName() const override { return "update_context_summary"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;

protected:
    ToolResult run(const nlohmann::json& args) override;

private:
    ContextSummary& summary;
};

class GetContextSummaryTool : public SyncTool {
public:
    explicit GetContextSummaryTool(ContextSummary& summary) : summary(summary) {}

    std::string getName() const override { return "get_context_summary"; }
    std::string getDescription() const override { return "Get the project context summary."; }
    nlohmann::json getSchema() const override;

protected:
    ToolResult run(const nlohmann::json& args) override;

private:
    ContextSummary& summary;
};
