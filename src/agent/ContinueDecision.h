#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "dialog/DialogTypes.h"

/**
 * @brief 继续/结束会话状态机
 *
 * AWAITING_DECISION → END                        (明确拒绝)
 *                   → CONTINUE_WITH_INSTRUCTION  (给出非空的后续指令)
 *                   → CONTINUE_IDLE              (其他情况)
 */
enum class ContinueState {
    AwaitingDecision,
    ContinueWithInstruction,
    ContinueIdle,
    End
};

const char* continueStateName(ContinueState state);

struct ContinueDecision {
    ContinueState state = ContinueState::AwaitingDecision;
    bool shouldContinue = false;
    std::optional<std::string> carriedInstruction;
    std::vector<Attachment> attachments;

    static ContinueDecision end();
    static ContinueDecision idle();
    static ContinueDecision withInstruction(const std::string& instruction);
};

/**
 * @brief 文本子协议
 *
 * 调用方 Agent 会重新解析这段文本来决定下一步, 格式不能漂移:
 *
 *   RESULT: should_continue=<true|false>
 *
 *   INSTRUCTION_BEGIN
 *   <指令原文>
 *   INSTRUCTION_END
 *
 *   <给 Agent 的说明>
 *
 * 指令块仅在 CONTINUE_WITH_INSTRUCTION 时出现。
 */
namespace ContinueProtocol {
    inline constexpr const char* MARKER = "RESULT: should_continue=";
    inline constexpr const char* INSTRUCTION_BEGIN = "INSTRUCTION_BEGIN";
    inline constexpr const char* INSTRUCTION_END = "INSTRUCTION_END";
    inline constexpr const char* TOOL_NAME = "ask_continue";
}

class ContinueLoop {
public:
    ContinueState getState() const { return state; }

    /**
     * @brief 由 UI 宿主原始值迁移
     *
     * 接受 {continue: bool, instruction | newInstruction: string, images: [...]};
     * 不是对象或缺少 continue:true 视为拒绝。
     */
    ContinueDecision decide(const nlohmann::json& uiValue);

    // 由对话结果迁移 (confirmed=继续, text=后续指令)
    ContinueDecision decide(const DialogAnswer& answer);

    void reset() { state = ContinueState::AwaitingDecision; }

    static DialogAnswer answerFromUiValue(const nlohmann::json& uiValue);

private:
    ContinueState state = ContinueState::AwaitingDecision;

    ContinueDecision transition(bool accepted, const std::string& instruction,
                                std::vector<Attachment> attachments);
};

// 编码为工具文本结果
std::string formatContinueText(const ContinueDecision& decision);

// 反向解析; 找不到标记时返回 std::nullopt
std::optional<ContinueDecision> parseContinueText(const std::string& text);
