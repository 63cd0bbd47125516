#pragma once
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "broker/CorrelationBroker.h"
#include "core/EventLoop.h"
#include "dialog/DialogBackend.h"

enum class ResolverState {
    PrimaryAttempt,
    FallbackAttempt,
    Done,
    DoneWithDefault
};

const char* resolverStateName(ResolverState state);

/**
 * @brief 降级对话框解析
 *
 * 每个请求的状态机:
 *   PRIMARY_ATTEMPT → 成功: DONE
 *                   → 失败 (协作方不可用 / 超时): FALLBACK_ATTEMPT
 *   FALLBACK_ATTEMPT → 成功: DONE
 *                    → 失败: DONE_WITH_DEFAULT (保守值, 绝不挂起)
 *
 * 主路径被取消 (UI 关闭、调用方取消、进程关闭) 时直接走保守值, 不弹窗。
 * 降级弹窗在后台线程执行, 结果 post 回事件循环。
 */
class FallbackDialogResolver {
public:
    using AnswerCallback = std::function<void(const DialogAnswer&)>;
    using PrimaryMapper = std::function<DialogAnswer(const nlohmann::json&)>;
    // 在后台线程上同步执行, 可以连续弹出多个对话框
    using FallbackFlow = std::function<DialogAnswer(IDialogBackend&)>;
    using StateObserver = std::function<void(ResolverState)>;

    struct PrimaryRequest {
        std::string command;
        nlohmann::json payload;
        std::string owner;
    };

    FallbackDialogResolver(EventLoop& loop, CorrelationBroker& broker, std::shared_ptr<IDialogBackend> backend);

    /**
     * @brief 通用入口
     * @param primary      发往 UI 宿主的命令
     * @param mapPrimary   UI 宿主原始值 → DialogAnswer
     * @param fallbackFlow 降级时的弹窗流程
     * @param done         在事件循环上调用且只调用一次
     */
    void resolve(const PrimaryRequest& primary, PrimaryMapper mapPrimary, FallbackFlow fallbackFlow,
                 AnswerCallback done);

    // 单个对话框的便捷入口
    void resolve(const PrimaryRequest& primary, const DialogRequest& request, AnswerCallback done);

    // 只走降级弹窗 (用于 fire-and-forget 的通知)
    void showFallback(const DialogRequest& request, AnswerCallback done);

    void setFallbackEnabled(bool enabled) { fallbackEnabled = enabled; }
    bool isFallbackEnabled() const { return fallbackEnabled && backend != nullptr; }

    // 状态迁移观察者, 调试与测试用
    void setStateObserver(StateObserver observer) { this->observer = std::move(observer); }

    std::string backendName() const { return backend ? backend->getName() : "none"; }

private:
    EventLoop& loop;
    CorrelationBroker& broker;
    std::shared_ptr<IDialogBackend> backend;
    bool fallbackEnabled = true;
    StateObserver observer;

    void enter(ResolverState state);
    void runFallback(FallbackFlow flow, AnswerCallback done);
    void finishWithDefault(AnswerCallback done);
};
