#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/EventLoop.h"
#include "broker/TimeoutSupervisor.h"
#include "mcp/NotificationChannel.h"

enum class SettlementStatus {
    Fulfilled,
    TimedOut,
    Cancelled
};

struct Settlement {
    SettlementStatus status = SettlementStatus::Cancelled;
    nlohmann::json value;
    std::string message;

    bool fulfilled() const { return status == SettlementStatus::Fulfilled; }

    static Settlement fulfill(const nlohmann::json& value) {
        return {SettlementStatus::Fulfilled, value, ""};
    }
    static Settlement timeout(const std::string& message) {
        return {SettlementStatus::TimedOut, nlohmann::json(), message};
    }
    static Settlement cancelled(const std::string& message) {
        return {SettlementStatus::Cancelled, nlohmann::json(), message};
    }
};

const char* settlementStatusName(SettlementStatus status);

/**
 * @brief 关联代理
 *
 * 把需要人工输入的工具调用与 UI 宿主连接起来:
 * 1. request():  生成进程内唯一的 requestId, 登记等待者,
 *                在带外通道发出 collect-input, 立即返回
 * 2. resolve():  外部入口, 按 id 结算等待者; 未知 id 静默忽略
 * 3. 超时 / cancel / flushAll 同样是结算, 每个等待者只结算一次
 *
 * 等待者表由互斥锁保护: 在锁内摘除, 锁外经事件循环调用续体,
 * 因此续体里的重入调用不会破坏表。
 */
class CorrelationBroker {
public:
    using Continuation = std::function<void(const Settlement&)>;
    using Clock = std::chrono::steady_clock;

    CorrelationBroker(EventLoop& loop, INotificationSink& sink, std::chrono::milliseconds timeout);
    ~CorrelationBroker();

    CorrelationBroker(const CorrelationBroker&) = delete;
    CorrelationBroker& operator=(const CorrelationBroker&) = delete;

    /**
     * @brief 登记等待者并通知 UI 宿主
     * @param uiCommand UI 命令名, 例如 ui.showInputDialog
     * @param payload   追加在 requestId 之后的参数数组
     * @param onSettled 结算时在事件循环上调用一次
     * @param owner     创建该等待者的 RPC 调用标识, 用于批量取消
     * @return requestId
     * @throws TetherError(CollaboratorUnavailable) 通知无法送达; 此时不留下等待者
     */
    std::string request(const std::string& uiCommand, const nlohmann::json& payload,
                        Continuation onSettled, const std::string& owner = "");

    // 未知或已结算的 id 返回 false, 不抛异常
    bool resolve(const std::string& requestId, const nlohmann::json& value);
    bool cancel(const std::string& requestId, const std::string& reason = "Cancelled");
    size_t cancelOwnedBy(const std::string& owner);

    // 关闭前把所有剩余等待者结算为 Cancelled
    size_t flushAll(const std::string& reason);

    size_t pendingCount() const;
    std::vector<std::string> pendingIds() const;
    bool isPending(const std::string& requestId) const;
    nlohmann::json describePending() const;

    std::chrono::milliseconds getTimeout() const { return supervisor.getDeadline(); }

private:
    struct PendingWaiter {
        std::string requestId;
        std::string command;
        std::string owner;
        Clock::time_point createdAt;
        Continuation onSettled;
        EventLoop::TimerId timer = 0;
    };

    EventLoop& loop;
    INotificationSink& sink;
    TimeoutSupervisor supervisor;

    mutable std::mutex mtx;
    std::unordered_map<std::string, PendingWaiter> pending;
    std::atomic<std::uint64_t> sequence{0};

    std::string nextRequestId();
    bool settle(const std::string& requestId, Settlement settlement);
    void deliver(PendingWaiter waiter, Settlement settlement);
};
