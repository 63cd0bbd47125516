#pragma once
#include <chrono>
#include <functional>
#include <string>
#include "core/EventLoop.h"

/**
 * @brief 等待者超时监督
 *
 * 每个等待者创建时登记一个延迟失败。到期回调只负责"请求"超时结算,
 * 真正的一次性保证由 CorrelationBroker 的结算逻辑提供:
 * 已结算的等待者再收到超时是无操作。
 */
class TimeoutSupervisor {
public:
    using ExpireCallback = std::function<void(const std::string& requestId)>;

    static constexpr long DEFAULT_TIMEOUT_MS = 30000;

    TimeoutSupervisor(EventLoop& loop, std::chrono::milliseconds deadline);

    EventLoop::TimerId arm(const std::string& requestId, ExpireCallback onExpire);

    // 尽力取消; 已触发的定时器忽略
    void disarm(EventLoop::TimerId timerId);

    std::chrono::milliseconds getDeadline() const { return deadline; }

private:
    EventLoop& loop;
    std::chrono::milliseconds deadline;
};
