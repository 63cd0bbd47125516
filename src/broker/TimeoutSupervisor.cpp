#include "broker/TimeoutSupervisor.h"
#include "utils/Logger.h"

TimeoutSupervisor::TimeoutSupervisor(EventLoop& loop, std::chrono::milliseconds deadline)
    : loop(loop), deadline(deadline) {
    if (this->deadline.count() <= 0) {
        this->deadline = std::chrono::milliseconds(DEFAULT_TIMEOUT_MS);
    }
}

EventLoop::TimerId TimeoutSupervisor::arm(const std::string& requestId, ExpireCallback onExpire) {
    return loop.schedule(deadline, [requestId, onExpire = std::move(onExpire)]() {
        Logger::getInstance().debug("Deadline reached for " + requestId);
        onExpire(requestId);
    });
}

void TimeoutSupervisor::disarm(EventLoop::TimerId timerId) {
    if (timerId == 0) return;
    loop.cancelTimer(timerId);
}
