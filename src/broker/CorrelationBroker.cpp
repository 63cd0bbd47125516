#include "broker/CorrelationBroker.h"
#include "core/Errors.h"
#include "utils/Logger.h"

const char* settlementStatusName(SettlementStatus status) {
    switch (status) {
        case SettlementStatus::Fulfilled: return "fulfilled";
        case SettlementStatus::TimedOut: return "timed-out";
        case SettlementStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

CorrelationBroker::CorrelationBroker(EventLoop& loop, INotificationSink& sink, std::chrono::milliseconds timeout)
    : loop(loop), sink(sink), supervisor(loop, timeout) {}

CorrelationBroker::~CorrelationBroker() {
    std::lock_guard<std::mutex> lock(mtx);
    if (!pending.empty()) {
        Logger::getInstance().warn("Broker destroyed with " + std::to_string(pending.size()) +
                                   " unsettled waiter(s); call flushAll() before shutdown");
    }
    for (auto& [id, waiter] : pending) {
        supervisor.disarm(waiter.timer);
    }
    pending.clear();
}

std::string CorrelationBroker::nextRequestId() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    // 序号保证唯一, 时间戳便于在日志中对照
    return "req_" + std::to_string(ms) + "_" + std::to_string(++sequence);
}

std::string CorrelationBroker::request(const std::string& uiCommand, const nlohmann::json& payload,
                                       Continuation onSettled, const std::string& owner) {
    std::string requestId = nextRequestId();

    nlohmann::json arguments = nlohmann::json::array();
    arguments.push_back(requestId);
    if (payload.is_array()) {
        for (const auto& item : payload) arguments.push_back(item);
    } else if (!payload.is_null()) {
        arguments.push_back(payload);
    }

    // Insert before emitting so an immediate resolve() finds the waiter.
    {
        std::lock_guard<std::mutex> lock(mtx);
        PendingWaiter waiter;
        waiter.requestId = requestId;
        waiter.command = uiCommand;
        waiter.owner = owner;
        waiter.createdAt = Clock::now();
        waiter.onSettled = std::move(onSettled);
        waiter.timer = supervisor.arm(requestId, [this](const std::string& id) {
            settle(id, Settlement::timeout("No answer within " +
                                           std::to_string(supervisor.getDeadline().count()) + " ms"));
        });
        pending.emplace(requestId, std::move(waiter));
    }

    try {
        sink.emit(makeCollectInputMessage(uiCommand, arguments));
    } catch (const std::exception& e) {
        EventLoop::TimerId timer = 0;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = pending.find(requestId);
            if (it != pending.end()) {
                timer = it->second.timer;
                pending.erase(it);
            }
        }
        supervisor.disarm(timer);
        Logger::getInstance().warn("Collaborator unreachable for " + uiCommand + ": " + e.what());
        throw TetherError(ErrorKind::CollaboratorUnavailable, e.what());
    }

    Logger::getInstance().debug("Waiting on " + requestId + " (" + uiCommand + ")");
    return requestId;
}

bool CorrelationBroker::settle(const std::string& requestId, Settlement settlement) {
    PendingWaiter waiter;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = pending.find(requestId);
        if (it == pending.end()) {
            return false;
        }
        waiter = std::move(it->second);
        pending.erase(it);
    }

    if (settlement.status != SettlementStatus::TimedOut) {
        supervisor.disarm(waiter.timer);
    }
    deliver(std::move(waiter), std::move(settlement));
    return true;
}

void CorrelationBroker::deliver(PendingWaiter waiter, Settlement settlement) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - waiter.createdAt);
    Logger::getInstance().info("Waiter " + waiter.requestId + " " + settlementStatusName(settlement.status) +
                               " after " + std::to_string(elapsed.count()) + " ms");
    if (!waiter.onSettled) return;
    loop.post([callback = std::move(waiter.onSettled), settlement = std::move(settlement)]() {
        callback(settlement);
    });
}

bool CorrelationBroker::resolve(const std::string& requestId, const nlohmann::json& value) {
    bool settled = settle(requestId, Settlement::fulfill(value));
    if (!settled) {
        Logger::getInstance().debug("Ignoring answer for unknown or settled request " + requestId);
    }
    return settled;
}

bool CorrelationBroker::cancel(const std::string& requestId, const std::string& reason) {
    return settle(requestId, Settlement::cancelled(reason));
}

size_t CorrelationBroker::cancelOwnedBy(const std::string& owner) {
    if (owner.empty()) return 0;
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& [id, waiter] : pending) {
            if (waiter.owner == owner) ids.push_back(id);
        }
    }
    size_t count = 0;
    for (const auto& id : ids) {
        if (cancel(id, "Request cancelled by caller")) count++;
    }
    return count;
}

size_t CorrelationBroker::flushAll(const std::string& reason) {
    std::unordered_map<std::string, PendingWaiter> drained;
    {
        std::lock_guard<std::mutex> lock(mtx);
        drained.swap(pending);
    }
    for (auto& [id, waiter] : drained) {
        supervisor.disarm(waiter.timer);
        deliver(std::move(waiter), Settlement::cancelled(reason));
    }
    return drained.size();
}

size_t CorrelationBroker::pendingCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pending.size();
}

std::vector<std::string> CorrelationBroker::pendingIds() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> ids;
    ids.reserve(pending.size());
    for (const auto& [id, waiter] : pending) ids.push_back(id);
    return ids;
}

bool CorrelationBroker::isPending(const std::string& requestId) const {
    std::lock_guard<std::mutex> lock(mtx);
    return pending.count(requestId) > 0;
}

nlohmann::json CorrelationBroker::describePending() const {
    std::lock_guard<std::mutex> lock(mtx);
    auto now = Clock::now();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& [id, waiter] : pending) {
        list.push_back({
            {"requestId", id},
            {"command", waiter.command},
            {"ageMs", std::chrono::duration_cast<std::chrono::milliseconds>(now - waiter.createdAt).count()}
        });
    }
    return list;
}
