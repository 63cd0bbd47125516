#pragma once
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

// 调用计数, HTTP 桥 GET /stats 读取
struct ToolStats {
    std::atomic<std::uint64_t> totalCalls{0};
    std::atomic<std::uint64_t> askUserCalls{0};
    std::atomic<std::uint64_t> askContinueCalls{0};
    std::atomic<std::uint64_t> notifyCalls{0};
    std::atomic<std::uint64_t> attachments{0};

    nlohmann::json toJson() const {
        return {
            {"totalCalls", totalCalls.load()},
            {"askUserCalls", askUserCalls.load()},
            {"askContinueCalls", askContinueCalls.load()},
            {"notifyCalls", notifyCalls.load()},
            {"attachments", attachments.load()}
        };
    }
};
