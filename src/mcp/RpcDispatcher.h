#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "broker/CorrelationBroker.h"
#include "tools/ToolRegistry.h"
#include "tools/ToolStats.h"

/**
 * @brief RPC 响应流 (stdout)
 *
 * 每个响应一行, 写完立即 flush。
 */
class ResponseWriter {
public:
    explicit ResponseWriter(std::ostream& out) : out(out) {}

    void write(const nlohmann::json& message);

private:
    std::ostream& out;
    std::mutex mtx;
};

/**
 * @brief JSON-RPC 2.0 / MCP 分发器
 *
 * 只在事件循环线程上调用。按到达顺序分发, 工具的应答可以乱序到达。
 *
 * - 空行忽略; 非法 JSON 记录日志后丢弃, 不产生响应
 * - 通知 (initialized / cancelled 及其 notifications/ 前缀形式) 从不响应
 * - 没有 id 的未知方法直接丢弃
 * - 工具抛出的异常在这里转成 -32603, 不会越过分发边界
 */
class RpcDispatcher {
public:
    struct ServerInfo {
        std::string name = "tether";
        std::string version = "1.0.0";
    };

    RpcDispatcher(ToolRegistry& registry, CorrelationBroker& broker, ResponseWriter& writer,
                  ToolStats& stats, ServerInfo info);

    void handleLine(const std::string& line);
    void handleMessage(const nlohmann::json& message);

    size_t inFlightCount() const { return inFlight.size(); }

private:
    struct InFlightCall {
        nlohmann::json rpcId;
        std::weak_ptr<ToolCall> call;
    };

    ToolRegistry& registry;
    CorrelationBroker& broker;
    ResponseWriter& writer;
    ToolStats& stats;
    ServerInfo info;

    std::map<std::string, InFlightCall> inFlight;
    std::uint64_t callSequence = 0;

    void respond(const nlohmann::json& id, const nlohmann::json& result);
    void respondError(const nlohmann::json& id, int code, const std::string& message);

    void handleInitialize(const nlohmann::json& id);
    void handleToolsList(const nlohmann::json& id);
    void handleToolsCall(const nlohmann::json& id, const nlohmann::json& params);
    void handleCancelled(const nlohmann::json& params);
};
