#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "dialog/DialogTypes.h"
#include "mcp/RpcProtocol.h"

/**
 * @brief 工具结果
 *
 * text 作为第一个 content 项, attachments 以 image 项追加在后面。
 */
struct ToolResult {
    std::string text;
    std::vector<Attachment> attachments;
    bool isError = false;

    static ToolResult ok(const std::string& text) { return ToolResult{text, {}, false}; }
    static ToolResult error(const std::string& text) { return ToolResult{text, {}, true}; }

    nlohmann::json toJson() const;
};

class ToolCall;
using ToolCallPtr = std::shared_ptr<ToolCall>;

/**
 * @brief 一次 tools/call 调用的应答句柄
 *
 * 工具可以同步应答, 也可以把句柄保存在续体里稍后应答。
 * 无论走哪条路径, 每个调用只产生一个响应: 重复的 reply/fault 被丢弃,
 * 被取消的调用不再产生响应。
 */
class ToolCall : public std::enable_shared_from_this<ToolCall> {
public:
    using ResultSink = std::function<void(const ToolResult&)>;
    using FaultSink = std::function<void(int code, const std::string&)>;

    ToolCall(std::string owner, nlohmann::json arguments, ResultSink onResult, FaultSink onFault);

    const std::string& getOwner() const { return owner; }
    const nlohmann::json& getArguments() const { return arguments; }

    // 返回 false 表示已应答或已被取消
    bool reply(const ToolResult& result);
    bool fault(const std::string& message, int code = RpcError::INTERNAL_ERROR);

    // 调用方取消: 之后的 reply/fault 全部静默丢弃
    void suppress() { settled.store(true); }
    bool isSettled() const { return settled.load(); }

    /**
     * @brief 包装续体: 续体抛出的异常转成 fault (-32603)
     */
    template <typename F>
    auto guard(F fn) {
        auto self = shared_from_this();
        return [self, fn](auto&&... args) {
            try {
                fn(std::forward<decltype(args)>(args)...);
            } catch (const std::exception& e) {
                self->fault(e.what());
            }
        };
    }

private:
    std::string owner;
    nlohmann::json arguments;
    ResultSink onResult;
    FaultSink onFault;
    std::atomic<bool> settled{false};
};

/**
 * @brief 工具接口定义
 *
 * execute() 在事件循环线程上调用, 不得阻塞:
 * 需要人工输入的工具登记等待者后立即返回, 结算时再通过 call->reply() 应答。
 * execute() 直接抛出的异常由分发器转成 -32603。
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief 获取工具名称
     * @return 工具的唯一标识名称
     */
    virtual std::string getName() const = 0;

    /**
     * @brief 获取工具描述
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief 获取工具的 JSON Schema (MCP inputSchema)
     */
    virtual nlohmann::json getSchema() const = 0;

    virtual void execute(const ToolCallPtr& call) = 0;
};

/**
 * @brief 同步工具基类
 *
 * 纯本地工具只需实现 run(), 结果立即应答。
 */
class SyncTool : public ITool {
public:
    void execute(const ToolCallPtr& call) override {
        call->reply(run(call->getArguments()));
    }

protected:
    virtual ToolResult run(const nlohmann::json& args) = 0;
};
