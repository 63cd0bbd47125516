#include "ITool.h"
#include "mcp/RpcProtocol.h"

nlohmann::json ToolResult::toJson() const {
    nlohmann::json response = makeToolContent(text, isError);
    for (const auto& attachment : attachments) {
        response["content"].push_back({
            {"type", "image"},
            {"data", attachment.data},
            {"mimeType", attachment.mimeType}
        });
    }
    return response;
}

ToolCall::ToolCall(std::string owner, nlohmann::json arguments, ResultSink onResult, FaultSink onFault)
    : owner(std::move(owner)), arguments(std::move(arguments)),
      onResult(std::move(onResult)), onFault(std::move(onFault)) {}

bool ToolCall::reply(const ToolResult& result) {
    if (settled.exchange(true)) return false;
    if (onResult) onResult(result);
    return true;
}

bool ToolCall::fault(const std::string& message, int code) {
    if (settled.exchange(true)) return false;
    if (onFault) onFault(code, message);
    return true;
}
