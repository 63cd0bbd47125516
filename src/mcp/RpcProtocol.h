#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief JSON-RPC 2.0 / MCP 报文构造
 */
namespace RpcError {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
}

constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

inline nlohmann::json makeRpcResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline nlohmann::json makeRpcError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

// MCP content 格式的工具结果
inline nlohmann::json makeToolContent(const std::string& text, bool isError = false) {
    nlohmann::json content = nlohmann::json::array();
    content.push_back({
        {"type", "text"},
        {"text", text}
    });

    nlohmann::json response = {{"content", content}};
    if (isError) {
        response["isError"] = true;
    }
    return response;
}
