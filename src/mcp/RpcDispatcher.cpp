#include "mcp/RpcDispatcher.h"
#include "core/Errors.h"
#include "mcp/RpcProtocol.h"
#include "utils/Logger.h"

void ResponseWriter::write(const nlohmann::json& message) {
    std::lock_guard<std::mutex> lock(mtx);
    out << message.dump() << "\n";
    out.flush();
}

RpcDispatcher::RpcDispatcher(ToolRegistry& registry, CorrelationBroker& broker, ResponseWriter& writer,
                             ToolStats& stats, ServerInfo info)
    : registry(registry), broker(broker), writer(writer), stats(stats), info(std::move(info)) {}

void RpcDispatcher::respond(const nlohmann::json& id, const nlohmann::json& result) {
    if (id.is_null()) return;
    writer.write(makeRpcResult(id, result));
}

void RpcDispatcher::respondError(const nlohmann::json& id, int code, const std::string& message) {
    if (id.is_null()) return;
    writer.write(makeRpcError(id, code, message));
}

void RpcDispatcher::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) return;

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().error(std::string(errorKindName(ErrorKind::ParseError)) + ": " + e.what());
        return;
    }
    handleMessage(message);
}

void RpcDispatcher::handleMessage(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
        Logger::getInstance().error("Ignoring message without method: " + message.dump());
        return;
    }

    const std::string method = message["method"].get<std::string>();
    const nlohmann::json id = message.value("id", nlohmann::json());
    const nlohmann::json params = message.value("params", nlohmann::json::object());

    Logger::getInstance().debug("<- " + method + (id.is_null() ? "" : " id=" + id.dump()));

    if (method == "initialized" || method == "notifications/initialized") {
        Logger::getInstance().info("Client initialized");
        return;
    }
    if (method == "cancelled" || method == "notifications/cancelled") {
        handleCancelled(params);
        return;
    }

    try {
        if (method == "initialize") {
            handleInitialize(id);
        } else if (method == "tools/list" || method == "list-tools") {
            handleToolsList(id);
        } else if (method == "tools/call" || method == "call-tool") {
            handleToolsCall(id, params);
        } else if (method == "ping") {
            respond(id, nlohmann::json::object());
        } else {
            Logger::getInstance().warn(std::string(errorKindName(ErrorKind::UnknownMethod)) + ": " + method);
            respondError(id, RpcError::METHOD_NOT_FOUND, "Unknown method: " + method);
        }
    } catch (const std::exception& e) {
        Logger::getInstance().error("Error handling " + method + ": " + e.what());
        respondError(id, RpcError::INTERNAL_ERROR, e.what());
    }
}

void RpcDispatcher::handleInitialize(const nlohmann::json& id) {
    respond(id, {
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"serverInfo", {
            {"name", info.name},
            {"version", info.version}
        }},
        {"capabilities", {
            {"tools", nlohmann::json::object()}
        }}
    });
}

void RpcDispatcher::handleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& schema : registry.listToolSchemas()) {
        tools.push_back(schema);
    }
    respond(id, {{"tools", tools}});
}

void RpcDispatcher::handleToolsCall(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        respondError(id, RpcError::INVALID_PARAMS, "Missing tool name");
        return;
    }

    const std::string name = params["name"].get<std::string>();
    ITool* tool = registry.getTool(name);
    if (!tool) {
        Logger::getInstance().warn(std::string(errorKindName(ErrorKind::UnknownTool)) + ": " + name);
        respondError(id, RpcError::METHOD_NOT_FOUND, "Unknown tool: " + name);
        return;
    }

    nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) arguments = nlohmann::json::object();

    stats.totalCalls++;
    const std::string owner = "rpc_" + std::to_string(++callSequence);
    Logger::getInstance().info("Tool call: " + name + " (" + owner + ")");

    auto call = std::make_shared<ToolCall>(
        owner, arguments,
        [this, id, owner, name](const ToolResult& result) {
            inFlight.erase(owner);
            Logger::getInstance().debug("-> " + name + " done");
            respond(id, result.toJson());
        },
        [this, id, owner, name](int code, const std::string& message) {
            inFlight.erase(owner);
            Logger::getInstance().error(std::string(errorKindName(ErrorKind::HandlerFault)) + " in " + name + ": " + message);
            respondError(id, code, message);
        });

    try {
        tool->execute(call);
    } catch (const TetherError& e) {
        call->fault(e.what(), e.getKind() == ErrorKind::InvalidParams ? RpcError::INVALID_PARAMS
                                                                      : RpcError::INTERNAL_ERROR);
    } catch (const std::exception& e) {
        call->fault(e.what());
    }

    if (!call->isSettled()) {
        inFlight[owner] = InFlightCall{id, call};
    }
}

void RpcDispatcher::handleCancelled(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("requestId")) {
        return;
    }
    const nlohmann::json& target = params["requestId"];
    for (auto it = inFlight.begin(); it != inFlight.end();) {
        if (it->second.rpcId != target) {
            ++it;
            continue;
        }
        std::string owner = it->first;
        if (auto call = it->second.call.lock()) {
            call->suppress();
        }
        it = inFlight.erase(it);
        size_t cancelled = broker.cancelOwnedBy(owner);
        Logger::getInstance().info("Cancelled call " + target.dump() + " (" + std::to_string(cancelled) + " waiters)");
    }
}
