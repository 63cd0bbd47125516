#include "mcp/HttpBridge.h"
#include "httplib.h"
#include <nlohmann/json.hpp>
#include "core/Errors.h"
#include "utils/Logger.h"

namespace {
const char* JSON_TYPE = "application/json";

bool parseBody(const httplib::Request& req, httplib::Response& res, nlohmann::json& body) {
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error&) {
        res.status = 400;
        res.set_content(R"({"error":"invalid JSON in request body"})", JSON_TYPE);
        return false;
    }
    if (!body.is_object() || !body.contains("requestId") || !body["requestId"].is_string()) {
        res.status = 400;
        res.set_content(R"({"error":"requestId is required"})", JSON_TYPE);
        return false;
    }
    return true;
}
}

HttpBridge::HttpBridge(CorrelationBroker& broker, ToolStats& stats, std::string host, int port)
    : broker(broker), stats(stats), host(std::move(host)), port(port),
      server(std::make_unique<httplib::Server>()) {}

HttpBridge::~HttpBridge() {
    stop();
}

void HttpBridge::registerRoutes() {
    server->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", JSON_TYPE);
    });

    server->Get("/pending", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = {
            {"count", broker.pendingCount()},
            {"pending", broker.describePending()}
        };
        res.set_content(body.dump(), JSON_TYPE);
    });

    server->Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = stats.toJson();
        body["pending"] = broker.pendingCount();
        res.set_content(body.dump(), JSON_TYPE);
    });

    server->Post("/resolve", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!parseBody(req, res, body)) return;

        std::string requestId = body["requestId"].get<std::string>();
        bool resolved = broker.resolve(requestId, body.value("value", nlohmann::json()));
        Logger::getInstance().debug("HTTP resolve " + requestId + (resolved ? " ok" : " unknown"));
        res.set_content(nlohmann::json{{"resolved", resolved}}.dump(), JSON_TYPE);
    });

    server->Post("/cancel", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!parseBody(req, res, body)) return;

        std::string requestId = body["requestId"].get<std::string>();
        bool cancelled = broker.cancel(requestId, "Cancelled over HTTP");
        res.set_content(nlohmann::json{{"cancelled", cancelled}}.dump(), JSON_TYPE);
    });

    server->set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "unknown error";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "non-standard exception";
        }
        Logger::getInstance().error("HTTP bridge: " + message);
        res.status = 500;
        res.set_content(nlohmann::json{{"error", message}}.dump(), JSON_TYPE);
    });
}

void HttpBridge::start() {
    registerRoutes();

    if (port == 0) {
        port = server->bind_to_any_port(host);
        if (port < 0) {
            throw TetherError(ErrorKind::ConfigError, "HTTP bridge cannot bind " + host);
        }
    } else if (!server->bind_to_port(host, port)) {
        throw TetherError(ErrorKind::ConfigError,
                          "HTTP bridge cannot bind " + host + ":" + std::to_string(port));
    }

    thread = std::thread([this]() {
        if (!server->listen_after_bind()) {
            Logger::getInstance().error("HTTP bridge stopped listening");
        }
    });
    Logger::getInstance().info("HTTP bridge listening on " + host + ":" + std::to_string(port));
}

void HttpBridge::stop() {
    if (server) server->stop();
    if (thread.joinable()) thread.join();
}
