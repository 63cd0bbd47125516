#pragma once
#include <memory>
#include <string>
#include <thread>
#include "broker/CorrelationBroker.h"
#include "tools/ToolStats.h"

namespace httplib {
class Server;
}

/**
 * @brief 本机 HTTP 结算桥 (cpp-httplib)
 *
 *   POST /resolve  {"requestId", "value"}  → {"resolved": bool}
 *   POST /cancel   {"requestId"}           → {"cancelled": bool}
 *   GET  /pending                          → 未结算的等待者
 *   GET  /stats                            → 调用计数
 *   GET  /health                           → {"status": "ok"}
 *
 * 处理函数在 httplib 的工作线程上直接调用 broker (表有锁保护),
 * 续体仍然由 broker post 回事件循环。未知 id 返回 200 + false。
 */
class HttpBridge {
public:
    HttpBridge(CorrelationBroker& broker, ToolStats& stats, std::string host, int port);
    ~HttpBridge();

    HttpBridge(const HttpBridge&) = delete;
    HttpBridge& operator=(const HttpBridge&) = delete;

    // @throws TetherError(ConfigError) 端口无法绑定
    void start();
    void stop();

    int getPort() const { return port; }

private:
    CorrelationBroker& broker;
    ToolStats& stats;
    std::string host;
    int port;
    std::unique_ptr<httplib::Server> server;
    std::thread thread;

    void registerRoutes();
};
