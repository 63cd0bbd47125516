#pragma once
#include <atomic>
#include <string>
#include <thread>
#include "broker/CorrelationBroker.h"
#include "core/EventLoop.h"

/**
 * @brief 入站结算通道
 *
 * UI 宿主把结果写回这条行分隔 JSON 流 (文件描述符或 FIFO):
 *   {"method": "resolve", "params": {"requestId": "...", "value": ...}}
 *   {"method": "cancel",  "params": {"requestId": "..."}}
 *
 * 读线程只负责切行, 解析与结算都 post 回事件循环。
 */
class ResolveChannel {
public:
    ResolveChannel(EventLoop& loop, CorrelationBroker& broker, std::string channelPath);
    ~ResolveChannel();

    ResolveChannel(const ResolveChannel&) = delete;
    ResolveChannel& operator=(const ResolveChannel&) = delete;

    // @throws TetherError(ConfigError) 描述非法或通道无法打开
    void start();
    void stop();

    /**
     * @brief 处理一行
     * @return 是否结算了某个等待者; 非法行记录日志后返回 false
     */
    static bool applyLine(CorrelationBroker& broker, const std::string& line);

private:
    EventLoop& loop;
    CorrelationBroker& broker;
    std::string channelPath;
    std::string path;
    int fd = -1;
    bool ownsFd = false;
    bool isFifo = false;
    std::atomic<bool> running{false};
    std::thread reader;

    bool openChannel();
    void closeChannel();
    void readLoop();
};
