#pragma once
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 带外通知通道
 *
 * 与 RPC 响应流物理隔离的第二条行分隔 JSON 流,
 * 只用于请求 UI 宿主收集输入或展示通知。
 *
 * emit() 无法送达时抛出 TetherError(CollaboratorUnavailable)。
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;
    virtual void emit(const nlohmann::json& message) = 0;
    virtual std::string describe() const = 0;
};

// 写入已有的 std::ostream (默认 stderr)
class StreamNotificationSink : public INotificationSink {
public:
    explicit StreamNotificationSink(std::ostream& out, std::string name = "stream");

    void emit(const nlohmann::json& message) override;
    std::string describe() const override { return name; }

private:
    std::ostream& out;
    std::string name;
    std::mutex mtx;
};

/**
 * @brief 写入文件描述符或 FIFO
 *
 * FIFO 以非阻塞方式延迟打开: 没有读端时视为协作方不可用,
 * 下一次 emit 会重新尝试。
 */
class FdNotificationSink : public INotificationSink {
public:
    explicit FdNotificationSink(int fd);
    explicit FdNotificationSink(const std::string& path);
    ~FdNotificationSink() override;

    void emit(const nlohmann::json& message) override;
    std::string describe() const override;

private:
    int fd = -1;
    bool ownsFd = false;
    std::string path;
    std::mutex mtx;

    bool ensureOpen();
    void closeFd();
};

/**
 * @brief 根据配置描述创建通知通道
 * @param channelPath "stderr" | "fd:<n>" | 路径
 */
std::unique_ptr<INotificationSink> makeNotificationSink(const std::string& channelPath);

// 通道消息构造
nlohmann::json makeCollectInputMessage(const std::string& command, const nlohmann::json& arguments);
nlohmann::json makeShowNotificationMessage(const std::string& level, const std::string& message);
