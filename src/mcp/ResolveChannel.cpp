#include "mcp/ResolveChannel.h"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <nlohmann/json.hpp>
#include "core/Errors.h"
#include "utils/Logger.h"

#ifndef _WIN32
    #include <fcntl.h>
    #include <poll.h>
    #include <sys/stat.h>
    #include <unistd.h>
#endif

namespace {
constexpr int POLL_INTERVAL_MS = 200;
}

ResolveChannel::ResolveChannel(EventLoop& loop, CorrelationBroker& broker, std::string channelPath)
    : loop(loop), broker(broker), channelPath(std::move(channelPath)) {}

ResolveChannel::~ResolveChannel() {
    stop();
}

bool ResolveChannel::applyLine(CorrelationBroker& broker, const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) return false;

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().error(std::string("Resolve channel: ") + e.what());
        return false;
    }

    if (!message.is_object() || !message.contains("params") || !message["params"].is_object()) {
        Logger::getInstance().error("Resolve channel: message without params: " + message.dump());
        return false;
    }
    const auto& params = message["params"];
    if (!params.contains("requestId") || !params["requestId"].is_string()) {
        Logger::getInstance().error("Resolve channel: missing requestId: " + message.dump());
        return false;
    }

    std::string method = message.contains("method") && message["method"].is_string()
                             ? message["method"].get<std::string>() : "";
    std::string requestId = params["requestId"].get<std::string>();
    if (method == "resolve") {
        return broker.resolve(requestId, params.value("value", nlohmann::json()));
    }
    if (method == "cancel") {
        return broker.cancel(requestId, "Dismissed by UI host");
    }
    Logger::getInstance().error("Resolve channel: unknown method " + method);
    return false;
}

#ifdef _WIN32

void ResolveChannel::start() {
    throw TetherError(ErrorKind::ConfigError, "Resolve channel is not supported on Windows; use the HTTP bridge");
}

void ResolveChannel::stop() {}
bool ResolveChannel::openChannel() { return false; }
void ResolveChannel::closeChannel() {}
void ResolveChannel::readLoop() {}

#else

bool ResolveChannel::openChannel() {
    if (!ownsFd) return fd >= 0;
    fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        Logger::getInstance().error("Cannot open resolve channel " + path + ": " + std::strerror(errno));
        return false;
    }
    struct stat info{};
    isFifo = fstat(fd, &info) == 0 && S_ISFIFO(info.st_mode);
    return true;
}

void ResolveChannel::closeChannel() {
    if (fd >= 0 && ownsFd) {
        close(fd);
        fd = -1;
    }
}

void ResolveChannel::start() {
    if (running.load()) return;

    if (channelPath.rfind("fd:", 0) == 0) {
        try {
            fd = std::stoi(channelPath.substr(3));
        } catch (const std::exception&) {
            throw TetherError(ErrorKind::ConfigError, "Invalid resolve channel: " + channelPath);
        }
        if (fd == 0) {
            throw TetherError(ErrorKind::ConfigError, "Resolve channel must not share stdin with RPC requests");
        }
        ownsFd = false;
    } else {
        path = channelPath;
        ownsFd = true;
        if (!openChannel()) {
            throw TetherError(ErrorKind::ConfigError, "Cannot open resolve channel: " + channelPath);
        }
    }

    running = true;
    reader = std::thread([this]() { readLoop(); });
    Logger::getInstance().info("Resolve channel listening on " + channelPath);
}

void ResolveChannel::stop() {
    running = false;
    if (reader.joinable()) reader.join();
    closeChannel();
}

void ResolveChannel::readLoop() {
    std::string buffer;
    char chunk[4096];

    while (running.load()) {
        pollfd pfd{fd, POLLIN, 0};
        int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::getInstance().error(std::string("Resolve channel poll failed: ") + std::strerror(errno));
            break;
        }
        if (ready == 0) continue;

        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            Logger::getInstance().error(std::string("Resolve channel read failed: ") + std::strerror(errno));
            break;
        }
        if (n == 0) {
            // FIFO 写端全部关闭: 重新打开等待下一个写者; 普通文件像 tail -f 一样等待追加;
            // 继承来的 fd 到 EOF 即结束
            if (!ownsFd) break;
            if (!isFifo) {
                std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
                continue;
            }
            closeChannel();
            if (!openChannel()) break;
            continue;
        }

        buffer.append(chunk, static_cast<size_t>(n));
        size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            CorrelationBroker& target = broker;
            loop.post([&target, line]() { applyLine(target, line); });
        }
    }
    Logger::getInstance().info("Resolve channel closed: " + channelPath);
}

#endif
