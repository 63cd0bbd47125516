#include "mcp/NotificationChannel.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <iostream>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
    #include <io.h>
    #include <fcntl.h>
#else
    #include <unistd.h>
    #include <fcntl.h>
#endif

StreamNotificationSink::StreamNotificationSink(std::ostream& out, std::string name)
    : out(out), name(std::move(name)) {}

void StreamNotificationSink::emit(const nlohmann::json& message) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!out.good()) {
        throw TetherError(ErrorKind::CollaboratorUnavailable, "Notification stream " + name + " is closed");
    }
    out << message.dump() << '\n';
    out.flush();
    if (!out.good()) {
        throw TetherError(ErrorKind::CollaboratorUnavailable, "Failed to write to notification stream " + name);
    }
}

FdNotificationSink::FdNotificationSink(int fd) : fd(fd), ownsFd(false) {}

FdNotificationSink::FdNotificationSink(const std::string& path) : ownsFd(true), path(path) {}

FdNotificationSink::~FdNotificationSink() {
    closeFd();
}

std::string FdNotificationSink::describe() const {
    if (!path.empty()) return path;
    return "fd:" + std::to_string(fd);
}

bool FdNotificationSink::ensureOpen() {
    if (fd >= 0) return true;
    if (path.empty()) return false;
#ifdef _WIN32
    fd = _open(path.c_str(), _O_WRONLY | _O_APPEND | _O_CREAT, 0600);
#else
    // O_NONBLOCK: opening a FIFO without a reader fails with ENXIO instead of blocking.
    fd = open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_NONBLOCK, 0600);
    if (fd >= 0) {
        int flags = fcntl(fd, F_GETFL);
        if (flags >= 0) fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
    }
#endif
    if (fd < 0) {
        Logger::getInstance().debug("Notification channel " + path + " not open: " + std::strerror(errno));
        return false;
    }
    return true;
}

void FdNotificationSink::closeFd() {
    if (fd >= 0 && ownsFd) {
#ifdef _WIN32
        _close(fd);
#else
        close(fd);
#endif
    }
    if (ownsFd) fd = -1;
}

void FdNotificationSink::emit(const nlohmann::json& message) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!ensureOpen()) {
        throw TetherError(ErrorKind::CollaboratorUnavailable, "Notification channel " + describe() + " unavailable");
    }

    std::string line = message.dump() + "\n";
    size_t total = 0;
    while (total < line.size()) {
#ifdef _WIN32
        auto n = _write(fd, line.data() + total, static_cast<unsigned int>(line.size() - total));
#else
        ssize_t n = write(fd, line.data() + total, line.size() - total);
#endif
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            std::string reason = std::strerror(errno);
            // The reader went away; reopen lazily next time.
            closeFd();
            throw TetherError(ErrorKind::CollaboratorUnavailable,
                              "Failed to write to notification channel " + describe() + ": " + reason);
        }
        total += static_cast<size_t>(n);
    }
}

std::unique_ptr<INotificationSink> makeNotificationSink(const std::string& channelPath) {
    if (channelPath.empty() || channelPath == "stderr") {
        return std::make_unique<StreamNotificationSink>(std::cerr, "stderr");
    }
    if (channelPath.rfind("fd:", 0) == 0) {
        int fd = -1;
        try {
            fd = std::stoi(channelPath.substr(3));
        } catch (const std::exception&) {
            throw TetherError(ErrorKind::ConfigError, "Invalid notification channel: " + channelPath);
        }
        if (fd == 1) {
            throw TetherError(ErrorKind::ConfigError, "Notification channel must not share stdout with RPC responses");
        }
        return std::make_unique<FdNotificationSink>(fd);
    }
    return std::make_unique<FdNotificationSink>(channelPath);
}

nlohmann::json makeCollectInputMessage(const std::string& command, const nlohmann::json& arguments) {
    return {
        {"jsonrpc", "2.0"},
        {"method", "collect-input"},
        {"params", {
            {"command", command},
            {"arguments", arguments}
        }}
    };
}

nlohmann::json makeShowNotificationMessage(const std::string& level, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"method", "show-notification"},
        {"params", {
            {"level", level},
            {"message", message}
        }}
    };
}
