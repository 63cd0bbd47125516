#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

enum class PlatformId {
    Linux,
    MacOS,
    Windows
};

inline PlatformId currentPlatform() {
#if defined(_WIN32)
    return PlatformId::Windows;
#elif defined(__APPLE__)
    return PlatformId::MacOS;
#else
    return PlatformId::Linux;
#endif
}

inline const char* platformName(PlatformId id) {
    switch (id) {
        case PlatformId::Linux: return "linux";
        case PlatformId::MacOS: return "macos";
        case PlatformId::Windows: return "windows";
    }
    return "linux";
}

inline std::int64_t epochMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// 本地时间 "YYYY-MM-DD HH:MM:SS"
inline std::string formatLocalTime(std::int64_t epochMs) {
    std::time_t seconds = static_cast<std::time_t>(epochMs / 1000);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}
