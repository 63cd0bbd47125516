#include "utils/ScopedTempFile.h"
#include "utils/Logger.h"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>

#ifdef _WIN32
    #include <process.h>
    #define getpid _getpid
#else
    #include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace {
std::atomic<unsigned long> tempCounter{0};
}

ScopedTempFile::ScopedTempFile(const std::string& prefix, const std::string& extension) {
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string name = prefix + "_" + std::to_string(getpid()) + "_" + std::to_string(now) + "_" +
                       std::to_string(++tempCounter) + extension;
    filePath = fs::temp_directory_path() / fs::u8path(name);
}

ScopedTempFile::~ScopedTempFile() {
    std::error_code ec;
    fs::remove(filePath, ec);
    if (ec) {
        Logger::getInstance().warn("Failed to remove temp file " + filePath.u8string() + ": " + ec.message());
    }
}

bool ScopedTempFile::exists() const {
    std::error_code ec;
    return fs::exists(filePath, ec);
}

std::string ScopedTempFile::readTrimmed() const {
    std::ifstream f(filePath, std::ios::binary);
    if (!f.is_open()) return "";
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    // PowerShell Out-File -Encoding UTF8 writes a BOM
    if (content.size() >= 3 && static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB && static_cast<unsigned char>(content[2]) == 0xBF) {
        content.erase(0, 3);
    }

    auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    size_t start = 0;
    while (start < content.size() && isSpace(content[start])) start++;
    size_t end = content.size();
    while (end > start && isSpace(content[end - 1])) end--;
    return content.substr(start, end - start);
}
