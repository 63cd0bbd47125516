#include "memory/KeyValueStore.h"
#include <fstream>
#include "core/Errors.h"
#include "utils/Logger.h"

nlohmann::json InMemoryStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = data.find(key);
    return it == data.end() ? nlohmann::json() : *it;
}

void InMemoryStore::put(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mtx);
    data[key] = value;
}

bool InMemoryStore::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx);
    return data.contains(key);
}

JsonFileStore::JsonFileStore(const std::string& path) : path(fs::u8path(path)) {
    load();
}

void JsonFileStore::load() {
    std::error_code existsEc;
    if (!fs::exists(path, existsEc)) {
        return;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::getInstance().warn("Cannot open store file: " + path.u8string());
        return;
    }
    try {
        nlohmann::json loaded;
        file >> loaded;
        if (loaded.is_object()) {
            data = std::move(loaded);
        } else {
            Logger::getInstance().warn("Store file is not a JSON object, starting empty: " + path.u8string());
        }
    } catch (const nlohmann::json::exception& e) {
        Logger::getInstance().warn("Corrupt store file " + path.u8string() + ": " + e.what());
    }
}

void JsonFileStore::save(const nlohmann::json& snapshot) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw TetherError(ErrorKind::HandlerFault,
                              "Cannot create " + path.parent_path().u8string() + ": " + ec.message());
        }
    }

    // 写临时文件后整体替换
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw TetherError(ErrorKind::HandlerFault, "Cannot write " + tmp.u8string());
        }
        file << snapshot.dump(2);
        if (!file) {
            throw TetherError(ErrorKind::HandlerFault, "Write failed: " + tmp.u8string());
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        throw TetherError(ErrorKind::HandlerFault, "Cannot replace " + path.u8string() + ": " + ec.message());
    }
}

nlohmann::json JsonFileStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = data.find(key);
    return it == data.end() ? nlohmann::json() : *it;
}

void JsonFileStore::put(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mtx);
    // 先落盘再替换内存, 写失败时两边保持一致
    nlohmann::json next = data;
    next[key] = value;
    save(next);
    data = std::move(next);
}

bool JsonFileStore::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx);
    return data.contains(key);
}
