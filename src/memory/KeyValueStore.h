#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

/**
 * @brief 会话数据的键值存储
 *
 * 值是任意 JSON。get() 对不存在的键返回 null。
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual nlohmann::json get(const std::string& key) const = 0;
    virtual void put(const std::string& key, const nlohmann::json& value) = 0;
    virtual bool contains(const std::string& key) const = 0;
};

// 测试与禁用持久化时使用
class InMemoryStore : public KeyValueStore {
public:
    nlohmann::json get(const std::string& key) const override;
    void put(const std::string& key, const nlohmann::json& value) override;
    bool contains(const std::string& key) const override;

private:
    mutable std::mutex mtx;
    nlohmann::json data = nlohmann::json::object();
};

/**
 * @brief 整个存储保存为一个 JSON 文件
 *
 * 构造时加载; 文件损坏时记录警告并从空存储开始。
 * 每次 put() 都整体写回, 写失败抛出 TetherError(HandlerFault) 且内存内容不变。
 */
class JsonFileStore : public KeyValueStore {
public:
    explicit JsonFileStore(const std::string& path);

    nlohmann::json get(const std::string& key) const override;
    void put(const std::string& key, const nlohmann::json& value) override;
    bool contains(const std::string& key) const override;

    const fs::path& getPath() const { return path; }

private:
    fs::path path;
    mutable std::mutex mtx;
    nlohmann::json data = nlohmann::json::object();

    void load();
    void save(const nlohmann::json& snapshot) const;
};
