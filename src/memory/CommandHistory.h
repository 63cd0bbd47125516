#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "memory/KeyValueStore.h"

struct CommandEntry {
    std::int64_t timestampMs = 0;
    std::string command;
    std::string optimized;
    std::string context;
    bool success = false;
};

void to_json(nlohmann::json& j, const CommandEntry& entry);
void from_json(const nlohmann::json& j, CommandEntry& entry);

/**
 * @brief 指令历史
 *
 * 只保留最新的 maxEntries 条, 存在 KeyValueStore 的 "command_history" 键下。
 */
class CommandHistory {
public:
    static constexpr size_t DEFAULT_MAX_ENTRIES = 100;

    explicit CommandHistory(KeyValueStore& store, size_t maxEntries = DEFAULT_MAX_ENTRIES);

    void append(const CommandEntry& entry);

    /**
     * @brief 取最近 limit 条, 再按子串过滤 command / optimized
     *
     * 先截取后过滤, 因此结果可能少于 limit 条。
     */
    std::vector<CommandEntry> recent(size_t limit, const std::string& filter = "") const;

    size_t size() const;
    size_t getMaxEntries() const { return maxEntries; }

    // 编号列表, 空时返回 "No command history"
    static std::string render(const std::vector<CommandEntry>& entries);

private:
    KeyValueStore& store;
    size_t maxEntries;

    std::vector<CommandEntry> loadAll() const;
};
