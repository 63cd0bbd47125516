#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "memory/KeyValueStore.h"

/**
 * @brief 项目上下文摘要
 *
 * 存在 KeyValueStore 的 "context_summary" 键下。
 */
class ContextSummary {
public:
    struct Update {
        std::optional<std::string> projectName;
        std::optional<std::string> projectType;
        std::optional<std::vector<std::string>> technologies;
        std::optional<std::string> currentTask;
    };

    explicit ContextSummary(KeyValueStore& store);

    // 只覆盖提供了的字段, lastUpdate 设为当前时间
    void update(const Update& fields);

    std::string getProjectName() const;
    std::string getProjectType() const;
    std::vector<std::string> getTechnologies() const;
    std::string getCurrentTask() const;
    std::int64_t getLastUpdate() const;

    // 多行文本, 未设置的字段显示为 "(not set)"
    std::string render() const;

private:
    KeyValueStore& store;

    nlohmann::json snapshot() const;
};
