#pragma once
#include <string>
#include <memory>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief 工具注册中心
 *
 * 启动时注册全部工具, 名称必须唯一; seal() 之后不再接受注册,
 * 运行期只做查找。
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief 注册一个工具
     * @param tool 工具实例 (unique_ptr 转移所有权)
     * @throws TetherError(ConfigError) 名称重复、空指针或已 seal
     */
    void registerTool(std::unique_ptr<ITool> tool);

    void seal() { sealed = true; }
    bool isSealed() const { return sealed; }

    /**
     * @brief 获取工具实例
     * @return 工具指针 (如果不存在返回 nullptr)
     */
    ITool* getTool(const std::string& name) const;

    /**
     * @brief 列出所有工具的 Schema
     *
     * 格式 (MCP tools/list):
     * [
     *   {"name": "tool_name", "description": "...", "inputSchema": { JSON Schema }}
     * ]
     * 按注册顺序排列。
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::map<std::string, std::unique_ptr<ITool>> tools;
    std::vector<std::string> order;
    bool sealed = false;
};
