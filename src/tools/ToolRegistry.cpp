#include "ToolRegistry.h"
#include "core/Errors.h"
#include "utils/Logger.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) {
        throw TetherError(ErrorKind::ConfigError, "Cannot register a null tool");
    }
    if (sealed) {
        throw TetherError(ErrorKind::ConfigError, "Tool registry is sealed: " + tool->getName());
    }

    std::string name = tool->getName();
    if (tools.count(name)) {
        throw TetherError(ErrorKind::ConfigError, "Duplicate tool name: " + name);
    }

    Logger::getInstance().debug("Registered tool: " + name);
    order.push_back(name);
    tools[name] = std::move(tool);
}

ITool* ToolRegistry::getTool(const std::string& name) const {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<nlohmann::json> ToolRegistry::listToolSchemas() const {
    std::vector<nlohmann::json> schemas;

    for (const auto& name : order) {
        const auto& tool = tools.at(name);
        nlohmann::json schema;
        schema["name"] = tool->getName();
        schema["description"] = tool->getDescription();
        schema["inputSchema"] = tool->getSchema();
        schemas.push_back(schema);
    }

    return schemas;
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
