#include "SessionTools.h"
#include <cctype>
#include "ToolArgs.h"
#include "core/Errors.h"
#include "utils/Platform.h"

// ==================== optimize_command ====================

std::string OptimizeCommandTool::getDescription() const {
    return "Normalise a user instruction into a cleaner, more precise form.";
}

nlohmann::json OptimizeCommandTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"command", {
                {"type", "string"},
                {"description", "Original instruction"}
            }},
            {"context", {
                {"type", "string"},
                {"description", "Current context"}
            }},
            {"level", {
                {"type", "string"},
                {"enum", {"low", "medium", "high"}},
                {"description", "Optimisation level"}
            }}
        }},
        {"required", nlohmann::json::array({"command"})}
    };
}

std::string OptimizeCommandTool::optimize(const std::string& command, const std::string& level) {
    std::string out;
    out.reserve(command.size() + 1);
    bool pendingSpace = false;
    for (unsigned char c : command) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) out += ' ';
        pendingSpace = false;
        out += static_cast<char>(c);
    }

    if (out.empty()) return out;

    char last = out.back();
    if (last != '.' && last != '?' && last != '!') {
        out += '.';
    }
    if (level == "high") {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

ToolResult OptimizeCommandTool::run(const nlohmann::json& args) {
    std::string command = ToolArgs::requireString(args, "command");
    std::string context = ToolArgs::optionalString(args, "context");
    std::string level = ToolArgs::optionalString(args, "level", "medium");
    if (level != "low" && level != "medium" && level != "high") {
        throw TetherError(ErrorKind::InvalidParams, "level must be one of low, medium, high: " + level);
    }

    return ToolResult::ok("Optimized command: " + optimize(command, level) +
                          "\nLevel: " + level +
                          "\nContext: " + context);
}

// ==================== command history ====================

std::string SaveCommandHistoryTool::getDescription() const {
    return "Save an executed instruction to the command history.";
}

nlohmann::json SaveCommandHistoryTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"command", {
                {"type", "string"},
                {"description", "Executed instruction"}
            }},
            {"optimized", {
                {"type", "string"},
                {"description", "Optimised instruction"}
            }},
            {"context", {
                {"type", "string"},
                {"description", "Execution context"}
            }},
            {"success", {
                {"type", "boolean"},
                {"description", "Whether execution succeeded"}
            }}
        }},
        {"required", nlohmann::json::array({"command", "success"})}
    };
}

ToolResult SaveCommandHistoryTool::run(const nlohmann::json& args) {
    CommandEntry entry;
    entry.timestampMs = epochMillis();
    entry.command = ToolArgs::requireString(args, "command");
    entry.success = ToolArgs::requireBool(args, "success");
    entry.optimized = ToolArgs::optionalString(args, "optimized");
    entry.context = ToolArgs::optionalString(args, "context");

    history.append(entry);
    return ToolResult::ok("command_history_saved");
}

std::string GetCommandHistoryTool::getDescription() const {
    return "Get recent entries from the command history.";
}

nlohmann::json GetCommandHistoryTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"limit", {
                {"type", "number"},
                {"description", "Maximum number of entries, default 10"}
            }},
            {"filter", {
                {"type", "string"},
                {"description", "Optional substring filter"}
            }}
        }}
    };
}

ToolResult GetCommandHistoryTool::run(const nlohmann::json& args) {
    size_t limit = DEFAULT_LIMIT;
    if (args.is_object() && args.contains("limit") && !args["limit"].is_null()) {
        if (!args["limit"].is_number() || args["limit"].get<double>() < 1) {
            throw TetherError(ErrorKind::InvalidParams, "limit must be a positive number");
        }
        limit = static_cast<size_t>(args["limit"].get<double>());
    }
    std::string filter = ToolArgs::optionalString(args, "filter");

    return ToolResult::ok(CommandHistory::render(history.recent(limit, filter)));
}

// ==================== context summary ====================

std::string UpdateContextSummaryTool::getDescription() const {
    return "Update the project context summary. Only the supplied fields change.";
}

nlohmann::json UpdateContextSummaryTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"projectName", {
                {"type", "string"},
                {"description", "Project name"}
            }},
            {"projectType", {
                {"type", "string"},
                {"description", "Project type"}
            }},
            {"technologies", {
                {"type", "array"},
                {"items", {{"type", "string"}}},
                {"description", "Main technologies"}
            }},
            {"currentTask", {
                {"type", "string"},
                {"description", "Current task"}
            }}
        }}
    };
}

ToolResult UpdateContextSummaryTool::run(const nlohmann::json& args) {
    ContextSummary::Update fields;
    for (const auto& [key, target] : {std::make_pair("projectName", &fields.projectName),
                                      std::make_pair("projectType", &fields.projectType),
                                      std::make_pair("currentTask", &fields.currentTask)}) {
        std::string value = ToolArgs::optionalString(args, key);
        if (!value.empty()) *target = value;
    }

    if (args.is_object() && args.contains("technologies") && !args["technologies"].is_null()) {
        const auto& list = args["technologies"];
        if (!list.is_array()) {
            throw TetherError(ErrorKind::InvalidParams, "technologies must be an array of strings");
        }
        std::vector<std::string> technologies;
        for (const auto& item : list) {
            if (!item.is_string()) {
                throw TetherError(ErrorKind::InvalidParams, "technologies must be an array of strings");
            }
            technologies.push_back(item.get<std::string>());
        }
        fields.technologies = technologies;
    }

    summary.update(fields);
    return ToolResult::ok("context_summary_updated");
}

nlohmann::json GetContextSummaryTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", nlohmann::json::object()}
    };
}

ToolResult GetContextSummaryTool::run(const nlohmann::json&) {
    return ToolResult::ok(summary.render());
}
