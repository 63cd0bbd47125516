#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/Errors.h"

// 工具参数读取; 缺失或类型错误抛出 TetherError(InvalidParams)
namespace ToolArgs {

inline std::string requireString(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_string()) {
        throw TetherError(ErrorKind::InvalidParams, "Missing required string argument: " + key);
    }
    return args[key].get<std::string>();
}

inline std::string optionalString(const nlohmann::json& args, const std::string& key,
                                  const std::string& fallback = "") {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) return fallback;
    if (!args[key].is_string()) {
        throw TetherError(ErrorKind::InvalidParams, "Argument must be a string: " + key);
    }
    return args[key].get<std::string>();
}

inline bool optionalBool(const nlohmann::json& args, const std::string& key, bool fallback) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) return fallback;
    if (!args[key].is_boolean()) {
        throw TetherError(ErrorKind::InvalidParams, "Argument must be a boolean: " + key);
    }
    return args[key].get<bool>();
}

inline bool requireBool(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_boolean()) {
        throw TetherError(ErrorKind::InvalidParams, "Missing required boolean argument: " + key);
    }
    return args[key].get<bool>();
}

} // namespace ToolArgs
