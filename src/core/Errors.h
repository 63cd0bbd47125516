#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief 错误分类
 *
 * ParseError / UnknownMethod 永远不会让主循环崩溃;
 * Timeout / CollaboratorUnavailable 由降级弹窗内部恢复;
 * FallbackExhausted 最终落到保守默认值。
 */
enum class ErrorKind {
    ParseError,
    UnknownMethod,
    UnknownTool,
    InvalidParams,
    HandlerFault,
    Timeout,
    Cancelled,
    CollaboratorUnavailable,
    FallbackExhausted,
    DialogFailure,
    ConfigError
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError: return "ParseError";
        case ErrorKind::UnknownMethod: return "UnknownMethod";
        case ErrorKind::UnknownTool: return "UnknownTool";
        case ErrorKind::InvalidParams: return "InvalidParams";
        case ErrorKind::HandlerFault: return "HandlerFault";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::CollaboratorUnavailable: return "CollaboratorUnavailable";
        case ErrorKind::FallbackExhausted: return "FallbackExhausted";
        case ErrorKind::DialogFailure: return "DialogFailure";
        case ErrorKind::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

class TetherError : public std::runtime_error {
public:
    TetherError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind(kind) {}

    ErrorKind getKind() const { return kind; }

private:
    ErrorKind kind;
};
