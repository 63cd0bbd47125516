#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class DialogKind {
    FreeText,
    YesNo,
    InfoOnly
};

inline const char* dialogKindName(DialogKind kind) {
    switch (kind) {
        case DialogKind::FreeText: return "input";
        case DialogKind::YesNo: return "confirm";
        case DialogKind::InfoOnly: return "info";
    }
    return "input";
}

struct DialogRequest {
    std::string title;
    std::string bodyText;
    DialogKind kind = DialogKind::FreeText;
    bool allowAttachment = false;
};

struct Attachment {
    std::string mimeType;
    std::string data;  // base64
};

enum class AnswerSource {
    Primary,
    Fallback,
    Default
};

inline const char* answerSourceName(AnswerSource source) {
    switch (source) {
        case AnswerSource::Primary: return "primary";
        case AnswerSource::Fallback: return "fallback";
        case AnswerSource::Default: return "default";
    }
    return "default";
}

/**
 * @brief 对话框结果
 *
 * answered=false 表示用户取消 / 关闭, 或走了保守默认值。
 */
struct DialogAnswer {
    bool answered = false;
    bool confirmed = false;
    std::string text;
    std::vector<Attachment> attachments;
    AnswerSource source = AnswerSource::Default;

    static DialogAnswer conservativeDefault() { return DialogAnswer{}; }
};

/**
 * @brief 从 UI 宿主回传的原始值解析附件
 *
 * 接受 [{"mimeType": "...", "data": "..."}] 或 data URL 字符串数组。
 */
std::vector<Attachment> parseAttachments(const nlohmann::json& images);

// 把 UI 宿主回传的原始值映射为 DialogAnswer
DialogAnswer answerFromUiValue(DialogKind kind, const nlohmann::json& value);
