#include "dialog/DialogTypes.h"
#include <algorithm>
#include <cctype>

namespace {
std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool isAffirmative(const std::string& text) {
    std::string lower = toLower(text);
    return lower == "true" || lower == "yes" || lower == "y" || lower == "ok" || lower == "confirmed";
}

// data:image/png;base64,AAAA
bool splitDataUrl(const std::string& url, Attachment& out) {
    if (url.rfind("data:", 0) != 0) return false;
    auto semi = url.find(';');
    auto comma = url.find(',');
    if (semi == std::string::npos || comma == std::string::npos || semi > comma) return false;
    out.mimeType = url.substr(5, semi - 5);
    out.data = url.substr(comma + 1);
    return true;
}
} // namespace

std::vector<Attachment> parseAttachments(const nlohmann::json& images) {
    std::vector<Attachment> result;
    if (!images.is_array()) return result;
    for (const auto& item : images) {
        Attachment att;
        if (item.is_string()) {
            if (splitDataUrl(item.get<std::string>(), att)) result.push_back(std::move(att));
        } else if (item.is_object() && item.contains("data") && item["data"].is_string()) {
            att.mimeType = item.value("mimeType", "image/png");
            att.data = item["data"].get<std::string>();
            if (!att.data.empty()) result.push_back(std::move(att));
        }
    }
    return result;
}

DialogAnswer answerFromUiValue(DialogKind kind, const nlohmann::json& value) {
    DialogAnswer answer;
    answer.source = AnswerSource::Primary;

    if (value.is_null()) return answer;

    switch (kind) {
        case DialogKind::YesNo:
            answer.answered = true;
            if (value.is_boolean()) {
                answer.confirmed = value.get<bool>();
            } else if (value.is_string()) {
                answer.confirmed = isAffirmative(value.get<std::string>());
            } else if (value.is_object()) {
                answer.confirmed = value.value("confirmed", value.value("value", false));
            }
            break;
        case DialogKind::InfoOnly:
            answer.answered = true;
            answer.confirmed = true;
            break;
        case DialogKind::FreeText:
            if (value.is_string()) {
                answer.text = value.get<std::string>();
            } else if (value.is_object()) {
                answer.text = value.value("text", "");
                if (value.contains("images")) {
                    answer.attachments = parseAttachments(value["images"]);
                }
            } else {
                answer.text = value.dump();
            }
            answer.answered = !answer.text.empty() || !answer.attachments.empty();
            break;
    }
    return answer;
}
