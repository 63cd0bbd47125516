#include "agent/ContinueDecision.h"

namespace {
std::string trim(const std::string& s) {
    auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    size_t start = 0;
    while (start < s.size() && isSpace(s[start])) start++;
    size_t end = s.size();
    while (end > start && isSpace(s[end - 1])) end--;
    return s.substr(start, end - start);
}
} // namespace

const char* continueStateName(ContinueState state) {
    switch (state) {
        case ContinueState::AwaitingDecision: return "AWAITING_DECISION";
        case ContinueState::ContinueWithInstruction: return "CONTINUE_WITH_INSTRUCTION";
        case ContinueState::ContinueIdle: return "CONTINUE_IDLE";
        case ContinueState::End: return "END";
    }
    return "UNKNOWN";
}

ContinueDecision ContinueDecision::end() {
    ContinueDecision d;
    d.state = ContinueState::End;
    d.shouldContinue = false;
    return d;
}

ContinueDecision ContinueDecision::idle() {
    ContinueDecision d;
    d.state = ContinueState::ContinueIdle;
    d.shouldContinue = true;
    return d;
}

ContinueDecision ContinueDecision::withInstruction(const std::string& instruction) {
    ContinueDecision d;
    d.state = ContinueState::ContinueWithInstruction;
    d.shouldContinue = true;
    d.carriedInstruction = instruction;
    return d;
}

DialogAnswer ContinueLoop::answerFromUiValue(const nlohmann::json& uiValue) {
    DialogAnswer answer;
    answer.source = AnswerSource::Primary;
    if (!uiValue.is_object()) return answer;

    const auto flag = uiValue.find("continue");
    answer.answered = true;
    answer.confirmed = flag != uiValue.end() && flag->is_boolean() && flag->get<bool>();

    for (const char* key : {"instruction", "newInstruction"}) {
        auto it = uiValue.find(key);
        if (it != uiValue.end() && it->is_string() && !it->get<std::string>().empty()) {
            answer.text = it->get<std::string>();
            break;
        }
    }
    if (uiValue.contains("images")) {
        answer.attachments = parseAttachments(uiValue["images"]);
    }
    return answer;
}

ContinueDecision ContinueLoop::transition(bool accepted, const std::string& instruction,
                                          std::vector<Attachment> attachments) {
    ContinueDecision decision;
    if (!accepted) {
        decision = ContinueDecision::end();
    } else {
        std::string trimmed = trim(instruction);
        decision = trimmed.empty() ? ContinueDecision::idle() : ContinueDecision::withInstruction(trimmed);
        decision.attachments = std::move(attachments);
    }
    state = decision.state;
    return decision;
}

ContinueDecision ContinueLoop::decide(const nlohmann::json& uiValue) {
    return decide(answerFromUiValue(uiValue));
}

ContinueDecision ContinueLoop::decide(const DialogAnswer& answer) {
    bool accepted = answer.answered && answer.confirmed;
    return transition(accepted, answer.text, answer.attachments);
}

std::string formatContinueText(const ContinueDecision& decision) {
    std::string text = ContinueProtocol::MARKER;
    text += decision.shouldContinue ? "true" : "false";
    text += "\n\n";

    if (!decision.shouldContinue) {
        text += "The user chose to end the session. Stop here and do not start new work.";
        return text;
    }

    if (decision.carriedInstruction && !decision.carriedInstruction->empty()) {
        text += ContinueProtocol::INSTRUCTION_BEGIN;
        text += "\n";
        text += *decision.carriedInstruction;
        text += "\n";
        text += ContinueProtocol::INSTRUCTION_END;
        text += "\n\n";
        text += "Carry out the user's new instruction now, then call ";
        text += ContinueProtocol::TOOL_NAME;
        text += " again when it is done.";
    } else {
        text += "The user chose to continue. Wait for the next instruction or ask what is needed, "
                "and call ";
        text += ContinueProtocol::TOOL_NAME;
        text += " again when finished.";
    }
    return text;
}

std::optional<ContinueDecision> parseContinueText(const std::string& text) {
    std::string marker = ContinueProtocol::MARKER;
    auto pos = text.find(marker);
    if (pos == std::string::npos) return std::nullopt;

    auto valueStart = pos + marker.size();
    auto valueEnd = text.find('\n', valueStart);
    std::string flag = trim(text.substr(valueStart, valueEnd == std::string::npos ? std::string::npos
                                                                                  : valueEnd - valueStart));
    if (flag == "false") return ContinueDecision::end();
    if (flag != "true") return std::nullopt;

    std::string begin = std::string(ContinueProtocol::INSTRUCTION_BEGIN) + "\n";
    std::string end = std::string("\n") + ContinueProtocol::INSTRUCTION_END;
    auto blockStart = text.find(begin, valueStart);
    if (blockStart != std::string::npos) {
        auto contentStart = blockStart + begin.size();
        // rfind: the instruction itself may contain the end marker text
        auto blockEnd = text.rfind(end);
        if (blockEnd != std::string::npos && blockEnd >= contentStart) {
            return ContinueDecision::withInstruction(text.substr(contentStart, blockEnd - contentStart));
        }
        return std::nullopt;
    }
    return ContinueDecision::idle();
}
