#include "InteractionTools.h"
#include "ToolArgs.h"
#include "core/Errors.h"
#include "utils/Logger.h"

namespace {
const char* SHOW_INPUT_DIALOG = "ui.showInputDialog";
const char* SHOW_CONTINUE_DIALOG = "ui.showContinueDialog";

DialogKind parseDialogKind(const std::string& type) {
    if (type == "input") return DialogKind::FreeText;
    if (type == "confirm") return DialogKind::YesNo;
    if (type == "info") return DialogKind::InfoOnly;
    throw TetherError(ErrorKind::InvalidParams, "type must be one of input, confirm, info: " + type);
}

std::string levelTitle(const std::string& level) {
    if (level == "error") return "Error";
    if (level == "warning") return "Warning";
    return "Information";
}
}

// ==================== ask_user ====================

AskUserTool::AskUserTool(FallbackDialogResolver& resolver, ToolStats& stats)
    : resolver(resolver), stats(stats) {}

std::string AskUserTool::getDescription() const {
    return "Ask the user for input or confirmation. Opens a dialog where the user can type an "
           "answer, confirm or decline, or acknowledge a message. Image attachments can be allowed.";
}

nlohmann::json AskUserTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"title", {
                {"type", "string"},
                {"description", "Dialog title"}
            }},
            {"message", {
                {"type", "string"},
                {"description", "Message shown to the user"}
            }},
            {"type", {
                {"type", "string"},
                {"enum", {"input", "confirm", "info"}},
                {"description", "input = free text, confirm = yes/no, info = acknowledge only"}
            }},
            {"allowImage", {
                {"type", "boolean"},
                {"description", "Whether the user may attach images"}
            }}
        }},
        {"required", nlohmann::json::array({"message"})}
    };
}

ToolResult AskUserTool::toResult(DialogKind kind, const DialogAnswer& answer) {
    ToolResult result;
    switch (kind) {
        case DialogKind::YesNo:
            result.text = (answer.answered && answer.confirmed) ? "confirmed" : "declined";
            break;
        case DialogKind::InfoOnly:
            result.text = "acknowledged";
            break;
        case DialogKind::FreeText:
            result.text = answer.text;
            result.attachments = answer.attachments;
            break;
    }
    return result;
}

void AskUserTool::execute(const ToolCallPtr& call) {
    const auto& args = call->getArguments();

    DialogRequest request;
    request.bodyText = ToolArgs::requireString(args, "message");
    request.title = ToolArgs::optionalString(args, "title", "User input");
    request.kind = parseDialogKind(ToolArgs::optionalString(args, "type", "input"));
    request.allowAttachment = ToolArgs::optionalBool(args, "allowImage", false);

    stats.askUserCalls++;

    FallbackDialogResolver::PrimaryRequest primary;
    primary.command = SHOW_INPUT_DIALOG;
    primary.payload = {request.title, request.bodyText, dialogKindName(request.kind), request.allowAttachment};
    primary.owner = call->getOwner();

    DialogKind kind = request.kind;
    ToolStats& counters = stats;
    resolver.resolve(primary, request, call->guard([call, kind, &counters](const DialogAnswer& answer) {
        Logger::getInstance().info(std::string("ask_user answered via ") + answerSourceName(answer.source));
        ToolResult result = toResult(kind, answer);
        counters.attachments += result.attachments.size();
        call->reply(result);
    }));
}

// ==================== notify ====================

NotifyTool::NotifyTool(INotificationSink& sink, FallbackDialogResolver& resolver, ToolStats& stats)
    : sink(sink), resolver(resolver), stats(stats) {}

std::string NotifyTool::getDescription() const {
    return "Send a notification message to the user. Does not wait for a reply.";
}

nlohmann::json NotifyTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"message", {
                {"type", "string"},
                {"description", "Notification text"}
            }},
            {"level", {
                {"type", "string"},
                {"enum", {"info", "warning", "error"}},
                {"description", "Notification level"}
            }}
        }},
        {"required", nlohmann::json::array({"message"})}
    };
}

void NotifyTool::execute(const ToolCallPtr& call) {
    const auto& args = call->getArguments();
    std::string message = ToolArgs::requireString(args, "message");
    std::string level = ToolArgs::optionalString(args, "level", "info");
    if (level != "info" && level != "warning" && level != "error") {
        throw TetherError(ErrorKind::InvalidParams, "level must be one of info, warning, error: " + level);
    }

    stats.notifyCalls++;

    try {
        sink.emit(makeShowNotificationMessage(level, message));
    } catch (const TetherError& e) {
        if (e.getKind() != ErrorKind::CollaboratorUnavailable) throw;
        Logger::getInstance().warn(std::string("Notification channel unavailable, showing native notice: ") + e.what());

        DialogRequest notice;
        notice.title = levelTitle(level);
        notice.bodyText = message;
        notice.kind = DialogKind::InfoOnly;
        resolver.showFallback(notice, [](const DialogAnswer&) {});
    }

    call->reply(ToolResult::ok("notification_sent"));
}

// ==================== ask_continue ====================

AskContinueTool::AskContinueTool(FallbackDialogResolver& resolver, ToolStats& stats)
    : resolver(resolver), stats(stats) {}

std::string AskContinueTool::getDescription() const {
    return "Call this when a task is finished to ask the user whether to continue. "
           "Always wait for the answer and follow the RESULT line it returns.";
}

nlohmann::json AskContinueTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"reason", {
                {"type", "string"},
                {"description", "Why the task is considered finished"}
            }}
        }},
        {"required", nlohmann::json::array({"reason"})}
    };
}

DialogAnswer AskContinueTool::runFallbackFlow(IDialogBackend& dialog, const std::string& reason) {
    DialogRequest question;
    question.title = "Continue?";
    question.bodyText = "The agent wants to end the conversation:\n" + reason + "\n\nContinue?";
    question.kind = DialogKind::YesNo;

    DialogAnswer answer = dialog.show(question);
    if (!answer.answered || !answer.confirmed) {
        return answer;
    }

    DialogRequest followUp;
    followUp.title = "New instruction";
    followUp.bodyText = "Enter a new instruction (optional):";
    followUp.kind = DialogKind::FreeText;

    DialogAnswer instruction = dialog.show(followUp);
    answer.text = instruction.answered ? instruction.text : "";
    return answer;
}

void AskContinueTool::execute(const ToolCallPtr& call) {
    std::string reason = ToolArgs::requireString(call->getArguments(), "reason");

    stats.askContinueCalls++;
    Logger::getInstance().info("ask_continue: " + reason);

    FallbackDialogResolver::PrimaryRequest primary;
    primary.command = SHOW_CONTINUE_DIALOG;
    primary.payload = nlohmann::json::array({reason});
    primary.owner = call->getOwner();

    ToolStats& counters = stats;
    resolver.resolve(
        primary,
        [](const nlohmann::json& value) { return ContinueLoop::answerFromUiValue(value); },
        [reason](IDialogBackend& dialog) { return runFallbackFlow(dialog, reason); },
        call->guard([call, &counters](const DialogAnswer& answer) {
            ContinueLoop loop;
            ContinueDecision decision = loop.decide(answer);
            Logger::getInstance().info(std::string("ask_continue -> ") + continueStateName(decision.state));

            ToolResult result = ToolResult::ok(formatContinueText(decision));
            result.attachments = decision.attachments;
            counters.attachments += result.attachments.size();
            call->reply(result);
        }));
}
