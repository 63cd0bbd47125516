#include "broker/FallbackDialogResolver.h"
#include "core/Errors.h"
#include "utils/Logger.h"

const char* resolverStateName(ResolverState state) {
    switch (state) {
        case ResolverState::PrimaryAttempt: return "PRIMARY_ATTEMPT";
        case ResolverState::FallbackAttempt: return "FALLBACK_ATTEMPT";
        case ResolverState::Done: return "DONE";
        case ResolverState::DoneWithDefault: return "DONE_WITH_DEFAULT";
    }
    return "UNKNOWN";
}

FallbackDialogResolver::FallbackDialogResolver(EventLoop& loop, CorrelationBroker& broker,
                                               std::shared_ptr<IDialogBackend> backend)
    : loop(loop), broker(broker), backend(std::move(backend)) {}

void FallbackDialogResolver::enter(ResolverState state) {
    Logger::getInstance().debug(std::string("Resolver -> ") + resolverStateName(state));
    if (observer) observer(state);
}

void FallbackDialogResolver::finishWithDefault(AnswerCallback done) {
    enter(ResolverState::DoneWithDefault);
    done(DialogAnswer::conservativeDefault());
}

void FallbackDialogResolver::resolve(const PrimaryRequest& primary, PrimaryMapper mapPrimary,
                                     FallbackFlow fallbackFlow, AnswerCallback done) {
    enter(ResolverState::PrimaryAttempt);

    auto onSettled = [this, mapPrimary, fallbackFlow, done](const Settlement& settlement) {
        switch (settlement.status) {
            case SettlementStatus::Fulfilled: {
                DialogAnswer answer;
                try {
                    answer = mapPrimary(settlement.value);
                } catch (const std::exception& e) {
                    Logger::getInstance().error(std::string("Unusable answer from UI host: ") + e.what());
                    finishWithDefault(done);
                    return;
                }
                answer.source = AnswerSource::Primary;
                enter(ResolverState::Done);
                done(answer);
                return;
            }
            case SettlementStatus::TimedOut:
                Logger::getInstance().warn("UI host did not answer: " + settlement.message);
                runFallback(fallbackFlow, done);
                return;
            case SettlementStatus::Cancelled:
                Logger::getInstance().info("Request cancelled: " + settlement.message);
                finishWithDefault(done);
                return;
        }
    };

    try {
        broker.request(primary.command, primary.payload, onSettled, primary.owner);
    } catch (const TetherError& e) {
        if (e.getKind() != ErrorKind::CollaboratorUnavailable) throw;
        runFallback(fallbackFlow, done);
    }
}

void FallbackDialogResolver::resolve(const PrimaryRequest& primary, const DialogRequest& request,
                                     AnswerCallback done) {
    DialogKind kind = request.kind;
    resolve(primary,
            [kind](const nlohmann::json& value) { return answerFromUiValue(kind, value); },
            [request](IDialogBackend& dialog) { return dialog.show(request); },
            std::move(done));
}

void FallbackDialogResolver::showFallback(const DialogRequest& request, AnswerCallback done) {
    runFallback([request](IDialogBackend& dialog) { return dialog.show(request); }, std::move(done));
}

void FallbackDialogResolver::runFallback(FallbackFlow flow, AnswerCallback done) {
    if (!isFallbackEnabled()) {
        Logger::getInstance().warn("Native dialog fallback disabled");
        finishWithDefault(done);
        return;
    }

    enter(ResolverState::FallbackAttempt);
    std::shared_ptr<IDialogBackend> dialog = backend;
    loop.runInBackground([this, dialog, flow, done]() {
        DialogAnswer answer;
        bool ok = false;
        try {
            answer = flow(*dialog);
            answer.source = AnswerSource::Fallback;
            ok = true;
        } catch (const std::exception& e) {
            Logger::getInstance().error("Native dialog (" + dialog->getName() + ") failed: " + e.what());
        }

        loop.post([this, ok, answer, done]() {
            if (ok) {
                enter(ResolverState::Done);
                done(answer);
            } else {
                finishWithDefault(done);
            }
        });
    });
}
