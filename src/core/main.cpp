#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#ifdef _WIN32
    #include <fcntl.h>
    #include <io.h>
#endif
#include "broker/CorrelationBroker.h"
#include "broker/FallbackDialogResolver.h"
#include "core/ConfigManager.h"
#include "core/Errors.h"
#include "core/EventLoop.h"
#include "dialog/DialogBackend.h"
#include "mcp/NotificationChannel.h"
#include "mcp/ResolveChannel.h"
#include "mcp/RpcDispatcher.h"
#include "memory/CommandHistory.h"
#include "memory/ContextSummary.h"
#include "memory/KeyValueStore.h"
#include "tools/InteractionTools.h"
#include "tools/SessionTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"
#include "utils/Platform.h"
#include "utils/ProcessRunner.h"
#ifdef TETHER_WITH_HTTP_BRIDGE
#include "mcp/HttpBridge.h"
#endif

namespace {

volatile std::sig_atomic_t g_signalled = 0;

void onSignal(int) {
    g_signalled = 1;
}

constexpr std::chrono::milliseconds SIGNAL_POLL_INTERVAL{100};

struct CliOptions {
    std::string configPath;
    std::string httpPort;
    std::string timeoutMs;
    bool debug = false;
    bool help = false;
};

void printUsage() {
    std::cerr << "Usage: tether [config.json] [--http-port N] [--timeout-ms N] [--debug] [--help]\n"
              << "\n"
              << "MCP server on stdin/stdout that asks a human for input through a UI host,\n"
              << "falling back to native dialogs when the host does not answer.\n"
              << "\n"
              << "  --http-port N    enable the HTTP resolve bridge on port N\n"
              << "  --timeout-ms N   UI host answer deadline (default 30000)\n"
              << "  --debug          debug logging\n";
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto requireValue = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw TetherError(ErrorKind::ConfigError, flag + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--http-port") {
            options.httpPort = requireValue(arg);
        } else if (arg == "--timeout-ms") {
            options.timeoutMs = requireValue(arg);
        } else if (!arg.empty() && arg[0] == '-') {
            throw TetherError(ErrorKind::ConfigError, "Unknown option: " + arg);
        } else if (options.configPath.empty()) {
            options.configPath = arg;
        } else {
            throw TetherError(ErrorKind::ConfigError, "Unexpected argument: " + arg);
        }
    }
    return options;
}

Config buildConfig(const CliOptions& options) {
    Config cfg = options.configPath.empty() ? Config::defaults() : Config::load(options.configPath);
    cfg.applyEnvironment();
    if (!options.timeoutMs.empty()) cfg.setTimeout(options.timeoutMs);
    if (!options.httpPort.empty()) cfg.setHttpPort(options.httpPort);
    if (options.debug) {
        cfg.logging.debug = true;
        cfg.logging.console = true;
    }
    cfg.validate();
    return cfg;
}

/**
 * @brief stdin 读线程
 *
 * getline 无法中断, 线程分离运行; 关闭后 detach() 保证不再向循环投递。
 */
class StdinReader {
public:
    StdinReader(EventLoop& loop, RpcDispatcher& dispatcher, std::function<void()> onEof)
        : state(std::make_shared<State>()) {
        state->loop = &loop;
        state->dispatcher = &dispatcher;
        state->onEof = std::move(onEof);
    }

    void start() {
        std::shared_ptr<State> shared = state;
        std::thread([shared]() {
            std::string line;
            while (std::getline(std::cin, line)) {
                std::lock_guard<std::mutex> lock(shared->mtx);
                if (!shared->loop) return;
                RpcDispatcher* dispatcher = shared->dispatcher;
                shared->loop->post([dispatcher, line]() { dispatcher->handleLine(line); });
            }
            std::lock_guard<std::mutex> lock(shared->mtx);
            if (shared->loop) shared->loop->post(shared->onEof);
        }).detach();
    }

    void detach() {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->loop = nullptr;
        state->dispatcher = nullptr;
    }

private:
    struct State {
        std::mutex mtx;
        EventLoop* loop = nullptr;
        RpcDispatcher* dispatcher = nullptr;
        std::function<void()> onEof;
    };
    std::shared_ptr<State> state;
};

void configureLogging(const Config& cfg) {
    Logger& logger = Logger::getInstance();
    logger.setLogFile(cfg.logging.file);
    logger.setDebugEnabled(cfg.logging.debug);
    logger.setConsoleEnabled(cfg.consoleLoggingAllowed());
}

std::shared_ptr<IDialogBackend> createDialogBackend(const Config& cfg) {
    std::shared_ptr<IDialogBackend> backend =
        makeDialogBackend(cfg.dialog.backend, currentPlatform(), std::make_shared<ProcessRunner>());
    if (!ProcessRunner::commandExists(backend->getName())) {
        Logger::getInstance().warn("Dialog program not found in PATH: " + backend->getName());
    }
    return backend;
}

void watchSignals(EventLoop& loop, const std::function<void()>& shutdown) {
    loop.schedule(SIGNAL_POLL_INTERVAL, [&loop, shutdown]() {
        if (g_signalled) {
            Logger::getInstance().info("Signal received");
            shutdown();
            return;
        }
        watchSignals(loop, shutdown);
    });
}

} // namespace

int main(int argc, char* argv[]) {
#ifdef _WIN32
    // stdout 是 RPC 流, 禁止 CRLF 转换
    _setmode(_fileno(stdout), _O_BINARY);
    _setmode(_fileno(stdin), _O_BINARY);
#else
    // 通知通道的读端消失时 write() 返回 EPIPE, 而不是终止进程
    std::signal(SIGPIPE, SIG_IGN);
#endif
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    std::ios::sync_with_stdio(false);

    Config cfg;
    try {
        CliOptions options = parseArgs(argc, argv);
        if (options.help) {
            printUsage();
            return 0;
        }
        cfg = buildConfig(options);
    } catch (const TetherError& e) {
        std::cerr << "tether: " << e.what() << "\n";
        printUsage();
        return 2;
    }

    configureLogging(cfg);
    Logger& logger = Logger::getInstance();
    logger.info("Starting " + cfg.server.name + " " + cfg.server.version + " on " + platformName(currentPlatform()));

    try {
        EventLoop loop;
        std::unique_ptr<INotificationSink> sink = makeNotificationSink(cfg.channel.notify);
        CorrelationBroker broker(loop, *sink, std::chrono::milliseconds(cfg.broker.timeoutMs));

        FallbackDialogResolver resolver(loop, broker, createDialogBackend(cfg));
        resolver.setFallbackEnabled(cfg.dialog.enabled);

        JsonFileStore store(cfg.history.path);
        CommandHistory history(store, cfg.history.maxEntries);
        ContextSummary summary(store);

        ToolStats stats;
        ToolRegistry registry;
        registry.registerTool(std::make_unique<AskContinueTool>(resolver, stats));
        registry.registerTool(std::make_unique<AskUserTool>(resolver, stats));
        registry.registerTool(std::make_unique<NotifyTool>(*sink, resolver, stats));
        registry.registerTool(std::make_unique<OptimizeCommandTool>());
        registry.registerTool(std::make_unique<SaveCommandHistoryTool>(history));
        registry.registerTool(std::make_unique<GetCommandHistoryTool>(history));
        registry.registerTool(std::make_unique<UpdateContextSummaryTool>(summary));
        registry.registerTool(std::make_unique<GetContextSummaryTool>(summary));
        registry.seal();

        ResponseWriter writer(std::cout);
        RpcDispatcher dispatcher(registry, broker, writer, stats,
                                 RpcDispatcher::ServerInfo{cfg.server.name, cfg.server.version});

        std::unique_ptr<ResolveChannel> resolveChannel;
        if (cfg.channel.resolve != "none") {
            resolveChannel = std::make_unique<ResolveChannel>(loop, broker, cfg.channel.resolve);
            resolveChannel->start();
        }

#ifdef TETHER_WITH_HTTP_BRIDGE
        std::unique_ptr<HttpBridge> httpBridge;
        if (cfg.http.enabled) {
            httpBridge = std::make_unique<HttpBridge>(broker, stats, cfg.http.host, cfg.http.port);
            httpBridge->start();
        }
#else
        if (cfg.http.enabled) {
            logger.warn("HTTP bridge requested but this build has no HTTP support");
        }
#endif

        bool shuttingDown = false;
        auto shutdown = [&]() {
            if (shuttingDown) return;
            shuttingDown = true;
            size_t flushed = broker.flushAll("Server shutting down");
            logger.info("Shutting down, cancelled " + std::to_string(flushed) + " pending requests");
            loop.post([&loop]() { loop.stop(); });
        };

        StdinReader reader(loop, dispatcher, [&logger, shutdown]() {
            logger.info("stdin closed");
            shutdown();
        });
        reader.start();
        watchSignals(loop, shutdown);

        logger.success("Ready: " + std::to_string(registry.getToolCount()) + " tools, notify via " + sink->describe() +
                       ", dialog fallback " + (resolver.isFallbackEnabled() ? resolver.backendName() : "disabled"));
        loop.run();

        reader.detach();
        if (resolveChannel) resolveChannel->stop();
#ifdef TETHER_WITH_HTTP_BRIDGE
        if (httpBridge) httpBridge->stop();
#endif
        // 已结算请求的最后一批应答
        loop.runUntilIdle();
        logger.info("Stopped");
    } catch (const TetherError& e) {
        logger.error(std::string(errorKindName(e.getKind())) + ": " + e.what());
        std::cerr << "tether: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal: ") + e.what());
        std::cerr << "tether: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
