#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <signal.h>

#include "agent/ClaudeCliBackend.h"
#include "core/ConfigManager.h"
#include "mcp/Dispatcher.h"
#include "mcp/HealthServer.h"
#include "mcp/Transport.h"
#include "mcp/WorkspaceResources.h"
#include "retry/ExecutionPipeline.h"
#include "retry/RetryStatistics.h"
#include "tools/AgentTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI (stderr only, stdout carries the protocol)
const std::string RESET = "\033[0m";
const std::string RED = "\033[31m";

namespace {
constexpr int kExitOk = 0;
constexpr int kExitStartupError = 2;

Transport* g_transport = nullptr;

void handleShutdownSignal(int) {
    if (g_transport) {
        g_transport->stop();
    }
}

void installSignalHandlers() {
    std::signal(SIGPIPE, SIG_IGN);

    // No SA_RESTART: a blocked stdin read returns so the stdio loop can end
    struct sigaction sa {};
    sa.sa_handler = handleShutdownSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int fail(const std::string& message) {
    Logger::getInstance().error(message);
    std::cerr << RED << "✖ " << message << RESET << std::endl;
    return kExitStartupError;
}
} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    Config cfg;
    try {
        cfg = Config::resolve(args);
        if (cfg.showHelp) {
            std::cout << Config::usage();
            return kExitOk;
        }
        if (cfg.showVersion) {
            std::cout << cfg.server.name << " " << cfg.server.version << std::endl;
            return kExitOk;
        }
        cfg.validate();
    } catch (const ConfigError& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        std::cerr << Config::usage();
        return kExitStartupError;
    }

    Logger& logger = Logger::getInstance();
    logger.setLogFile(cfg.logging.logFile);
    logger.setDebugEnabled(cfg.logging.debug);

    std::string workingDirectory = cfg.server.workingDirectory;
    std::error_code ec;
    if (workingDirectory.empty()) {
        workingDirectory = fs::current_path(ec).u8string();
    }
    if (!fs::is_directory(fs::u8path(workingDirectory), ec)) {
        return fail("Working directory does not exist: " + workingDirectory);
    }

    logger.info("Starting " + cfg.server.name + " MCP server " + cfg.server.version +
                " (mode=" + cfg.server.mode + ", dir=" + workingDirectory + ")");
    logger.debug("Effective config: " + cfg.toJson().dump());

    ClaudeCliBackend backend(cfg.backend.command, cfg.backend.model);

    ToolRegistry registry;
    try {
        registerAgentTools(registry, backend, workingDirectory);
        registry.freeze();
    } catch (const DuplicateToolError& e) {
        return fail(e.what());
    }
    logger.info("Registered " + std::to_string(registry.getToolCount()) + " tools");

    RetryStatistics statistics;
    RetryPolicy policy = cfg.toRetryPolicy();
    std::unique_ptr<ExecutionPipeline> pipeline;
    if (cfg.retry.enabled) {
        pipeline = std::make_unique<ExecutionPipeline>(policy, statistics);
        logger.info("Retry enabled: " + policy.toJson().dump());
    } else {
        logger.info("Retry disabled");
    }

    WorkspaceResources resources(workingDirectory);
    resources.registerDefaults([&]() {
        return nlohmann::json{
            {"backend", backend.name()},
            {"retry_enabled", cfg.retry.enabled},
            {"retry_policy", policy.toJson()},
            {"retry_statistics", statistics.summary()}
        };
    });

    ServerInfo info;
    info.name = cfg.server.name;
    info.version = cfg.server.version;
    Dispatcher dispatcher(registry, resources, pipeline.get(), info);

    Transport transport(dispatcher);
    g_transport = &transport;
    installSignalHandlers();

    HealthServer health(cfg.server.mode, [&]() {
        return nlohmann::json{
            {"tools", registry.getToolCount()},
            {"retry", statistics.summary()}
        };
    });
    if (cfg.server.healthPort > 0) {
        try {
            health.start(cfg.server.healthPort);
        } catch (const std::runtime_error& e) {
            return fail(e.what());
        }
    }

    int exitCode = kExitOk;
    if (cfg.server.mode == "tcp") {
        try {
            exitCode = transport.runTcp(cfg.server.port);
        } catch (const std::runtime_error& e) {
            exitCode = fail(e.what());
        }
    } else {
        exitCode = transport.runStdio();
    }

    g_transport = nullptr;
    health.stop();
    statistics.logSummary();
    logger.info("Server exiting with code " + std::to_string(exitCode));
    return exitCode;
}
