#pragma once
#include <string>
#include <vector>
#include <functional>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "retry/RetryPolicy.h"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct Config {
    struct Server {
        std::string mode = "stdio";   // "stdio" | "tcp"
        int port = 8080;
        std::string workingDirectory; // empty: process cwd
        int healthPort = 0;           // 0 disables the health endpoint
        std::string name = "vibeteam";
        std::string version = "1.0.0";
    } server;

    struct Retry {
        bool enabled = true;
        int maxAttempts = 3;
        double baseDelay = 60.0;
        double maxDelay = 3600.0;
        double exponentialBase = 2.0;
        double jitter = 0.1;
    } retry;

    struct Backend {
        std::string command = "claude";
        std::string model;
    } backend;

    struct Logging {
        bool debug = false;
        std::string logFile = "vibeteam-mcp.log";
    } logging;

    // Set by applyArguments(); main() acts on them before serving
    bool showHelp = false;
    bool showVersion = false;

    /**
     * @brief Read a JSON config file. Missing keys keep their defaults.
     * @throws ConfigError if the file cannot be read or parsed
     */
    static Config load(const std::string& path);

    /**
     * @brief Overlay a parsed JSON document onto this config.
     */
    void applyJson(const nlohmann::json& j);

    /**
     * @brief Overlay MCP_* / VIBETEAM_* environment variables.
     * @param getenvFn injectable lookup (tests); defaults to std::getenv
     */
    void applyEnvironment(const std::function<const char*(const char*)>& getenvFn = nullptr);

    /**
     * @brief Overlay command-line flags (--config is skipped here).
     * @throws ConfigError on unknown flags, missing or malformed values
     */
    void applyArguments(const std::vector<std::string>& args);

    /**
     * @throws ConfigError
     */
    void validate() const;

    RetryPolicy toRetryPolicy() const;

    nlohmann::json toJson() const;

    /**
     * @brief Full resolution: defaults, then the config file (--config, or
     * vibeteam.json in the cwd), environment and flags.
     */
    static Config resolve(const std::vector<std::string>& args);

    static std::string usage();

    /**
     * @brief Extract the value of --config from args, empty when absent.
     */
    static std::string findConfigPath(const std::vector<std::string>& args);
};
