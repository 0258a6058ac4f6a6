#include "core/ConfigManager.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace {
const char* kDefaultConfigFile = "vibeteam.json";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

int parseInt(const std::string& what, const std::string& text) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + what + ": '" + text + "'");
    }
}

double parseDouble(const std::string& what, const std::string& text) {
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("Invalid number for " + what + ": '" + text + "'");
    }
}

bool isFalsy(const std::string& value) {
    std::string v = lower(value);
    return v.empty() || v == "0" || v == "false" || v == "off" || v == "no";
}
} // namespace

Config Config::load(const std::string& pathStr) {
    std::filesystem::path path = std::filesystem::u8path(pathStr);
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("Could not open config file: " + pathStr);
    }

    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    f.close();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("JSON Parse Error in " + path.string() + ": " + e.what());
    }

    Config cfg;
    cfg.applyJson(j);
    return cfg;
}

void Config::applyJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    try {
        if (j.contains("server")) {
            const auto& s = j.at("server");
            server.mode = s.value("mode", server.mode);
            server.port = s.value("port", server.port);
            server.workingDirectory = s.value("working_directory", server.workingDirectory);
            server.healthPort = s.value("health_port", server.healthPort);
            server.name = s.value("name", server.name);
            server.version = s.value("version", server.version);
        }

        if (j.contains("retry")) {
            const auto& r = j.at("retry");
            retry.enabled = r.value("enabled", retry.enabled);
            retry.maxAttempts = r.value("max_attempts", retry.maxAttempts);
            retry.baseDelay = r.value("base_delay", retry.baseDelay);
            retry.maxDelay = r.value("max_delay", retry.maxDelay);
            retry.exponentialBase = r.value("exponential_base", retry.exponentialBase);
            if (r.contains("jitter")) {
                // "jitter": true/false toggles the default fraction
                if (r["jitter"].is_boolean()) {
                    retry.jitter = r["jitter"].get<bool>() ? 0.1 : 0.0;
                } else {
                    retry.jitter = r["jitter"].get<double>();
                }
            }
        }

        if (j.contains("backend")) {
            const auto& b = j.at("backend");
            backend.command = b.value("command", backend.command);
            backend.model = b.value("model", backend.model);
        }

        if (j.contains("logging")) {
            const auto& l = j.at("logging");
            logging.debug = l.value("debug", logging.debug);
            logging.logFile = l.value("log_file", logging.logFile);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }
}

void Config::applyEnvironment(const std::function<const char*(const char*)>& getenvFn) {
    auto lookup = [&](const char* name) -> const char* {
        return getenvFn ? getenvFn(name) : std::getenv(name);
    };

    if (const char* v = lookup("MCP_MODE")) server.mode = v;
    if (const char* v = lookup("MCP_PORT")) server.port = parseInt("MCP_PORT", v);
    if (const char* v = lookup("MCP_HEALTH_PORT")) server.healthPort = parseInt("MCP_HEALTH_PORT", v);
    if (const char* v = lookup("VIBETEAM_WORKING_DIR")) server.workingDirectory = v;
    if (const char* v = lookup("MCP_DEBUG")) logging.debug = !isFalsy(v);
    if (const char* v = lookup("VIBETEAM_RETRY")) retry.enabled = !isFalsy(v);
    if (const char* v = lookup("VIBETEAM_MAX_ATTEMPTS")) retry.maxAttempts = parseInt("VIBETEAM_MAX_ATTEMPTS", v);
    if (const char* v = lookup("VIBETEAM_BASE_DELAY")) retry.baseDelay = parseDouble("VIBETEAM_BASE_DELAY", v);
    if (const char* v = lookup("VIBETEAM_MAX_DELAY")) retry.maxDelay = parseDouble("VIBETEAM_MAX_DELAY", v);
}

void Config::applyArguments(const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw ConfigError("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "--mode") server.mode = next();
        else if (arg == "--port") server.port = parseInt(arg, next());
        else if (arg == "--dir") server.workingDirectory = next();
        else if (arg == "--config") next();
        else if (arg == "--retry") retry.enabled = true;
        else if (arg == "--no-retry") retry.enabled = false;
        else if (arg == "--max-attempts") retry.maxAttempts = parseInt(arg, next());
        else if (arg == "--base-delay") retry.baseDelay = parseDouble(arg, next());
        else if (arg == "--max-delay") retry.maxDelay = parseDouble(arg, next());
        else if (arg == "--health-port") server.healthPort = parseInt(arg, next());
        else if (arg == "--debug") logging.debug = true;
        else if (arg == "--help" || arg == "-h") showHelp = true;
        else if (arg == "--version") showVersion = true;
        else throw ConfigError("Unknown argument: " + arg);
    }
}

void Config::validate() const {
    if (server.mode != "stdio" && server.mode != "tcp") {
        throw ConfigError("Invalid mode '" + server.mode + "' (expected stdio or tcp)");
    }
    if (server.port < 0 || server.port > 65535) {
        throw ConfigError("Port out of range: " + std::to_string(server.port));
    }
    if (server.healthPort < 0 || server.healthPort > 65535) {
        throw ConfigError("Health port out of range: " + std::to_string(server.healthPort));
    }
    if (backend.command.empty()) {
        throw ConfigError("Backend command must not be empty");
    }
    try {
        toRetryPolicy().validate();
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("Invalid retry policy: ") + e.what());
    }
}

RetryPolicy Config::toRetryPolicy() const {
    RetryPolicy policy;
    policy.maxAttempts = retry.maxAttempts;
    policy.baseDelay = retry.baseDelay;
    policy.maxDelay = retry.maxDelay;
    policy.exponentialBase = retry.exponentialBase;
    policy.jitterFraction = retry.jitter;
    return policy;
}

nlohmann::json Config::toJson() const {
    return {
        {"server", {
            {"mode", server.mode},
            {"port", server.port},
            {"working_directory", server.workingDirectory},
            {"health_port", server.healthPort},
            {"name", server.name},
            {"version", server.version}
        }},
        {"retry", {
            {"enabled", retry.enabled},
            {"max_attempts", retry.maxAttempts},
            {"base_delay", retry.baseDelay},
            {"max_delay", retry.maxDelay},
            {"exponential_base", retry.exponentialBase},
            {"jitter", retry.jitter}
        }},
        {"backend", {{"command", backend.command}, {"model", backend.model}}},
        {"logging", {{"debug", logging.debug}, {"log_file", logging.logFile}}}
    };
}

std::string Config::findConfigPath(const std::vector<std::string>& args) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "--config") return args[i + 1];
    }
    return "";
}

Config Config::resolve(const std::vector<std::string>& args) {
    std::string path = findConfigPath(args);
    Config cfg;
    if (!path.empty()) {
        cfg = load(path);
    } else if (std::filesystem::exists(kDefaultConfigFile)) {
        cfg = load(kDefaultConfigFile);
    }
    cfg.applyEnvironment();
    cfg.applyArguments(args);
    return cfg;
}

std::string Config::usage() {
    return
        "Usage: vibeteam-mcp [options]\n"
        "\n"
        "Options:\n"
        "  --mode stdio|tcp       Transport (default: stdio, env MCP_MODE)\n"
        "  --port N               TCP port (default: 8080, env MCP_PORT)\n"
        "  --dir PATH             Working directory (env VIBETEAM_WORKING_DIR)\n"
        "  --config PATH          JSON config file (default: ./vibeteam.json if present)\n"
        "  --retry / --no-retry   Enable or disable automatic retries\n"
        "  --max-attempts N       Attempts per tool call (default: 3)\n"
        "  --base-delay SECONDS   First backoff delay (default: 60)\n"
        "  --max-delay SECONDS    Backoff ceiling (default: 3600)\n"
        "  --health-port N        Serve GET /health on this port (0 disables)\n"
        "  --debug                Verbose logging to stderr (env MCP_DEBUG)\n"
        "  --help                 Show this help\n"
        "  --version              Show version\n";
}
