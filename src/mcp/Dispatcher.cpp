#include "mcp/Dispatcher.h"
#include "mcp/WorkspaceResources.h"
#include "retry/ExecutionPipeline.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

namespace {
std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

// Outcome of a direct (non-pipelined) call, shaped like a one-attempt run
ExecutionResult runDirect(ITool& tool, const nlohmann::json& args) {
    ExecutionResult r;
    r.attempts = 1;
    nlohmann::json out;
    if (ExecutionPipeline::attemptOnce([&tool, &args]() { return tool.execute(args); }, out, r.error)) {
        r.succeeded = true;
        r.result = std::move(out);
        return r;
    }

    // Reported for the client's benefit; nothing is retried on this path
    static const ErrorClassifier classifier;
    auto c = classifier.classify(r.error);
    r.retryable = c.retryable;
    r.category = c.category;
    r.matchedPattern = c.pattern;
    return r;
}
} // namespace

Dispatcher::Dispatcher(ToolRegistry& registry, WorkspaceResources& resources,
                       ExecutionPipeline* pipeline, ServerInfo info)
    : registry(registry), resources(resources), pipeline(pipeline), info(std::move(info)) {}

nlohmann::json Dispatcher::makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

nlohmann::json Dispatcher::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

std::optional<nlohmann::json> Dispatcher::handle(const nlohmann::json& request) {
    if (!request.is_object()) {
        return makeError(nullptr, JsonRpcError::InvalidRequest, "Invalid Request");
    }

    bool isNotification = !request.contains("id");
    nlohmann::json id = isNotification ? nlohmann::json(nullptr) : request["id"];

    if (!request.contains("method") || !request["method"].is_string()) {
        if (isNotification) return std::nullopt;
        return makeError(id, JsonRpcError::InvalidRequest, "Invalid Request: missing method");
    }

    std::string method = request["method"].get<std::string>();
    nlohmann::json params = request.value("params", nlohmann::json::object());
    if (params.is_null()) params = nlohmann::json::object();

    Logger::getInstance().debug("<- " + method);

    if (method.rfind("notifications/", 0) == 0) {
        return std::nullopt;
    }

    // A request without an id still runs; only its response is dropped
    if (isNotification) {
        auto discarded = dispatch(id, method, params);
        Logger::getInstance().debug("Dropped response to notification " + method +
                                    (discarded.contains("error") ? " (failed)" : ""));
        return std::nullopt;
    }
    return dispatch(id, method, params);
}

nlohmann::json Dispatcher::dispatch(const nlohmann::json& id, const std::string& method,
                                    const nlohmann::json& params) {
    try {
        if (method == "initialize") {
            return makeResult(id, initialize());
        }
        if (method == "ping") {
            return makeResult(id, nlohmann::json::object());
        }
        if (method == "tools/list") {
            return makeResult(id, {{"tools", registry.listTools()}});
        }
        if (method == "tools/call") {
            return callTool(id, params);
        }
        if (method == "resources/list") {
            return makeResult(id, {{"resources", resources.list()}});
        }
        if (method == "resources/read") {
            return readResource(id, params);
        }
    } catch (const std::exception& e) {
        Logger::getInstance().error("Error handling " + method + ": " + e.what());
        return makeError(id, JsonRpcError::InternalError, std::string("Internal error: ") + e.what());
    }

    return makeError(id, JsonRpcError::MethodNotFound, "Method not found: " + method);
}

nlohmann::json Dispatcher::initialize() const {
    return {
        {"protocolVersion", info.protocolVersion},
        {"capabilities", {
            {"tools", nlohmann::json::object()},
            {"resources", nlohmann::json::object()}
        }},
        {"serverInfo", {{"name", info.name}, {"version", info.version}}}
    };
}

nlohmann::json Dispatcher::toolContent(const nlohmann::json& payload, bool isError) {
    return {
        {"content", nlohmann::json::array({
            {{"type", "text"}, {"text", payload.dump(2)}}
        })},
        {"isError", isError}
    };
}

nlohmann::json Dispatcher::callTool(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return makeError(id, JsonRpcError::InvalidParams, "Invalid params: tool name is required");
    }
    std::string name = params["name"].get<std::string>();

    nlohmann::json args = params.value("arguments", nlohmann::json::object());
    if (args.is_null()) args = nlohmann::json::object();
    if (!args.is_object()) {
        return makeError(id, JsonRpcError::InvalidParams, "Invalid params: arguments must be an object");
    }

    ITool* tool = registry.getTool(name);
    if (!tool) {
        return makeError(id, JsonRpcError::InvalidParams, "Unknown tool: " + name);
    }

    auto missing = registry.missingRequiredArguments(name, args);
    if (!missing.empty()) {
        return makeError(id, JsonRpcError::InvalidParams,
                         "Invalid params: missing required argument(s): " + joinNames(missing));
    }

    std::string problem = tool->checkArguments(args);
    if (!problem.empty()) {
        return makeError(id, JsonRpcError::InvalidParams, "Invalid params: " + problem);
    }

    ExecutionResult outcome;
    if (pipeline && tool->isRetryEligible()) {
        outcome = pipeline->execute([tool, &args]() { return tool->execute(args); }, name);
    } else {
        outcome = runDirect(*tool, args);
    }

    if (outcome.succeeded) {
        return makeResult(id, toolContent(outcome.result, false));
    }

    Logger::getInstance().error("Tool " + name + " failed after " +
                                std::to_string(outcome.attempts) + " attempt(s): " + outcome.error);

    nlohmann::json payload = outcome.toJson();
    payload["tool"] = name;
    return makeResult(id, toolContent(payload, true));
}

nlohmann::json Dispatcher::readResource(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
        return makeError(id, JsonRpcError::InvalidParams, "Invalid params: uri is required");
    }
    std::string uri = params["uri"].get<std::string>();

    auto text = resources.read(uri);
    if (!text) {
        return makeError(id, JsonRpcError::InvalidParams, "Unknown resource: " + uri);
    }

    return makeResult(id, {
        {"contents", nlohmann::json::array({
            {{"uri", uri}, {"mimeType", "text/plain"}, {"text", *text}}
        })}
    });
}
