#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

class ToolRegistry;
class WorkspaceResources;
class ExecutionPipeline;

namespace JsonRpcError {
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;
} // namespace JsonRpcError

/**
 * @brief Identity reported by initialize.
 */
struct ServerInfo {
    std::string name = "vibeteam";
    std::string version = "1.0.0";
    std::string protocolVersion = "2024-11-05";
};

/**
 * @brief Maps one JSON-RPC 2.0 request onto tools and resources.
 *
 * Stateless apart from the collaborators it references; one instance
 * serves every session.
 */
class Dispatcher {
public:
    /**
     * @param pipeline nullptr disables retries; eligible tools are then
     *                 called directly like every other tool
     */
    Dispatcher(ToolRegistry& registry, WorkspaceResources& resources,
               ExecutionPipeline* pipeline, ServerInfo info = ServerInfo());

    /**
     * @brief Handle a request.
     * @return response object, std::nullopt for notifications (which are
     * still executed unless the method is in the notifications namespace)
     */
    std::optional<nlohmann::json> handle(const nlohmann::json& request);

    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);
    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);

private:
    ToolRegistry& registry;
    WorkspaceResources& resources;
    ExecutionPipeline* pipeline;
    ServerInfo info;

    nlohmann::json dispatch(const nlohmann::json& id, const std::string& method,
                            const nlohmann::json& params);
    nlohmann::json initialize() const;
    nlohmann::json callTool(const nlohmann::json& id, const nlohmann::json& params);
    nlohmann::json readResource(const nlohmann::json& id, const nlohmann::json& params);

    static nlohmann::json toolContent(const nlohmann::json& payload, bool isError);
};
