#pragma once
#include <string>
#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

class DuplicateToolError : public std::runtime_error {
public:
    explicit DuplicateToolError(const std::string& name)
        : std::runtime_error("Tool already registered: " + name), toolName(name) {}

    const std::string& getToolName() const { return toolName; }

private:
    std::string toolName;
};

/**
 * @brief Tool registry.
 *
 * Populated once at startup, then frozen. Lookups are read-only afterwards.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief Register a tool (takes ownership)
     * @throws DuplicateToolError if the name is already registered
     * @throws std::logic_error after freeze()
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief Close the registry to further registration
     */
    void freeze() { frozen = true; }
    bool isFrozen() const { return frozen; }

    /**
     * @brief Look up a tool
     * @return tool pointer, nullptr when not found
     */
    ITool* getTool(const std::string& name) const;

    /**
     * @brief tools/list payload, in registration order:
     * [
     *   {"name": "...", "description": "...", "inputSchema": { JSON Schema }}
     * ]
     */
    nlohmann::json listTools() const;

    /**
     * @brief Required schema fields that are absent, null or of the wrong
     * JSON type in args. Empty means the arguments are acceptable.
     */
    std::vector<std::string> missingRequiredArguments(const std::string& name,
                                                      const nlohmann::json& args) const;

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::unordered_map<std::string, std::unique_ptr<ITool>> tools;
    std::vector<std::string> order;
    bool frozen = false;
};
