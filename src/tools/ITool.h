#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Tool interface.
 *
 * Every tool exposed over tools/call implements this interface.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Short description shown to protocol clients
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief JSON Schema of the tool arguments ("inputSchema")
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Whether calls reach a flaky upstream and should run through the
     * retry pipeline. This is a property of the tool, not of a single call.
     */
    virtual bool isRetryEligible() const { return false; }

    /**
     * @brief Tool-specific argument problems that no retry can fix.
     * @return error message, empty when args are acceptable
     *
     * Checked before execute() and outside the retry pipeline.
     */
    virtual std::string checkArguments(const nlohmann::json& /*args*/) const { return ""; }

    /**
     * @brief Execute the tool.
     * @param args tool arguments (already checked against getSchema())
     * @return result payload
     *
     * Failures either throw, or return:
     * {
     *   "error": "description"
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};
