#pragma once
#include "ITool.h"
#include <memory>
#include <string>
#include <vector>

class ICodingBackend;
class ToolRegistry;

/**
 * @brief Base for tools that delegate to the AI coding backend.
 *
 * All of them are retry-eligible: their failures come from a rate-limited
 * upstream and are worth classifying.
 */
class AgentTool : public ITool {
public:
    AgentTool(ICodingBackend& backend, const std::string& workingDirectory);

    bool isRetryEligible() const override { return true; }

protected:
    ICodingBackend& backend;
    std::string workingDirectory;

    // Runs the prompt; throws BackendError on upstream failure
    std::string ask(const std::string& prompt, const std::string& dir = "") const;
};

class ExecuteTaskTool : public AgentTool {
public:
    using AgentTool::AgentTool;

    std::string getName() const override { return "execute_task"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string checkArguments(const nlohmann::json& args) const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class ReviewCodeTool : public AgentTool {
public:
    using AgentTool::AgentTool;

    std::string getName() const override { return "review_code"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class GenerateCodeTool : public AgentTool {
public:
    using AgentTool::AgentTool;

    std::string getName() const override { return "generate_code"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class FixCodeTool : public AgentTool {
public:
    using AgentTool::AgentTool;

    std::string getName() const override { return "fix_code"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class WriteTestsTool : public AgentTool {
public:
    using AgentTool::AgentTool;

    std::string getName() const override { return "write_tests"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

/**
 * @brief Runs an array of task descriptions one after another.
 *
 * Individual task failures are reported per task. The call as a whole
 * fails only when no task completed, carrying the last error so the retry
 * pipeline can classify it.
 */
class CompleteTasksTool : public AgentTool {
public:
    using AgentTool::AgentTool;

    std::string getName() const override { return "complete_tasks"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string checkArguments(const nlohmann::json& args) const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

/**
 * @brief Full engineering workflow over "[ ] task" checkbox lines:
 * complete, test, fix, review and optionally commit each open task.
 */
class TaskWorkflowTool : public AgentTool {
public:
    using AgentTool::AgentTool;

    std::string getName() const override { return "vibeteam_task_workflow"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string checkArguments(const nlohmann::json& args) const override;
    nlohmann::json execute(const nlohmann::json& args) override;

    static const std::string& workflowPrompt();
};

class ManageProjectTool : public AgentTool {
public:
    using AgentTool::AgentTool;

    std::string getName() const override { return "manage_project"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string checkArguments(const nlohmann::json& args) const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

/**
 * @brief Register every agent tool. Throws DuplicateToolError if any name
 * is already taken.
 */
void registerAgentTools(ToolRegistry& registry, ICodingBackend& backend,
                        const std::string& workingDirectory);
