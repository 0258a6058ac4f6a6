#include "tools/AgentTools.h"
#include "tools/ToolRegistry.h"
#include "agent/ICodingBackend.h"
#include "utils/Logger.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace {
nlohmann::json stringProperty(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

nlohmann::json objectSchema(const nlohmann::json& properties, const std::vector<std::string>& required) {
    return {
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

std::string optionalString(const nlohmann::json& args, const std::string& key) {
    if (args.contains(key) && args[key].is_string()) {
        return args[key].get<std::string>();
    }
    return "";
}

std::string fenced(const std::string& language, const std::string& code) {
    return "```" + language + "\n" + code + "\n```";
}

// Strips the "[ ]" checkbox prefix; returns false for anything else
bool openCheckboxTask(const std::string& line, std::string& description) {
    size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos || line.compare(start, 3, "[ ]") != 0) {
        return false;
    }
    std::string rest = line.substr(start + 3);
    size_t first = rest.find_first_not_of(" \t");
    size_t last = rest.find_last_not_of(" \t\r\n");
    description = first == std::string::npos ? "" : rest.substr(first, last - first + 1);
    return true;
}
} // namespace

AgentTool::AgentTool(ICodingBackend& backend, const std::string& workingDirectory)
    : backend(backend), workingDirectory(workingDirectory) {}

std::string AgentTool::ask(const std::string& prompt, const std::string& dir) const {
    BackendRequest request;
    request.prompt = prompt;
    request.workingDirectory = dir.empty() ? workingDirectory : dir;
    return backend.run(request);
}

// ---------------------------------------------------------------- execute_task

std::string ExecuteTaskTool::getDescription() const {
    return "Execute a software engineering task using the coding agent";
}

nlohmann::json ExecuteTaskTool::getSchema() const {
    return objectSchema({
        {"description", stringProperty("Detailed description of the task to execute")},
        {"working_directory", stringProperty("Working directory for the task (optional)")}
    }, {"description"});
}

std::string ExecuteTaskTool::checkArguments(const nlohmann::json& args) const {
    std::string dir = optionalString(args, "working_directory");
    if (dir.empty()) dir = workingDirectory;

    std::error_code ec;
    if (!dir.empty() && !fs::is_directory(fs::u8path(dir), ec)) {
        return "Working directory does not exist: " + dir;
    }
    return "";
}

nlohmann::json ExecuteTaskTool::execute(const nlohmann::json& args) {
    std::string problem = checkArguments(args);
    if (!problem.empty()) {
        return {{"error", problem}};
    }

    std::string description = args.at("description").get<std::string>();
    std::string dir = optionalString(args, "working_directory");
    if (dir.empty()) dir = workingDirectory;

    std::string result = ask(description, dir);
    return {
        {"status", "success"},
        {"result", result},
        {"working_directory", dir}
    };
}

// ----------------------------------------------------------------- review_code

std::string ReviewCodeTool::getDescription() const {
    return "Review code for quality, bugs, and improvements";
}

nlohmann::json ReviewCodeTool::getSchema() const {
    return objectSchema({
        {"code", stringProperty("Code to review")},
        {"language", stringProperty("Programming language (e.g., python, javascript)")},
        {"context", stringProperty("Additional context about the code (optional)")}
    }, {"code", "language"});
}

nlohmann::json ReviewCodeTool::execute(const nlohmann::json& args) {
    std::string code = args.at("code").get<std::string>();
    std::string language = args.at("language").get<std::string>();
    std::string context = optionalString(args, "context");

    std::string prompt = "Review the following " + language +
                         " code for quality, bugs, and possible improvements. "
                         "Do not modify any files; report findings only.\n\n";
    if (!context.empty()) {
        prompt += "Context: " + context + "\n\n";
    }
    prompt += fenced(language, code);

    return {
        {"status", "success"},
        {"review", ask(prompt)}
    };
}

// --------------------------------------------------------------- generate_code

std::string GenerateCodeTool::getDescription() const {
    return "Generate code based on specifications";
}

nlohmann::json GenerateCodeTool::getSchema() const {
    return objectSchema({
        {"specification", stringProperty("Detailed specification of what to generate")},
        {"language", stringProperty("Target programming language")},
        {"style_guide", stringProperty("Code style guidelines to follow (optional)")}
    }, {"specification", "language"});
}

nlohmann::json GenerateCodeTool::execute(const nlohmann::json& args) {
    std::string specification = args.at("specification").get<std::string>();
    std::string language = args.at("language").get<std::string>();
    std::string styleGuide = optionalString(args, "style_guide");

    std::string prompt = "Generate " + language + " code for: " + specification;
    if (!styleGuide.empty()) {
        prompt += "\n\nFollow this style guide: " + styleGuide;
    }

    return {
        {"status", "success"},
        {"code", ask(prompt)}
    };
}

// -------------------------------------------------------------------- fix_code

std::string FixCodeTool::getDescription() const {
    return "Fix bugs or issues in code";
}

nlohmann::json FixCodeTool::getSchema() const {
    return objectSchema({
        {"code", stringProperty("Code with issues")},
        {"error_message", stringProperty("Error message or description of the issue")},
        {"language", stringProperty("Programming language")}
    }, {"code", "error_message", "language"});
}

nlohmann::json FixCodeTool::execute(const nlohmann::json& args) {
    std::string code = args.at("code").get<std::string>();
    std::string errorMessage = args.at("error_message").get<std::string>();
    std::string language = args.at("language").get<std::string>();

    std::string prompt = "Debug and fix the following " + language + " code.\n\n"
                         "Reported problem:\n" + errorMessage + "\n\n" +
                         fenced(language, code) +
                         "\n\nReturn the corrected code and a short explanation of the fix.";

    return {
        {"status", "success"},
        {"fixed_code", ask(prompt)}
    };
}

// ----------------------------------------------------------------- write_tests

std::string WriteTestsTool::getDescription() const {
    return "Write unit tests for code";
}

nlohmann::json WriteTestsTool::getSchema() const {
    return objectSchema({
        {"code", stringProperty("Code to write tests for")},
        {"language", stringProperty("Programming language")},
        {"test_framework", stringProperty("Test framework to use (e.g., pytest, jest)")}
    }, {"code", "language", "test_framework"});
}

nlohmann::json WriteTestsTool::execute(const nlohmann::json& args) {
    std::string code = args.at("code").get<std::string>();
    std::string language = args.at("language").get<std::string>();
    std::string framework = args.at("test_framework").get<std::string>();

    std::string prompt = "Write thorough unit tests using " + framework +
                         " for the following " + language + " code. "
                         "Cover normal behaviour, edge cases and error paths.\n\n" +
                         fenced(language, code);

    return {
        {"status", "success"},
        {"tests", ask(prompt)}
    };
}

// -------------------------------------------------------------- complete_tasks

std::string CompleteTasksTool::getDescription() const {
    return "Complete an array of tasks sequentially";
}

nlohmann::json CompleteTasksTool::getSchema() const {
    return objectSchema({
        {"tasks", {
            {"type", "array"},
            {"items", {{"type", "string"}}},
            {"description", "Array of task descriptions to complete"}
        }},
        {"max_tasks", {
            {"type", "integer"},
            {"description", "Maximum number of tasks to complete (optional, default: all)"}
        }}
    }, {"tasks"});
}

std::string CompleteTasksTool::checkArguments(const nlohmann::json& args) const {
    if (!args.contains("tasks") || args["tasks"].empty()) {
        return "No tasks provided";
    }
    return "";
}

nlohmann::json CompleteTasksTool::execute(const nlohmann::json& args) {
    std::string problem = checkArguments(args);
    if (!problem.empty()) {
        return {{"error", problem}};
    }
    const auto& tasks = args.at("tasks");

    size_t limit = tasks.size();
    if (args.contains("max_tasks") && args["max_tasks"].is_number_integer()) {
        long long maxTasks = args["max_tasks"].get<long long>();
        if (maxTasks > 0 && static_cast<size_t>(maxTasks) < limit) {
            limit = static_cast<size_t>(maxTasks);
        }
    }

    auto& log = Logger::getInstance();
    nlohmann::json results = nlohmann::json::array();
    size_t completed = 0;
    std::string lastError;

    for (size_t i = 0; i < limit; ++i) {
        std::string task = tasks[i].is_string() ? tasks[i].get<std::string>() : tasks[i].dump();
        log.info("Processing task " + std::to_string(i + 1) + "/" + std::to_string(limit) + ": " + task);
        try {
            std::string result = ask(task);
            results.push_back({{"task", task}, {"status", "completed"}, {"result", result}});
            completed++;
        } catch (const std::exception& e) {
            log.error("Error processing task '" + task + "': " + e.what());
            lastError = e.what();
            results.push_back({{"task", task}, {"status", "failed"}, {"error", lastError}});
        }
    }

    nlohmann::json summary = {
        {"status", "success"},
        {"total_tasks", tasks.size()},
        {"processed_tasks", limit},
        {"completed_tasks", completed},
        {"failed_tasks", limit - completed},
        {"results", results}
    };
    if (completed == 0) {
        summary["status"] = "error";
        summary["error"] = lastError;
    }
    return summary;
}

// ------------------------------------------------------ vibeteam_task_workflow

const std::string& TaskWorkflowTool::workflowPrompt() {
    static const std::string prompt =
        "You are a software Engineer. Your task is to get a task from the following list. "
        "Complete it. Cover with test. Run test. Fix any related issues if any. Re-run test. "
        "Reflect. Review git diff. Reflect. Fix if any issues.";
    return prompt;
}

std::string TaskWorkflowTool::getDescription() const {
    return "Execute the full task workflow: get task, complete it, test, fix issues, commit";
}

nlohmann::json TaskWorkflowTool::getSchema() const {
    return objectSchema({
        {"tasks", {
            {"type", "array"},
            {"items", {{"type", "string"}}},
            {"description", "Array of task descriptions in checkbox format (e.g., '[ ] Implement feature X')"}
        }},
        {"auto_commit", {
            {"type", "boolean"},
            {"description", "Automatically commit changes after completing each task (default: false)"}
        }}
    }, {"tasks"});
}

std::string TaskWorkflowTool::checkArguments(const nlohmann::json& args) const {
    if (!args.contains("tasks") || args["tasks"].empty()) {
        return "No tasks provided";
    }
    return "";
}

nlohmann::json TaskWorkflowTool::execute(const nlohmann::json& args) {
    std::string problem = checkArguments(args);
    if (!problem.empty()) {
        return {{"error", problem}};
    }
    const auto& tasks = args.at("tasks");
    bool autoCommit = args.contains("auto_commit") && args["auto_commit"].is_boolean() &&
                      args["auto_commit"].get<bool>();

    std::string basePrompt = workflowPrompt();
    if (autoCommit) basePrompt += " Commit";

    std::vector<std::string> openTasks;
    for (const auto& t : tasks) {
        std::string description;
        if (t.is_string() && openCheckboxTask(t.get<std::string>(), description) && !description.empty()) {
            openTasks.push_back(description);
        }
    }

    auto& log = Logger::getInstance();
    nlohmann::json results = nlohmann::json::array();
    size_t completed = 0;
    std::string lastError;

    for (size_t i = 0; i < openTasks.size(); ++i) {
        log.info("Processing task " + std::to_string(i + 1) + "/" + std::to_string(openTasks.size()) + ": " + openTasks[i]);
        try {
            std::string result = ask(basePrompt + "\n\nTask to complete: " + openTasks[i]);
            results.push_back({{"task", openTasks[i]}, {"status", "completed"}, {"result", result}, {"committed", autoCommit}});
            completed++;
        } catch (const std::exception& e) {
            log.error("Error processing task '" + openTasks[i] + "': " + e.what());
            lastError = e.what();
            results.push_back({{"task", openTasks[i]}, {"status", "failed"}, {"error", lastError}});
        }
    }

    nlohmann::json summary = {
        {"status", "success"},
        {"total_tasks", tasks.size()},
        {"uncompleted_tasks", openTasks.size()},
        {"processed_tasks", openTasks.size()},
        {"completed_tasks", completed},
        {"failed_tasks", openTasks.size() - completed},
        {"results", results}
    };
    if (!openTasks.empty() && completed == 0) {
        summary["status"] = "error";
        summary["error"] = lastError;
    }
    return summary;
}

// -------------------------------------------------------------- manage_project

std::string ManageProjectTool::getDescription() const {
    return "Use the engineering manager to plan and coordinate multiple agents on a project";
}

nlohmann::json ManageProjectTool::getSchema() const {
    return objectSchema({
        {"project_description", stringProperty("Description of the project to manage")},
        {"team_size", {
            {"type", "integer"},
            {"description", "Number of agents to coordinate (default: 2)"}
        }}
    }, {"project_description"});
}

namespace {
long long teamSizeOf(const nlohmann::json& args) {
    if (args.contains("team_size") && args["team_size"].is_number_integer()) {
        return args["team_size"].get<long long>();
    }
    return 2;
}
} // namespace

std::string ManageProjectTool::checkArguments(const nlohmann::json& args) const {
    if (teamSizeOf(args) < 1) {
        return "team_size must be at least 1";
    }
    return "";
}

nlohmann::json ManageProjectTool::execute(const nlohmann::json& args) {
    std::string problem = checkArguments(args);
    if (!problem.empty()) {
        return {{"error", problem}};
    }
    std::string description = args.at("project_description").get<std::string>();
    long long teamSize = teamSizeOf(args);

    std::string prompt = "You are an engineering manager coordinating a team of " +
                         std::to_string(teamSize) + " engineers.\n"
                         "Break the project below into subtasks, assign each subtask to an engineer, "
                         "order them by dependency, then carry out the plan and report the outcome "
                         "of every subtask.\n\nProject: " + description;

    return {
        {"status", "success"},
        {"team_size", teamSize},
        {"project_result", ask(prompt)}
    };
}

void registerAgentTools(ToolRegistry& registry, ICodingBackend& backend,
                        const std::string& workingDirectory) {
    registry.registerTool(std::make_unique<ExecuteTaskTool>(backend, workingDirectory));
    registry.registerTool(std::make_unique<ReviewCodeTool>(backend, workingDirectory));
    registry.registerTool(std::make_unique<GenerateCodeTool>(backend, workingDirectory));
    registry.registerTool(std::make_unique<FixCodeTool>(backend, workingDirectory));
    registry.registerTool(std::make_unique<WriteTestsTool>(backend, workingDirectory));
    registry.registerTool(std::make_unique<CompleteTasksTool>(backend, workingDirectory));
    registry.registerTool(std::make_unique<TaskWorkflowTool>(backend, workingDirectory));
    registry.registerTool(std::make_unique<ManageProjectTool>(backend, workingDirectory));
}
