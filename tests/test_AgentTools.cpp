/**
 * Agent tool tests: prompts sent to the backend, result shapes, task batching.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

#include "FakeBackend.h"
#include "tools/AgentTools.h"
#include "tools/ToolRegistry.h"

namespace fs = std::filesystem;

namespace {
class AgentToolsTest : public ::testing::Test {
protected:
  FakeBackend backend;
  std::string dir;

  void SetUp() override {
    fs::path root = fs::temp_directory_path() / "vibeteam_agent_tools_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root);
    dir = root.u8string();
  }
};
} // namespace

TEST_F(AgentToolsTest, RegistersAllToolsInOrder) {
  ToolRegistry registry;
  registerAgentTools(registry, backend, dir);

  auto list = registry.listTools();
  ASSERT_EQ(list.size(), 8u);
  EXPECT_EQ(list[0]["name"], "execute_task");
  EXPECT_EQ(list[1]["name"], "review_code");
  EXPECT_EQ(list[2]["name"], "generate_code");
  EXPECT_EQ(list[3]["name"], "fix_code");
  EXPECT_EQ(list[4]["name"], "write_tests");
  EXPECT_EQ(list[5]["name"], "complete_tasks");
  EXPECT_EQ(list[6]["name"], "vibeteam_task_workflow");
  EXPECT_EQ(list[7]["name"], "manage_project");
  for (const auto& t : list) {
    EXPECT_EQ(t["inputSchema"]["type"], "object") << t["name"];
    EXPECT_TRUE(registry.getTool(t["name"].get<std::string>())->isRetryEligible());
  }

  EXPECT_THROW(registerAgentTools(registry, backend, dir), DuplicateToolError);
}

TEST_F(AgentToolsTest, ExecuteTaskRunsInWorkingDirectory) {
  backend.answer("done");
  ExecuteTaskTool tool(backend, dir);

  auto res = tool.execute({{"description", "Add a README"}});
  EXPECT_EQ(res["status"], "success");
  EXPECT_EQ(res["result"], "done");
  EXPECT_EQ(res["working_directory"], dir);
  ASSERT_EQ(backend.requests.size(), 1u);
  EXPECT_EQ(backend.requests[0].prompt, "Add a README");
  EXPECT_EQ(backend.requests[0].workingDirectory, dir);
}

TEST_F(AgentToolsTest, ExecuteTaskRejectsMissingDirectory) {
  ExecuteTaskTool tool(backend, dir);
  auto res = tool.execute({{"description", "x"}, {"working_directory", dir + "/does/not/exist"}});
  ASSERT_TRUE(res.contains("error"));
  EXPECT_NE(res["error"].get<std::string>().find("does not exist"), std::string::npos);
  EXPECT_TRUE(backend.requests.empty());

  EXPECT_EQ(tool.checkArguments({{"description", "x"}, {"working_directory", dir + "/does/not/exist"}}),
            res["error"].get<std::string>());
  EXPECT_EQ(tool.checkArguments({{"description", "x"}}), "");
}

TEST_F(AgentToolsTest, BackendErrorPropagates) {
  backend.failWith("Claude usage limit reached");
  ReviewCodeTool tool(backend, dir);
  EXPECT_THROW(tool.execute({{"code", "int x;"}, {"language", "cpp"}}), BackendError);
}

TEST_F(AgentToolsTest, CodeToolsReturnNamedFields) {
  backend.answer("looks fine");
  backend.answer("print('hi')");
  backend.answer("fixed");
  backend.answer("def test_x(): pass");

  ReviewCodeTool review(backend, dir);
  GenerateCodeTool generate(backend, dir);
  FixCodeTool fix(backend, dir);
  WriteTestsTool tests(backend, dir);

  EXPECT_EQ(review.execute({{"code", "x = 1"}, {"language", "python"}, {"context", "config module"}})["review"],
            "looks fine");
  EXPECT_EQ(generate.execute({{"specification", "hello world"}, {"language", "python"}})["code"], "print('hi')");
  EXPECT_EQ(fix.execute({{"code", "x ="}, {"error_message", "SyntaxError"}, {"language", "python"}})["fixed_code"],
            "fixed");
  EXPECT_EQ(tests.execute({{"code", "def x(): pass"}, {"language", "python"}, {"test_framework", "pytest"}})["tests"],
            "def test_x(): pass");

  ASSERT_EQ(backend.requests.size(), 4u);
  EXPECT_NE(backend.requests[0].prompt.find("Context: config module"), std::string::npos);
  EXPECT_NE(backend.requests[0].prompt.find("```python\nx = 1\n```"), std::string::npos);
  EXPECT_NE(backend.requests[2].prompt.find("SyntaxError"), std::string::npos);
  EXPECT_NE(backend.requests[3].prompt.find("pytest"), std::string::npos);
}

TEST_F(AgentToolsTest, CompleteTasksReportsPerTaskOutcome) {
  backend.answer("first done");
  backend.failWith("permission denied");
  backend.answer("third done");
  CompleteTasksTool tool(backend, dir);

  auto res = tool.execute({{"tasks", {"one", "two", "three", "four"}}, {"max_tasks", 3}});
  EXPECT_EQ(res["status"], "success");
  EXPECT_EQ(res["total_tasks"], 4);
  EXPECT_EQ(res["processed_tasks"], 3);
  EXPECT_EQ(res["completed_tasks"], 2);
  EXPECT_EQ(res["failed_tasks"], 1);
  ASSERT_EQ(res["results"].size(), 3u);
  EXPECT_EQ(res["results"][1]["status"], "failed");
  EXPECT_EQ(res["results"][1]["error"], "permission denied");
  EXPECT_FALSE(res.contains("error"));
}

TEST_F(AgentToolsTest, CompleteTasksFailsWhenNothingCompleted) {
  backend.failWith("rate limit");
  backend.failWith("usage limit reached");
  CompleteTasksTool tool(backend, dir);

  auto res = tool.execute({{"tasks", {"a", "b"}}});
  EXPECT_EQ(res["status"], "error");
  EXPECT_EQ(res["error"], "usage limit reached");

  auto empty = tool.execute({{"tasks", nlohmann::json::array()}});
  EXPECT_EQ(empty["error"], "No tasks provided");
}

TEST_F(AgentToolsTest, TaskWorkflowOnlyRunsOpenCheckboxes) {
  TaskWorkflowTool tool(backend, dir);

  auto res = tool.execute({
      {"tasks", {"[ ] Implement parser", "[x] Already done", "plain line", "  [ ] Write docs"}},
      {"auto_commit", true}
  });
  EXPECT_EQ(res["status"], "success");
  EXPECT_EQ(res["total_tasks"], 4);
  EXPECT_EQ(res["processed_tasks"], 2);
  EXPECT_EQ(res["completed_tasks"], 2);
  ASSERT_EQ(backend.requests.size(), 2u);

  const std::string& prompt = backend.requests[0].prompt;
  EXPECT_EQ(prompt.rfind(TaskWorkflowTool::workflowPrompt() + " Commit", 0), 0u);
  EXPECT_NE(prompt.find("Task to complete: Implement parser"), std::string::npos);
  EXPECT_NE(backend.requests[1].prompt.find("Task to complete: Write docs"), std::string::npos);
}

TEST_F(AgentToolsTest, ManageProjectValidatesTeamSize) {
  backend.answer("plan executed");
  ManageProjectTool tool(backend, dir);

  auto res = tool.execute({{"project_description", "Build a CLI"}});
  EXPECT_EQ(res["status"], "success");
  EXPECT_EQ(res["team_size"], 2);
  EXPECT_EQ(res["project_result"], "plan executed");
  EXPECT_NE(backend.requests[0].prompt.find("team of 2 engineers"), std::string::npos);

  auto bad = tool.execute({{"project_description", "x"}, {"team_size", 0}});
  EXPECT_EQ(bad["error"], "team_size must be at least 1");
}
