/**
 * Dispatcher tests: JSON-RPC method table, error codes, tools/call through
 * the retry pipeline and direct execution, resources.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "FakeBackend.h"
#include "mcp/Dispatcher.h"
#include "mcp/WorkspaceResources.h"
#include "retry/ExecutionPipeline.h"
#include "tools/AgentTools.h"
#include "tools/ToolRegistry.h"

namespace fs = std::filesystem;

namespace {
nlohmann::json request(int id, const std::string& method, const nlohmann::json& params = nlohmann::json::object()) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

nlohmann::json call(int id, const std::string& tool, const nlohmann::json& args) {
  return request(id, "tools/call", {{"name", tool}, {"arguments", args}});
}

// Parses the text content of a tools/call result
nlohmann::json payloadOf(const nlohmann::json& response) {
  return nlohmann::json::parse(response["result"]["content"][0]["text"].get<std::string>());
}

class DispatcherTest : public ::testing::Test {
protected:
  FakeBackend backend;
  ToolRegistry registry;
  RetryStatistics stats;
  std::unique_ptr<ExecutionPipeline> pipeline;
  std::unique_ptr<WorkspaceResources> resources;
  std::unique_ptr<Dispatcher> dispatcher;
  std::vector<std::chrono::milliseconds> sleeps;

  void SetUp() override {
    fs::path root = fs::temp_directory_path() / "vibeteam_dispatcher_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root);

    registerAgentTools(registry, backend, root.u8string());
    registry.freeze();

    RetryPolicy policy;
    policy.jitterFraction = 0.0;
    pipeline = std::make_unique<ExecutionPipeline>(policy, stats);
    pipeline->setSleeper([this](std::chrono::milliseconds d) { sleeps.push_back(d); });

    resources = std::make_unique<WorkspaceResources>(root.u8string());
    resources->registerDefaults([this]() { return nlohmann::json{{"retry_statistics", stats.summary()}}; });

    dispatcher = std::make_unique<Dispatcher>(registry, *resources, pipeline.get());
  }

  nlohmann::json handle(const nlohmann::json& req) {
    auto res = dispatcher->handle(req);
    EXPECT_TRUE(res.has_value()) << req.dump();
    return res ? *res : nlohmann::json();
  }
};
} // namespace

TEST_F(DispatcherTest, Initialize) {
  auto res = handle(request(1, "initialize"));
  EXPECT_EQ(res["jsonrpc"], "2.0");
  EXPECT_EQ(res["id"], 1);
  EXPECT_EQ(res["result"]["protocolVersion"], "2024-11-05");
  EXPECT_EQ(res["result"]["serverInfo"]["name"], "vibeteam");
  EXPECT_EQ(res["result"]["serverInfo"]["version"], "1.0.0");
  EXPECT_TRUE(res["result"]["capabilities"].contains("tools"));
  EXPECT_TRUE(res["result"]["capabilities"].contains("resources"));
}

TEST_F(DispatcherTest, InitializeReportsConfiguredIdentity) {
  ServerInfo info;
  info.name = "vibeteam-staging";
  info.version = "2.3.4";
  Dispatcher custom(registry, *resources, pipeline.get(), info);

  auto res = custom.handle(request(1, "initialize"));
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ((*res)["result"]["serverInfo"]["name"], "vibeteam-staging");
  EXPECT_EQ((*res)["result"]["serverInfo"]["version"], "2.3.4");
  EXPECT_EQ((*res)["result"]["protocolVersion"], "2024-11-05");
}

TEST_F(DispatcherTest, ToolsList) {
  auto res = handle(request(2, "tools/list"));
  ASSERT_EQ(res["result"]["tools"].size(), 8u);
  EXPECT_EQ(res["result"]["tools"][0]["name"], "execute_task");
}

TEST_F(DispatcherTest, PingAndUnknownMethod) {
  EXPECT_TRUE(handle(request(3, "ping"))["result"].is_object());

  auto res = handle(request(4, "bogus/method"));
  EXPECT_EQ(res["error"]["code"], JsonRpcError::MethodNotFound);
  EXPECT_EQ(res["id"], 4);
}

TEST_F(DispatcherTest, NotificationsGetNoResponse) {
  EXPECT_FALSE(dispatcher->handle({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).has_value());
  EXPECT_FALSE(dispatcher->handle({{"jsonrpc", "2.0"}, {"method", "tools/list"}}).has_value());
  EXPECT_FALSE(dispatcher->handle({{"jsonrpc", "2.0"}, {"method", "bogus/method"}}).has_value());
}

TEST_F(DispatcherTest, ToolCallWithoutIdStillRuns) {
  backend.answer("done quietly");
  auto res = dispatcher->handle({{"jsonrpc", "2.0"}, {"method", "tools/call"},
                                 {"params", {{"name", "execute_task"}, {"arguments", {{"description", "tidy"}}}}}});
  EXPECT_FALSE(res.has_value());
  ASSERT_EQ(backend.requests.size(), 1u);
  EXPECT_EQ(backend.requests[0].prompt, "tidy");
}

TEST_F(DispatcherTest, InvalidRequests) {
  auto notObject = handle(nlohmann::json::array({1, 2}));
  EXPECT_EQ(notObject["error"]["code"], JsonRpcError::InvalidRequest);
  EXPECT_TRUE(notObject["id"].is_null());

  auto noMethod = handle({{"jsonrpc", "2.0"}, {"id", 9}});
  EXPECT_EQ(noMethod["error"]["code"], JsonRpcError::InvalidRequest);
  EXPECT_EQ(noMethod["id"], 9);
}

TEST_F(DispatcherTest, UnknownToolKeepsSessionUsable) {
  auto res = handle(call(5, "no_such_tool", nlohmann::json::object()));
  EXPECT_EQ(res["error"]["code"], JsonRpcError::InvalidParams);
  EXPECT_EQ(res["error"]["message"], "Unknown tool: no_such_tool");

  auto next = handle(request(6, "tools/list"));
  EXPECT_EQ(next["id"], 6);
  EXPECT_TRUE(next.contains("result"));
}

TEST_F(DispatcherTest, MissingArgumentsDoNotInvokeHandler) {
  auto res = handle(call(7, "review_code", {{"code", "x"}}));
  EXPECT_EQ(res["error"]["code"], JsonRpcError::InvalidParams);
  EXPECT_NE(res["error"]["message"].get<std::string>().find("language"), std::string::npos);
  EXPECT_TRUE(backend.requests.empty());

  auto noName = handle(request(8, "tools/call", {{"arguments", nlohmann::json::object()}}));
  EXPECT_EQ(noName["error"]["code"], JsonRpcError::InvalidParams);
}

TEST_F(DispatcherTest, ToolInputErrorsAreRejectedWithoutRetry) {
  auto badDir = handle(call(30, "execute_task",
                            {{"description", "x"}, {"working_directory", "/srv/build-timeouts"}}));
  EXPECT_EQ(badDir["error"]["code"], JsonRpcError::InvalidParams);
  EXPECT_NE(badDir["error"]["message"].get<std::string>().find("does not exist"), std::string::npos);

  auto noTasks = handle(call(31, "complete_tasks", {{"tasks", nlohmann::json::array()}}));
  EXPECT_EQ(noTasks["error"]["code"], JsonRpcError::InvalidParams);

  auto noTeam = handle(call(32, "manage_project", {{"project_description", "p"}, {"team_size", 0}}));
  EXPECT_EQ(noTeam["error"]["code"], JsonRpcError::InvalidParams);

  EXPECT_TRUE(sleeps.empty());
  EXPECT_TRUE(backend.requests.empty());
  EXPECT_EQ(stats.snapshot().totalAttempts, 0);
}

TEST_F(DispatcherTest, SuccessfulCallReturnsTextContent) {
  backend.answer("generated");
  auto res = handle(call(10, "generate_code", {{"specification", "fizzbuzz"}, {"language", "go"}}));

  EXPECT_EQ(res["result"]["isError"], false);
  EXPECT_EQ(res["result"]["content"][0]["type"], "text");
  auto payload = payloadOf(res);
  EXPECT_EQ(payload["status"], "success");
  EXPECT_EQ(payload["code"], "generated");
}

TEST_F(DispatcherTest, RetryableFailureIsRetriedThenSucceeds) {
  backend.failWith("usage limit reached");
  backend.failWith("usage limit reached");
  backend.answer("finally");

  auto res = handle(call(11, "execute_task", {{"description", "do it"}}));
  EXPECT_EQ(res["result"]["isError"], false);
  EXPECT_EQ(payloadOf(res)["result"], "finally");
  EXPECT_EQ(backend.requests.size(), 3u);
  EXPECT_EQ(sleeps.size(), 2u);

  auto s = stats.snapshot();
  EXPECT_EQ(s.successfulInvocations, 1);
  EXPECT_EQ(s.failedInvocations, 0);
  EXPECT_EQ(s.patternFrequency["usage limit"], 2);
}

TEST_F(DispatcherTest, ExhaustedFailureIsReportedAsToolError) {
  for (int i = 0; i < 3; ++i) backend.failWith("overloaded_error");

  auto res = handle(call(12, "execute_task", {{"description", "do it"}}));
  EXPECT_EQ(res["result"]["isError"], true);
  auto payload = payloadOf(res);
  EXPECT_EQ(payload["status"], "error");
  EXPECT_EQ(payload["tool"], "execute_task");
  EXPECT_EQ(payload["error"], "overloaded_error");
  EXPECT_EQ(payload["attempts"], 3);
  EXPECT_EQ(payload["retryable"], true);
  EXPECT_EQ(payload["exhausted"], true);
  EXPECT_EQ(payload["category"], "overload-queued");
  EXPECT_EQ(payload["pattern"], "overloaded_error");
}

TEST_F(DispatcherTest, NonRetryableFailureIsImmediate) {
  backend.failWith("invalid api key");

  auto res = handle(call(13, "execute_task", {{"description", "do it"}}));
  EXPECT_EQ(res["result"]["isError"], true);
  auto payload = payloadOf(res);
  EXPECT_EQ(payload["attempts"], 1);
  EXPECT_EQ(payload["retryable"], false);
  EXPECT_EQ(payload["exhausted"], false);
  EXPECT_TRUE(sleeps.empty());
}

TEST_F(DispatcherTest, RetryDisabledCallsHandlerDirectly) {
  Dispatcher direct(registry, *resources, nullptr);
  backend.failWith("rate limit exceeded");

  auto res = direct.handle(call(14, "execute_task", {{"description", "do it"}}));
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ((*res)["result"]["isError"], true);
  auto payload = payloadOf(*res);
  EXPECT_EQ(payload["attempts"], 1);
  EXPECT_EQ(payload["retryable"], true);
  EXPECT_EQ(payload["exhausted"], false);
  EXPECT_EQ(backend.requests.size(), 1u);
  EXPECT_EQ(stats.snapshot().totalAttempts, 0);
}

TEST_F(DispatcherTest, Resources) {
  auto list = handle(request(20, "resources/list"));
  EXPECT_EQ(list["result"]["resources"].size(), 3u);

  auto status = handle(request(21, "resources/read", {{"uri", "agent:///status"}}));
  auto contents = status["result"]["contents"][0];
  EXPECT_EQ(contents["uri"], "agent:///status");
  auto body = nlohmann::json::parse(contents["text"].get<std::string>());
  EXPECT_TRUE(body.contains("retry_statistics"));

  auto unknown = handle(request(22, "resources/read", {{"uri", "workspace:///missing"}}));
  EXPECT_EQ(unknown["error"]["code"], JsonRpcError::InvalidParams);
}
