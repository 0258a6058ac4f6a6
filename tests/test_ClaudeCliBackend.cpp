/**
 * ClaudeCliBackend tests: argument vector and subprocess handling, using
 * standard POSIX utilities in place of the real CLI.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>

#include "agent/ClaudeCliBackend.h"

namespace fs = std::filesystem;

TEST(ClaudeCliBackend, BuildsPrintModeArguments) {
  ClaudeCliBackend backend;
  std::vector<std::string> expected = {
      "claude", "-p", "fix the bug", "--output-format", "text",
      "--permission-mode", "bypassPermissions"};
  EXPECT_EQ(backend.buildArguments("fix the bug"), expected);
  EXPECT_EQ(backend.name(), "claude");
}

TEST(ClaudeCliBackend, AppendsModelWhenConfigured) {
  ClaudeCliBackend backend("claude", "sonnet");
  auto args = backend.buildArguments("hi");
  ASSERT_GE(args.size(), 2u);
  EXPECT_EQ(args[args.size() - 2], "--model");
  EXPECT_EQ(args.back(), "sonnet");
  EXPECT_EQ(backend.name(), "claude (sonnet)");
}

TEST(ClaudeCliBackend, ReturnsTrimmedStdout) {
  ClaudeCliBackend backend("echo");
  BackendRequest request;
  request.prompt = "hello";
  request.workingDirectory = fs::temp_directory_path().u8string();

  std::string out = backend.run(request);
  EXPECT_EQ(out, "-p hello --output-format text --permission-mode bypassPermissions");
}

TEST(ClaudeCliBackend, NonZeroExitThrowsBackendError) {
  ClaudeCliBackend backend("false");
  BackendRequest request;
  request.prompt = "x";
  try {
    backend.run(request);
    FAIL() << "expected BackendError";
  } catch (const BackendError& e) {
    EXPECT_EQ(std::string(e.what()), "false failed: exit status 1");
  }
}

TEST(ClaudeCliBackend, MissingExecutableThrowsStartError) {
  ClaudeCliBackend backend("vibeteam-no-such-binary");
  BackendRequest request;
  request.prompt = "x";
  try {
    backend.run(request);
    FAIL() << "expected BackendError";
  } catch (const BackendError& e) {
    EXPECT_EQ(std::string(e.what()).rfind("Failed to start vibeteam-no-such-binary", 0), 0u) << e.what();
  }
}
