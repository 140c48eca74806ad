// test_subprocess.cpp - Child processes over pipes

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "hammer/process/subprocess.hpp"
#include "hammer/test_support/fixtures.hpp"

namespace fs = std::filesystem;

using hammer::ProcessOptions;
using hammer::ProcessResult;

namespace
{

ProcessOptions shell(const std::string & script, std::string input = {})
{
  ProcessOptions options;
  options.argv = {"/bin/sh", "-c", script};
  options.input = std::move(input);
  return options;
}

}  // namespace

TEST(Subprocess, EchoesStdin)
{
  const ProcessResult result = hammer::run_process(shell("cat", "{\"a\": 1}"));
  EXPECT_TRUE(result.success());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.output, "{\"a\": 1}");
}

TEST(Subprocess, LargePayloadDoesNotDeadlock)
{
  // Larger than any pipe buffer in both directions
  const std::string payload(1 << 20, 'x');
  const ProcessResult result = hammer::run_process(shell("cat", payload));
  ASSERT_TRUE(result.success());
  EXPECT_EQ(result.output.size(), payload.size());
}

TEST(Subprocess, ChildIgnoringStdin)
{
  const std::string payload(1 << 20, 'x');
  const ProcessResult result = hammer::run_process(shell("echo done", payload));
  ASSERT_TRUE(result.success());
  EXPECT_EQ(result.output, "done\n");
}

TEST(Subprocess, ReportsExitStatus)
{
  const ProcessResult result = hammer::run_process(shell("echo partial; exit 3"));
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_EQ(result.output, "partial\n");
  EXPECT_EQ(result.describe_failure(), "exited with status 3");
}

TEST(Subprocess, ReportsSignal)
{
  const ProcessResult result = hammer::run_process(shell("kill -TERM $$"));
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.term_signal, SIGTERM);
  EXPECT_EQ(result.describe_failure(), "was killed by signal 15 (SIGTERM)");
}

TEST(Subprocess, TimeoutKillsChild)
{
  ProcessOptions options = shell("sleep 10");
  options.timeout = std::chrono::milliseconds(200);

  const auto start = std::chrono::steady_clock::now();
  const ProcessResult result = hammer::run_process(options);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.timed_out);
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.describe_failure(), "timed out");
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(Subprocess, MissingExecutableThrows)
{
  ProcessOptions options;
  options.argv = {"/nonexistent/hammer-check"};
  EXPECT_THROW((void)hammer::run_process(options), std::system_error);

  options.argv.clear();
  EXPECT_THROW((void)hammer::run_process(options), std::system_error);
}

// ============================================================================
// find_executable
// ============================================================================

TEST(FindExecutable, SearchDirsBeforePath)
{
  const fs::path dir = hammer::test_support::make_temp_dir("hammer_find_exe");
  hammer::test_support::write_script(dir / "sh", "exit 0\n");

  const auto found = hammer::find_executable("sh", {dir});
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->string(), (dir / "sh").string());

  fs::remove_all(dir);
}

TEST(FindExecutable, FallsBackToPath)
{
  const auto found = hammer::find_executable("sh", {"/nonexistent/hammer"});
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename().string(), "sh");
}

TEST(FindExecutable, PathsAreTakenAsIs)
{
  EXPECT_TRUE(hammer::find_executable("/bin/sh", {}).has_value());
  EXPECT_FALSE(hammer::find_executable("/nonexistent/sh", {}).has_value());
  EXPECT_FALSE(hammer::find_executable("", {}).has_value());
}

TEST(FindExecutable, IgnoresNonExecutableFiles)
{
  const fs::path dir = hammer::test_support::make_temp_dir("hammer_find_noexec");
  hammer::test_support::write_file(dir / "hammer-not-executable", "#!/bin/sh\n");

  EXPECT_FALSE(hammer::find_executable("hammer-not-executable", {dir}).has_value());

  fs::remove_all(dir);
}
