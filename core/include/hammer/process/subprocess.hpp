// hammer/process/subprocess.hpp - Run a child process over pipes
//
// Used for the Nix evaluator and for external checks: the child gets a
// payload on stdin, its stdout is collected in full, its stderr is inherited.
//
#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hammer
{

struct ProcessOptions
{
  /// argv[0] must be a path to the executable (see find_executable)
  std::vector<std::string> argv;

  /// Written to the child's stdin, which is closed afterwards
  std::string input;

  /// Wall-clock limit; zero waits forever
  std::chrono::milliseconds timeout{0};
};

struct ProcessResult
{
  int exit_code = -1;    ///< Exit status when the child exited normally
  int term_signal = 0;   ///< Terminating signal, 0 if none
  bool timed_out = false;
  std::string output;    ///< Everything the child wrote to stdout

  [[nodiscard]] bool success() const noexcept
  {
    return !timed_out && term_signal == 0 && exit_code == 0;
  }

  /// Human-readable reason for a failed run, e.g. "exited with status 3".
  [[nodiscard]] std::string describe_failure() const;
};

/**
 * Spawn argv[0] with the given arguments and wait for it.
 *
 * A child that outlives the timeout is killed with SIGKILL and reported with
 * `timed_out` set.
 *
 * @throws std::system_error if the pipes cannot be created, fork fails or
 *         the executable cannot be executed
 */
[[nodiscard]] ProcessResult run_process(const ProcessOptions & options);

/**
 * Locate an executable.
 *
 * Names containing a '/' are taken as paths. Otherwise `search_dirs` are
 * tried in order, then the directories listed in PATH.
 *
 * @return Path to an executable regular file, or nullopt
 */
[[nodiscard]] std::optional<std::filesystem::path> find_executable(
  const std::string & name, const std::vector<std::filesystem::path> & search_dirs);

}  // namespace hammer
