// hammer/check/external_checks.hpp - External check protocol
//
// External checks are executables that need the resolved attributes (and
// possibly their build outputs). Each one is run once per batch:
//
//   stdin   JSON array of attribute records   [{"name", "location"?, "drv"?, "output"?}]
//   stdout  JSON object                       {attr name: [report]}  (or nothing)
//
// A check that exits non-zero, times out or writes anything else aborts the
// whole run.
//
#pragma once

#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "hammer/basic/attribute.hpp"
#include "hammer/basic/bundle.hpp"
#include "hammer/basic/trace.hpp"

namespace hammer
{

// ============================================================================
// Configuration
// ============================================================================

/**
 * External check configuration, assembled once by the CLI layer.
 */
struct CheckConfig
{
  /// Check identifiers (executable names or paths)
  std::vector<std::string> checks;

  /// Directories searched for check executables before PATH
  std::vector<std::filesystem::path> search_dirs;

  /// Excluded rule names; applies to checks and to built-in notices
  std::set<std::string> excluded;

  /// Maximum number of checks running at once; 0 picks the CPU count
  unsigned jobs = 0;

  /// Per-check wall-clock limit; zero waits forever
  std::chrono::seconds timeout{0};
};

/**
 * Split a colon-separated list of check names ("a:b:c"), dropping empty
 * entries.
 */
[[nodiscard]] std::vector<std::string> parse_check_list(std::string_view list);

/**
 * Checks in registration order: sorted by identifier, without duplicates and
 * without excluded names.
 */
[[nodiscard]] std::vector<std::string> registration_order(const CheckConfig & config);

// ============================================================================
// Built-in notices
// ============================================================================

/**
 * Notices computed without running any check.
 *
 * Unless `no-build-output` is excluded, every attribute without a build
 * output gets a notice that output-dependent checks were skipped.
 */
[[nodiscard]] DiagnosticBundle builtin_notices(
  const std::vector<AttributeDescriptor> & attrs, const std::set<std::string> & excluded);

// ============================================================================
// ExternalCheckRunner
// ============================================================================

/// Diagnostics contributed by one check.
struct CheckRun
{
  std::string check;
  DiagnosticBundle bundle;
};

class ExternalCheckRunner
{
public:
  ExternalCheckRunner(CheckConfig config, Trace & trace);

  /**
   * Run every registered check on `attrs`.
   *
   * Checks run concurrently; the result is in registration order no matter
   * which check finished first.
   *
   * @throws PluginError for the first failing check in registration order
   */
  [[nodiscard]] std::vector<CheckRun> run(const std::vector<AttributeDescriptor> & attrs) const;

  /**
   * Run a single check with an already encoded payload.
   *
   * @param known Attribute names the check may report on
   * @throws PluginError on any protocol violation
   */
  [[nodiscard]] DiagnosticBundle run_check(
    const std::string & check, const std::string & payload,
    const std::unordered_set<std::string> & known) const;

  /// Checks that run() will execute, in order.
  [[nodiscard]] const std::vector<std::string> & checks() const noexcept { return order_; }

private:
  [[nodiscard]] unsigned worker_count(size_t tasks) const;

  CheckConfig config_;
  std::vector<std::string> order_;
  Trace & trace_;
};

}  // namespace hammer
