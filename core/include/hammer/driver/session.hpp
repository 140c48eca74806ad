// hammer/driver/session.hpp - One resolve-and-check run
//
// Single entry point for the pipeline. Used by the CLI and by tests.
//
#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "hammer/basic/attribute.hpp"
#include "hammer/basic/bundle.hpp"
#include "hammer/basic/trace.hpp"
#include "hammer/check/external_checks.hpp"
#include "hammer/eval/evaluator.hpp"

namespace hammer
{

// ============================================================================
// Session Options
// ============================================================================

struct SessionOptions
{
  /// Package set to import
  std::filesystem::path package_set = ".";

  /// Attribute paths to check
  std::vector<std::string> attributes;

  /// Directory of rule overlays; each *.nix file is one rule named after its stem
  std::optional<std::filesystem::path> overlay_dir;

  /// Excluded rules: overlays, external checks and built-in notices alike
  std::set<std::string> excluded;

  /// External checks (its `excluded` is filled from the set above)
  CheckConfig checks;
};

// ============================================================================
// Session Result
// ============================================================================

struct SessionResult
{
  /// Merged diagnostics, one key per requested attribute
  DiagnosticBundle bundle;

  /// Attributes that resolved
  std::vector<AttributeDescriptor> descriptors;

  /// Checks that ran, in registration order
  std::vector<std::string> checks;
};

/**
 * List the rule overlays of a directory.
 *
 * @return *.nix files sorted by name, excluding those whose stem is excluded
 */
[[nodiscard]] std::vector<std::filesystem::path> discover_overlays(
  const std::filesystem::path & dir, const std::set<std::string> & excluded);

// ============================================================================
// Session
// ============================================================================

/**
 * Orchestrates one run.
 *
 * The pipeline consists of:
 * 1. Attribute resolution with embedded reports (one evaluator call)
 * 2. Built-in notices
 * 3. External checks
 * 4. Merge in source order
 */
class Session
{
public:
  Session(SessionOptions options, Evaluator & evaluator, Trace & trace);

  /**
   * Run the pipeline.
   *
   * @throws EvaluatorError if the evaluator fails
   * @throws PluginError if an external check fails
   */
  [[nodiscard]] SessionResult run();

private:
  SessionOptions options_;
  Evaluator & evaluator_;
  Trace & trace_;
};

}  // namespace hammer
