// hammer/eval/nix_expr.hpp - Batched evaluation request for the Nix evaluator
//
// All attributes of a run are resolved by one expression. The expression is
// assembled from an EvalRequest; every string that reaches Nix goes through
// nix_string(), so attribute paths never need manual escaping.
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace hammer
{

/// Attribute under which rule overlays attach their reports to a package.
inline constexpr const char * k_default_state_attribute = "__nixpkgs-hammering-state";

/**
 * Everything the evaluator needs to resolve one batch.
 */
struct EvalRequest
{
  /// Package set to import (a directory with default.nix, or a file)
  std::filesystem::path package_set = ".";

  /// Attribute paths, e.g. "python3Packages.requests"
  std::vector<std::string> attributes;

  /// Rule overlays layered onto the package set, in application order
  std::vector<std::filesystem::path> overlays;

  /// Attribute holding `{ reports = [...]; }` on checked packages
  std::string state_attribute = k_default_state_attribute;
};

/**
 * Quote a string as a Nix double-quoted string literal.
 *
 * Escapes backslash, double quote, "${" and control characters.
 */
[[nodiscard]] std::string nix_string(std::string_view text);

/**
 * Split an attribute path into its segments.
 *
 * Segments are separated by '.'; a segment may be double-quoted to contain
 * dots ("pkgs.\"foo.bar\"" -> ["pkgs", "foo.bar"]).
 *
 * @throws std::invalid_argument for empty segments or unterminated quotes
 */
[[nodiscard]] std::vector<std::string> split_attr_path(std::string_view path);

/**
 * Build the Nix expression for a request.
 *
 * The expression evaluates to an attribute set keyed by requested attribute
 * path. Each value is one of
 *
 *   { status = "failed"; }
 *   { status = "not-found"; }
 *   { status = "resolved"; report = [...]; reportFailed = bool;
 *     location = "file:line" | null; outputPath = ... | null; drvPath = ... | null; }
 */
[[nodiscard]] std::string build_eval_expression(const EvalRequest & request);

}  // namespace hammer
