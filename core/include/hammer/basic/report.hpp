// hammer/basic/report.hpp - Diagnostic types shared by every stage
//
// A Diagnostic (a "report") is one rule violation or informational notice
// about a single attribute of the package set.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hammer
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Notice,
  Warning,
  Error,
};

/// Lowercase name used in JSON and terminal output ("notice", "warning", "error").
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

/// Parse a lowercase severity name.
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text) noexcept;

/**
 * Position in a build-definition source file (1-indexed).
 */
struct SourceLocation
{
  std::filesystem::path file;
  uint32_t line = 0;
  std::optional<uint32_t> column;

  [[nodiscard]] bool operator==(const SourceLocation & other) const
  {
    return file == other.file && line == other.line && column == other.column;
  }
  [[nodiscard]] bool operator!=(const SourceLocation & other) const { return !(*this == other); }
};

/**
 * Parse a "file:line[:column]" position string.
 *
 * The file part may itself contain colons; line and column are the trailing
 * numeric components. Returns nullopt for anything else.
 */
[[nodiscard]] std::optional<SourceLocation> parse_position(std::string_view position);

struct Diagnostic
{
  std::string name;     // rule identifier, e.g. "unused-dependency"
  std::string message;
  std::vector<SourceLocation> locations;
  Severity severity = Severity::Warning;
  bool has_documentation_link = true;
};

/// Base of the documentation URLs built from rule names.
inline constexpr std::string_view k_documentation_base_url =
  "https://github.com/jtojnar/nixpkgs-hammering/blob/master/explanations/";

/**
 * Documentation URL for a diagnostic, or nullopt when it carries no link.
 */
[[nodiscard]] std::optional<std::string> documentation_url(const Diagnostic & diag);

// ============================================================================
// Reserved Rule Names
// ============================================================================

/// Attribute could not be evaluated.
inline constexpr const char * k_eval_error_rule = "EvalError";

/// Attribute path does not exist in the package set.
inline constexpr const char * k_attr_path_not_found_rule = "AttrPathNotFound";

/// Attribute has no build output on disk.
inline constexpr const char * k_no_build_output_rule = "no-build-output";

// ============================================================================
// ReportBuilder
// ============================================================================

/**
 * Fluent construction of a Diagnostic.
 *
 *   auto d = ReportBuilder("EvalError", Severity::Warning).message(msg).without_link().build();
 */
class ReportBuilder
{
public:
  ReportBuilder(std::string name, Severity severity);

  ReportBuilder & message(std::string text);
  ReportBuilder & at(SourceLocation location);
  ReportBuilder & without_link();

  [[nodiscard]] Diagnostic build();

private:
  Diagnostic diagnostic_;
};

}  // namespace hammer
