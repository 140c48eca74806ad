// hammer/project/hammer_config.hpp - Project configuration (hammer.yaml)
//
// Parses and validates hammer.yaml. Command-line flags are applied on top
// by the CLI.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hammer
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * External check section.
 */
struct ChecksConfig
{
  /// Check identifiers
  std::vector<std::string> names;

  /// Extra directories searched for check executables
  std::vector<std::filesystem::path> path;

  /// Maximum number of concurrent checks (0 = CPU count)
  std::optional<unsigned> jobs;

  /// Per-check timeout in seconds (0 = none)
  std::optional<unsigned> timeout;
};

/**
 * Complete configuration file.
 */
struct HammerConfig
{
  /// Package set to import
  std::optional<std::filesystem::path> nixpkgs;

  /// Directory of rule overlays (*.nix)
  std::optional<std::filesystem::path> overlays;

  /// Rules excluded by default
  std::vector<std::string> exclude;

  ChecksConfig checks;

  /// Evaluator executable
  std::optional<std::string> evaluator;

  /// Directory containing hammer.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  HammerConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(HammerConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration from a hammer.yaml file.
 *
 * Relative paths in the file are resolved against its directory.
 *
 * @param config_path Path to hammer.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_hammer_config(const std::filesystem::path & config_path);

/**
 * Find a configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to hammer.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_hammer_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the configuration file.
 */
inline constexpr const char * k_config_file_name = "hammer.yaml";

}  // namespace hammer
