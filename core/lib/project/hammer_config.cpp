// hammer/project/hammer_config.cpp - Configuration file implementation
//
#include "hammer/project/hammer_config.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

namespace hammer
{

namespace
{

namespace fs = std::filesystem;

fs::path resolve_relative(const fs::path & root, const std::string & value)
{
  const fs::path p(value);
  if (p.is_absolute()) {
    return p;
  }
  return (root / p).lexically_normal();
}

/// Parse a list of strings; `error` is set when the node is not a sequence
std::optional<std::vector<std::string>> parse_string_list(
  const YAML::Node & node, const char * key, std::string & error)
{
  if (!node.IsSequence()) {
    error = std::string(key) + " must be a list";
    return std::nullopt;
  }
  std::vector<std::string> out;
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return out;
}

}  // namespace

ConfigLoadResult load_hammer_config(const fs::path & config_path)
{
  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  HammerConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail(config_path.string() + ": top level must be a map");
  }

  try {
    if (root["nixpkgs"]) {
      config.nixpkgs = resolve_relative(config.project_root, root["nixpkgs"].as<std::string>());
    }

    if (root["overlays"]) {
      config.overlays = resolve_relative(config.project_root, root["overlays"].as<std::string>());
    }

    if (root["exclude"]) {
      std::string error;
      auto exclude = parse_string_list(root["exclude"], "exclude", error);
      if (!exclude) {
        return ConfigLoadResult::fail(error);
      }
      config.exclude = std::move(*exclude);
    }

    if (root["evaluator"]) {
      config.evaluator = root["evaluator"].as<std::string>();
    }

    // Parse 'checks' section
    if (root["checks"]) {
      const auto & checks = root["checks"];
      if (!checks.IsMap()) {
        return ConfigLoadResult::fail("checks must be a map");
      }

      std::string error;
      if (checks["names"]) {
        auto names = parse_string_list(checks["names"], "checks.names", error);
        if (!names) {
          return ConfigLoadResult::fail(error);
        }
        config.checks.names = std::move(*names);
      }

      if (checks["path"]) {
        auto dirs = parse_string_list(checks["path"], "checks.path", error);
        if (!dirs) {
          return ConfigLoadResult::fail(error);
        }
        for (const auto & dir : *dirs) {
          config.checks.path.push_back(resolve_relative(config.project_root, dir));
        }
      }

      if (checks["jobs"]) {
        config.checks.jobs = checks["jobs"].as<unsigned>();
      }

      if (checks["timeout"]) {
        config.checks.timeout = checks["timeout"].as<unsigned>();
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<fs::path> find_hammer_config(const fs::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace hammer
