// hammer/basic/attribute.hpp - Resolved attribute metadata
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "hammer/basic/report.hpp"

namespace hammer
{

/**
 * One resolved attribute of the package set.
 *
 * Identity is `name`; a run never holds two descriptors with the same name.
 */
struct AttributeDescriptor
{
  /// Attribute path as requested, e.g. "python3Packages.requests"
  std::string name;

  /// Declared source position (meta.position)
  std::optional<SourceLocation> location;

  /// Path to the build plan (.drv), when it could be computed
  std::optional<std::filesystem::path> build_plan_path;

  /// Path to the build output, only set when it existed at resolution time
  std::optional<std::filesystem::path> artifact_path;
};

}  // namespace hammer
