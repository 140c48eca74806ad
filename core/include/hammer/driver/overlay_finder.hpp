// hammer/driver/overlay_finder.hpp - Rule overlay auto-detection
//
// Locates the directory of rule overlays shipped with hammer.
//
#pragma once

#include <filesystem>
#include <optional>

namespace hammer
{

/**
 * Try to find the bundled rule overlays in standard locations.
 *
 * Search order:
 * 1. Installed path (from cmake install, HAMMER_OVERLAY_INSTALL_PATH)
 * 2. Relative to executable: <prefix>/share/hammer/overlays/
 * 3. Development layout: <build>/../overlays/
 *
 * @return Path to the overlay directory, or nullopt if not found
 */
[[nodiscard]] std::optional<std::filesystem::path> find_overlay_dir();

}  // namespace hammer
