// hammer/driver/overlay_finder.cpp - Rule overlay auto-detection
//
#include "hammer/driver/overlay_finder.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace hammer
{

std::optional<fs::path> find_overlay_dir()
{
  // Installed share directory first
#ifdef HAMMER_OVERLAY_INSTALL_PATH
  {
    fs::path installed = HAMMER_OVERLAY_INSTALL_PATH;
    std::error_code ec;
    if (fs::is_directory(installed, ec)) {
      return installed;
    }
  }
#endif

  // <prefix>/bin/hammer -> <prefix>/share/hammer/overlays, or a build tree beside <project>/overlays
  std::error_code ec;
  const auto exe_path = fs::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return std::nullopt;
  }
  const auto bin_dir = exe_path.parent_path();

  for (const auto & candidate :
       {bin_dir / ".." / "share" / "hammer" / "overlays", bin_dir / ".." / "overlays"}) {
    if (fs::is_directory(candidate, ec)) {
      auto dir = fs::canonical(candidate, ec);
      if (!ec) {
        return dir;
      }
    }
  }

  return std::nullopt;
}

}  // namespace hammer
