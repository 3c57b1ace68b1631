#include <yapb/platform/config_paths.h>

#include <cstdlib>

namespace yapb::platform {

std::filesystem::path configDirectory() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) {
    return std::filesystem::path(xdg) / "yapb";
  }
  const char* home = std::getenv("HOME");
  if (home && *home) {
    return std::filesystem::path(home) / ".config" / "yapb";
  }
  return std::filesystem::path("yapb");
}

}  // namespace yapb::platform
