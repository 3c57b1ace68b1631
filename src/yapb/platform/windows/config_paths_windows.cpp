#include <yapb/platform/config_paths.h>

#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include <shlobj.h>
#include <objbase.h>

#include <cstdlib>

namespace yapb::platform {

std::filesystem::path configDirectory() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) {
    return std::filesystem::path(xdg) / "yapb";
  }

  PWSTR path = nullptr;
  if (FAILED(SHGetKnownFolderPath(FOLDERID_RoamingAppData, 0, nullptr, &path))) {
    return std::filesystem::path("yapb");
  }
  std::filesystem::path out(path);
  CoTaskMemFree(path);
  return out / "yapb";
}

}  // namespace yapb::platform
