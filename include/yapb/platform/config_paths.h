#pragma once

#include <filesystem>

namespace yapb::platform {

// Per-user directory holding config.ini.
std::filesystem::path configDirectory();

}  // namespace yapb::platform
