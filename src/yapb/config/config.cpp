#include <yapb/config/config.h>

#include <yapb/platform/config_paths.h>

#include <cctype>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace yapb {

static fs::path configPath() {
  return platform::configDirectory() / "config.ini";
}

static bool parseBool(std::string v, bool fallback) {
  for (char& c : v) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
  if (v == "0" || v == "false" || v == "no" || v == "off") return false;
  return fallback;
}

// Malformed or out-of-range numbers keep the current value.
static std::uint32_t parseU32(const std::string& v, std::uint32_t fallback) {
  try {
    const unsigned long long n = std::stoull(v);
    if (n > 0xFFFFFFFFull) return fallback;
    return static_cast<std::uint32_t>(n);
  } catch (const std::exception&) {
    return fallback;
  }
}

static double parseAlpha(const std::string& v, double fallback) {
  try {
    const double a = std::stod(v);
    if (!(a > 0.0 && a <= 1.0)) return fallback;
    return a;
  } catch (const std::exception&) {
    return fallback;
  }
}

bool Config::shows(SpinnerKind kind) const {
  switch (kind) {
    case SpinnerKind::Spinner4:
      return showSpinner4;
    case SpinnerKind::Spinner8:
      return showSpinner8;
    case SpinnerKind::Counter16:
      return showCounter16;
    case SpinnerKind::Counter256:
      return showCounter256;
    case SpinnerKind::Snake:
      return showSnake;
  }
  return false;
}

Config Config::load() {
  Config cfg;

  std::ifstream in(configPath());
  if (!in.is_open()) {
    return cfg;
  }

  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || line[0] == '#') continue;
    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    const std::string key = line.substr(0, eq);
    const std::string val = line.substr(eq + 1);

    if (key == "showSpinner4") cfg.showSpinner4 = parseBool(val, cfg.showSpinner4);
    else if (key == "showSpinner8") cfg.showSpinner8 = parseBool(val, cfg.showSpinner8);
    else if (key == "showCounter16") cfg.showCounter16 = parseBool(val, cfg.showCounter16);
    else if (key == "showCounter256") cfg.showCounter256 = parseBool(val, cfg.showCounter256);
    else if (key == "showSnake") cfg.showSnake = parseBool(val, cfg.showSnake);
    else if (key == "showBar") cfg.showBar = parseBool(val, cfg.showBar);
    else if (key == "showRate") cfg.showRate = parseBool(val, cfg.showRate);
    else if (key == "refreshMs") cfg.refreshMs = parseU32(val, cfg.refreshMs);
    else if (key == "frames") cfg.frames = parseU32(val, cfg.frames);
    else if (key == "barMargin") cfg.barMargin = parseU32(val, cfg.barMargin);
    else if (key == "fill") {
      // Taken verbatim so that "fill= " selects a space.
      if (!val.empty()) cfg.fill = val[0];
    }
    else if (key == "rateAlpha") cfg.rateAlpha = parseAlpha(val, cfg.rateAlpha);
  }

  return cfg;
}

std::string Config::path() {
  return configPath().string();
}

void Config::save() const {
  const fs::path path = configPath();
  fs::create_directories(path.parent_path());

  std::ofstream out(path);
  out << "# yapb-demo config\n";
  out << "showSpinner4=" << (showSpinner4 ? "true" : "false") << "\n";
  out << "showSpinner8=" << (showSpinner8 ? "true" : "false") << "\n";
  out << "showCounter16=" << (showCounter16 ? "true" : "false") << "\n";
  out << "showCounter256=" << (showCounter256 ? "true" : "false") << "\n";
  out << "showSnake=" << (showSnake ? "true" : "false") << "\n";
  out << "showBar=" << (showBar ? "true" : "false") << "\n";
  out << "showRate=" << (showRate ? "true" : "false") << "\n";
  out << "refreshMs=" << refreshMs << "\n";
  out << "frames=" << frames << "\n";
  out << "barMargin=" << barMargin << "\n";
  out << "fill=" << fill << "\n";
  out << "rateAlpha=" << rateAlpha << "\n";
}

}  // namespace yapb
