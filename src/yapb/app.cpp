#include <yapb/app.h>

#include <yapb/config/config.h>
#include <yapb/snapshot/snapshot.h>
#include <yapb/tui/demo_core.h>
#include <yapb/tui/ui.h>
#include <yapb/version.h>

#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace yapb {

static constexpr const char* kAppDisplayName = "yapb-demo";

// Bar width used by --snapshot when no terminal is involved.
static constexpr int kSnapshotCols = 80;

static bool hasFlag(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] && std::string_view(argv[i]) == flag) return true;
  }
  return false;
}

static void printHelp(std::ostream& os) {
  os << "yapb-demo - progress bars, spinners and compact numbers in the terminal\n"
        "\n"
        "Usage:\n"
        "  yapb-demo [--debug] [--plain] [--frames N] [--interval MS]\n"
        "  yapb-demo --snapshot [--step N]\n"
        "\n"
        "Options:\n"
        "  --debug        Log diagnostics to stderr\n"
        "  --help, -h     Show this help and exit\n"
        "  --version      Print version and exit\n"
        "  --plain        Redraw with raw ANSI cursor save/restore instead of the interactive screen\n"
        "  --frames N     Number of frames to animate (default from config, 1000)\n"
        "  --interval MS  Delay between frames (default from config, 50)\n"
        "  --snapshot     Print every indicator at one frame as JSON and exit\n"
        "  --step N       Frame for --snapshot (default 0)\n"
        "  --save-config  Write the effective settings to the config file and exit\n"
        "\n"
        "Config file: "
     << Config::path() << "\n";
}

static std::optional<std::string_view> flagValue(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    if (!argv[i]) continue;
    const std::string_view a(argv[i]);
    if (a == flag) {
      if (i + 1 < argc && argv[i + 1]) return std::string_view(argv[i + 1]);
      return std::nullopt;
    }
    if (a.rfind(flag, 0) == 0 && a.size() > flag.size() && a[flag.size()] == '=') {
      return a.substr(flag.size() + 1);
    }
  }
  return std::nullopt;
}

// Reports bad input on stderr and leaves `out` untouched.
static bool parseU32Flag(int argc, char** argv, std::string_view flag, std::uint32_t& out) {
  const auto val = flagValue(argc, argv, flag);
  if (!val) {
    if (hasFlag(argc, argv, flag)) {
      std::cerr << "Error: " << flag << " needs a value.\n";
      return false;
    }
    return true;
  }
  try {
    const unsigned long long n = std::stoull(std::string(*val));
    if (n > 0xFFFFFFFFull) throw std::out_of_range("u32");
    out = static_cast<std::uint32_t>(n);
    return true;
  } catch (const std::exception&) {
    std::cerr << "Error: invalid value '" << *val << "' for " << flag << ".\n";
    return false;
  }
}

int App::run(int argc, char** argv) {
  if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
    printHelp(std::cout);
    return 0;
  }

  if (hasFlag(argc, argv, "--version")) {
    std::cout << kAppDisplayName << " " << YAPB_VERSION << "\n";
    std::cout << YAPB_WEBSITE << "\n";
    return 0;
  }

  const bool debugMode = hasFlag(argc, argv, "--debug");
  Config config = Config::load();
  if (debugMode) {
    std::cerr << "yapb-demo: config " << Config::path() << "\n";
  }

  if (!parseU32Flag(argc, argv, "--frames", config.frames)) return 1;
  if (!parseU32Flag(argc, argv, "--interval", config.refreshMs)) return 1;
  if (config.frames == 0) {
    std::cerr << "Error: --frames must be at least 1.\n";
    return 1;
  }

  if (hasFlag(argc, argv, "--save-config")) {
    try {
      config.save();
    } catch (const std::exception& e) {
      std::cerr << "Error: could not write " << Config::path() << ": " << e.what() << "\n";
      return 1;
    }
    std::cout << "Saved " << Config::path() << "\n";
    return 0;
  }

  if (hasFlag(argc, argv, "--snapshot")) {
    std::uint32_t step = 0;
    if (!parseU32Flag(argc, argv, "--step", step)) return 1;
    if (step >= config.frames) {
      std::cerr << "Error: --step must be below the frame count (" << config.frames << ").\n";
      return 1;
    }

    const auto snapshot = captureSnapshot(config, step, barWidthFor(config, kSnapshotCols));
    std::cout << snapshotToJson(snapshot) << "\n";
    return std::cout ? 0 : 1;
  }

  const UiBackend backend = hasFlag(argc, argv, "--plain") ? UiBackend::Plain : UiBackend::Ftxui;
  if (debugMode) {
    std::cerr << "yapb-demo: debug mode enabled\n";
    std::cerr << "yapb-demo: creating " << (backend == UiBackend::Plain ? "plain" : "ftxui") << " UI...\n";
    std::cerr.flush();
  }

  auto ui = makeUi(backend);
  return ui->run(config, debugMode);
}

}  // namespace yapb
