#include <yapb/tui/plain_ui.h>

#include <yapb/tui/demo_core.h>

#include <ftxui/screen/terminal.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

#if defined(_WIN32)
  #include <windows.h>
#endif

namespace yapb {

namespace {

// ANSI/VT100 sequences.
constexpr const char* kCursorSave = "\x1b[s";
constexpr const char* kCursorRestore = "\x1b[u";
constexpr const char* kClearAfterCursor = "\x1b[J";

// Cleared on Ctrl+C
volatile std::sig_atomic_t g_running = 1;

#if defined(_WIN32)
BOOL WINAPI consoleHandler(DWORD signal) {
  if (signal == CTRL_C_EVENT || signal == CTRL_BREAK_EVENT) {
    g_running = 0;
    return TRUE;
  }
  return FALSE;
}
#else
void signalHandler(int) {
  g_running = 0;
}
#endif

}  // namespace

int PlainUi::run(Config& cfg, bool debugMode) {
#if defined(_WIN32)
  SetConsoleCtrlHandler(consoleHandler, TRUE);
#else
  struct sigaction sa{};
  sa.sa_handler = signalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
#endif
  g_running = 1;

  if (debugMode) {
    std::cerr << "yapb-demo: plain loop, " << cfg.frames << " frames every " << cfg.refreshMs << "ms\n";
  }

  DemoState state = makeDemoState(cfg);
  const auto interval = std::chrono::milliseconds(std::clamp<std::uint32_t>(cfg.refreshMs, 10, 5000));

  std::cout << kCursorSave;
  std::string frameText;
  for (std::uint32_t frame = 0; frame < cfg.frames && g_running; ++frame) {
    applyFrame(state, cfg, frame);

    const int cols = ftxui::Terminal::Size().dimx;
    frameText.clear();
    frameText += kCursorRestore;
    frameText += kClearAfterCursor;
    bool first = true;
    for (const auto& line : renderLines(state, cfg, cols)) {
      if (!first) frameText.push_back('\n');
      frameText += line;
      first = false;
    }

    std::cout << frameText;
    std::cout.flush();
    if (!std::cout) {
      std::cerr << "Error: failed to write to stdout.\n";
      return 1;
    }

    std::this_thread::sleep_for(interval);
  }

  std::cout << "\n";
  if (debugMode) {
    std::cerr << "yapb-demo: stopped at frame " << state.frame << "\n";
  }
  return std::cout ? 0 : 1;
}

}  // namespace yapb
