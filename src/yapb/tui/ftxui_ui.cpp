#include <yapb/tui/ftxui_ui.h>

#include <yapb/tui/demo_core.h>
#include <yapb/tui/plain_ui.h>

#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <clocale>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace yapb {

namespace {

constexpr std::uint32_t kRefreshMinMs = 10;
constexpr std::uint32_t kRefreshMaxMs = 5000;

void adjustRefreshMs(Config& cfg, bool faster) {
  const std::uint32_t cur = cfg.refreshMs;
  const std::uint32_t step = std::max<std::uint32_t>(5u, cur / 10u);
  std::uint64_t next = cur;
  if (faster) {
    next = (cur > step) ? (static_cast<std::uint64_t>(cur) - step) : 0ull;
  } else {
    next = static_cast<std::uint64_t>(cur) + step;
  }
  next = std::clamp<std::uint64_t>(next, kRefreshMinMs, kRefreshMaxMs);
  cfg.refreshMs = static_cast<std::uint32_t>(next);
}

}  // namespace

int FtxuiUi::run(Config& cfg, bool debugMode) {
  if (debugMode) {
    std::cerr << "yapb-demo: entering FtxuiUi::run()\n";
    std::cerr.flush();
  }

  std::setlocale(LC_ALL, "");

  std::mutex stateMutex;
  DemoState state = makeDemoState(cfg);
  applyFrame(state, cfg, 0);
  cfg.refreshMs = std::clamp(cfg.refreshMs, kRefreshMinMs, kRefreshMaxMs);

  auto screen = ftxui::ScreenInteractive::FitComponent();

  auto renderer = ftxui::Renderer([&] {
    const int cols = ftxui::Terminal::Size().dimx;

    std::vector<std::string> lines;
    bool paused = false;
    {
      std::lock_guard<std::mutex> lk(stateMutex);
      lines = renderLines(state, cfg, cols);
      paused = state.paused;
    }

    using namespace ftxui;
    Elements rows;
    rows.reserve(lines.size() + 1);
    for (auto& line : lines) {
      rows.push_back(text(std::move(line)));
    }
    rows.push_back(text(paused ? "paused - space resumes, q quits" : "space pauses, +/- speed, q quits") | dim);
    return vbox(std::move(rows));
  });

  auto component = ftxui::CatchEvent(renderer, [&](ftxui::Event event) {
    if (event == ftxui::Event::Custom) {
      return false;
    }
    if (event == ftxui::Event::Character('q') || event == ftxui::Event::Character('Q') ||
        event == ftxui::Event::Escape) {
      screen.Exit();
      return true;
    }
    if (event == ftxui::Event::Character(' ')) {
      std::lock_guard<std::mutex> lk(stateMutex);
      state.paused = !state.paused;
      return true;
    }
    if (event == ftxui::Event::Character('+') || event == ftxui::Event::Character('=')) {
      std::lock_guard<std::mutex> lk(stateMutex);
      adjustRefreshMs(cfg, true);
      return true;
    }
    if (event == ftxui::Event::Character('-') || event == ftxui::Event::Character('_')) {
      std::lock_guard<std::mutex> lk(stateMutex);
      adjustRefreshMs(cfg, false);
      return true;
    }
    return false;
  });

  std::atomic<bool> stopUpdate{false};
  std::thread updateThread([&] {
    const std::uint32_t lastFrame = cfg.frames > 0 ? cfg.frames - 1 : 0;
    while (!stopUpdate) {
      std::uint32_t refreshMs = 0;
      bool done = false;
      {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (!state.paused) {
          if (state.frame >= lastFrame) {
            done = true;
          } else {
            applyFrame(state, cfg, state.frame + 1);
          }
        }
        refreshMs = cfg.refreshMs;
      }

      if (done) {
        if (debugMode) {
          std::cerr << "yapb-demo: reached frame " << lastFrame << ", exiting\n";
        }
        screen.Post(screen.ExitLoopClosure());
        break;
      }

      // Request screen refresh
      screen.PostEvent(ftxui::Event::Custom);

      // Sleep in small slices so quitting stays responsive at slow speeds.
      std::uint32_t remaining = refreshMs;
      while (remaining > 0 && !stopUpdate) {
        const std::uint32_t sliceMs = std::min<std::uint32_t>(remaining, 50);
        std::this_thread::sleep_for(std::chrono::milliseconds(sliceMs));
        remaining -= sliceMs;
      }
    }
  });

  screen.Loop(component);

  stopUpdate = true;
  if (updateThread.joinable()) {
    updateThread.join();
  }

  if (debugMode) {
    std::cerr << "yapb-demo: stopped at frame " << state.frame << "\n";
  }
  return 0;
}

std::unique_ptr<Ui> makeUi(UiBackend backend) {
  if (backend == UiBackend::Plain) {
    return std::make_unique<PlainUi>();
  }
  return std::make_unique<FtxuiUi>();
}

}  // namespace yapb
