#pragma once

#include <memory>

namespace yapb {

struct Config;

class Ui {
public:
  virtual ~Ui() = default;
  // Animates until the configured frame count is reached or the user quits.
  virtual int run(Config& cfg, bool debugMode) = 0;
};

enum class UiBackend {
  Ftxui,  // interactive screen
  Plain,  // raw ANSI cursor save/restore, works on any VT100-ish terminal
};

std::unique_ptr<Ui> makeUi(UiBackend backend);

}  // namespace yapb
