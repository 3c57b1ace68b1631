#pragma once

#include <yapb/config/config.h>
#include <yapb/tui/ui.h>

namespace yapb {

// Redraws in place by saving the cursor once and restoring it before every
// frame. Stops on SIGINT/SIGTERM (Ctrl+C on Windows).
class PlainUi : public Ui {
public:
  int run(Config& cfg, bool debugMode) override;
};

}  // namespace yapb
