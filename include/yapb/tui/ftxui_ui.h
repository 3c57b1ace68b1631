#pragma once

#include <yapb/config/config.h>
#include <yapb/tui/ui.h>

namespace yapb {

class FtxuiUi : public Ui {
public:
  int run(Config& cfg, bool debugMode) override;
};

}  // namespace yapb
