#pragma once

namespace yapb {

// yapb-demo entry point: parses flags, loads the config and runs a UI.
class App {
public:
  int run(int argc, char** argv);
};

}  // namespace yapb
