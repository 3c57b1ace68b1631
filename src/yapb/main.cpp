#include <yapb/app.h>

int main(int argc, char** argv) {
  yapb::App app;
  return app.run(argc, argv);
}
