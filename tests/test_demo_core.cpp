#include <yapb/tui/demo_core.h>

#include "test_framework.h"

TEST_CASE("makeDemoState keeps only enabled spinners in display order") {
  yapb::Config cfg;
  cfg.showSpinner8 = false;
  const yapb::DemoState state = yapb::makeDemoState(cfg);

  REQUIRE(state.spinners.size() == 4);
  REQUIRE(state.spinners[0].kind == yapb::SpinnerKind::Spinner4);
  REQUIRE(state.spinners[1].kind == yapb::SpinnerKind::Counter16);
  REQUIRE(state.spinners[3].kind == yapb::SpinnerKind::Snake);
  REQUIRE(state.rate.alpha() == cfg.rateAlpha);
}

TEST_CASE("Spinners are fed at different speeds") {
  REQUIRE(yapb::spinnerStateForFrame(yapb::SpinnerKind::Spinner4, 9) == 2);
  REQUIRE(yapb::spinnerStateForFrame(yapb::SpinnerKind::Counter16, 9) == 2);
  REQUIRE(yapb::spinnerStateForFrame(yapb::SpinnerKind::Spinner8, 9) == 4);
  REQUIRE(yapb::spinnerStateForFrame(yapb::SpinnerKind::Counter256, 9) == 4);
  REQUIRE(yapb::spinnerStateForFrame(yapb::SpinnerKind::Snake, 9) == 9);
  REQUIRE(yapb::spinnerStateForFrame(static_cast<yapb::SpinnerKind>(99), 9) == 9);
}

TEST_CASE("applyFrame moves the bar and the rate") {
  yapb::Config cfg;
  cfg.frames = 4;
  yapb::DemoState state = yapb::makeDemoState(cfg);

  yapb::applyFrame(state, cfg, 1);
  REQUIRE(state.frame == 1);
  REQUIRE(state.bar.get() == 0.25f);
  REQUIRE(state.rateSample == yapb::simulatedRate(1));
  REQUIRE(state.rate.get() == Approx(cfg.rateAlpha * yapb::simulatedRate(1)));
}

TEST_CASE("simulatedRate stays positive") {
  for (std::uint32_t f = 0; f < 2000; ++f) {
    REQUIRE(yapb::simulatedRate(f) > 0.0);
  }
}

TEST_CASE("barWidthFor leaves the margin and never underflows") {
  yapb::Config cfg;
  cfg.barMargin = 12;
  REQUIRE(yapb::barWidthFor(cfg, 80) == 68);
  REQUIRE(yapb::barWidthFor(cfg, 12) == 0);
  REQUIRE(yapb::barWidthFor(cfg, 5) == 0);
}

TEST_CASE("renderLines draws the indicator line and the rate line") {
  yapb::Config cfg;
  cfg.showSpinner4 = false;
  cfg.showSpinner8 = false;
  cfg.showCounter16 = false;
  cfg.showCounter256 = false;
  cfg.barMargin = 6;
  cfg.fill = '.';
  yapb::DemoState state = yapb::makeDemoState(cfg);
  yapb::applyFrame(state, cfg, 0);

  const auto lines = yapb::renderLines(state, cfg, 10);
  REQUIRE(lines.size() == 2);
  REQUIRE(lines[0] == "\xE2\xA3\xA7 [....]");
  REQUIRE(lines[1] == "progress 0.00%  rate 410 KiB/s (3.36 Mbit/s)");
}

TEST_CASE("renderLines with everything hidden is empty") {
  yapb::Config cfg;
  cfg.showSpinner4 = cfg.showSpinner8 = cfg.showCounter16 = cfg.showCounter256 = cfg.showSnake = false;
  cfg.showBar = false;
  cfg.showRate = false;
  const yapb::DemoState state = yapb::makeDemoState(cfg);
  REQUIRE(yapb::renderLines(state, cfg, 80).empty());
}
