#pragma once

#include "../breathing/breathing_cycle.hpp"
#include "../common/ticker.hpp"
#include <chrono>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

namespace calmroom {

// Pulsing breathing circle. The ticker thread only posts onto the screen
// loop; the cycle itself is touched from the loop alone.
class BreathingWidget {
public:
  static constexpr std::chrono::milliseconds kTickInterval{30};
  static constexpr int kCanvasSize = 100;

  explicit BreathingWidget(ftxui::ScreenInteractive &screen);
  ~BreathingWidget();

  BreathingWidget(const BreathingWidget &) = delete;
  BreathingWidget &operator=(const BreathingWidget &) = delete;

  // False when a cycle was already running
  bool start(const BreathingPattern &pattern);
  void stop();

  bool running() const { return cycle.running(); }
  std::chrono::steady_clock::duration elapsed() const;

  ftxui::Element Render() const;

private:
  void on_tick();

  ftxui::ScreenInteractive &screen;
  BreathingCycle cycle;
  Ticker ticker{kTickInterval};
  std::chrono::steady_clock::time_point started_at{};
};

} // namespace calmroom
