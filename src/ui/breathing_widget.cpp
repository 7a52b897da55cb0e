#include "breathing_widget.hpp"
#include <algorithm>
#include <ftxui/component/event.hpp>
#include <ftxui/dom/canvas.hpp>
#include <ftxui/screen/color.hpp>

namespace calmroom {

BreathingWidget::BreathingWidget(ftxui::ScreenInteractive &screen)
    : screen(screen) {
  cycle.set_redraw_callback(
      [this] { this->screen.PostEvent(ftxui::Event::Custom); });
}

BreathingWidget::~BreathingWidget() { ticker.stop(); }

bool BreathingWidget::start(const BreathingPattern &pattern) {
  if (cycle.running()) {
    return false;
  }
  started_at = BreathingCycle::Clock::now();
  cycle.start_cycle(pattern, started_at);
  ticker.start([this] { screen.Post([this] { on_tick(); }); });
  return true;
}

void BreathingWidget::stop() {
  ticker.stop();
  cycle.stop();
}

std::chrono::steady_clock::duration BreathingWidget::elapsed() const {
  if (!cycle.running()) {
    return std::chrono::steady_clock::duration::zero();
  }
  return BreathingCycle::Clock::now() - started_at;
}

void BreathingWidget::on_tick() {
  if (cycle.tick(BreathingCycle::Clock::now()) == TickResult::Stopped) {
    ticker.stop();
  }
}

ftxui::Element BreathingWidget::Render() const {
  using namespace ftxui;

  const int center = kCanvasSize / 2;
  const double max_r = kCanvasSize / 2.0 - 8;
  const int r = static_cast<int>(
      breathing_radius(cycle.phase(), cycle.progress(), max_r));

  Canvas c(kCanvasSize, kCanvasSize);
  // Outer glow
  c.DrawPointCircle(center, center, r + 5, Color::RGB(60, 110, 140));
  // Main circle
  c.DrawPointCircleFilled(center, center, r, Color::RGB(102, 178, 230));
  // Inner circle
  c.DrawPointCircleFilled(center, center, std::max(1, r * 6 / 10),
                          Color::RGB(128, 204, 255));

  return vbox({
      canvas(std::move(c)) | hcenter,
      text(phase_label(cycle.phase())) | bold | hcenter,
  });
}

} // namespace calmroom
