#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace calmroom {

// Breathing durations in seconds
struct BreathingPattern {
  int inhale = 4;
  int hold = 4;
  int exhale = 6;

  int period() const { return inhale + hold + exhale; }
};

enum class BreathingPhase { Idle, Inhale, Hold, Exhale };

enum class TickResult {
  Stopped,       // not running, the scheduler can stop ticking
  Continue,      // still inside the current phase
  PhaseAdvanced, // progress reached 1.0 and the next phase began
};

// Inhale -> Hold -> Exhale -> Inhale ... until stop(). Time is passed in by
// the caller so any periodic scheduler, or a test, can drive it.
class BreathingCycle {
public:
  using Clock = std::chrono::steady_clock;

  // No-op when already running. Throws std::invalid_argument when inhale or
  // exhale is shorter than a second or hold is negative.
  void start_cycle(const BreathingPattern &pattern, Clock::time_point now);
  void start_cycle(int inhale_s, int hold_s, int exhale_s,
                   Clock::time_point now) {
    start_cycle(BreathingPattern{inhale_s, hold_s, exhale_s}, now);
  }

  TickResult tick(Clock::time_point now);
  void stop();

  BreathingPhase phase() const { return current_phase; }
  double progress() const { return current_progress; }
  bool running() const { return is_running; }
  const BreathingPattern &pattern() const { return current_pattern; }
  Clock::time_point phase_start() const { return phase_started_at; }

  void set_redraw_callback(std::function<void()> callback) {
    on_redraw = std::move(callback);
  }

private:
  void enter_phase(BreathingPhase phase, Clock::time_point start);
  std::chrono::seconds duration_of(BreathingPhase phase) const;
  void request_redraw();

  BreathingPattern current_pattern;
  BreathingPhase current_phase = BreathingPhase::Idle;
  double current_progress = 0.0;
  bool is_running = false;
  Clock::time_point phase_started_at{};
  std::function<void()> on_redraw;
};

BreathingPhase next_phase(BreathingPhase phase);

// Radius of the breathing circle, min radius is 30% of max
double breathing_radius(BreathingPhase phase, double progress,
                        double max_radius);

std::string phase_label(BreathingPhase phase);

} // namespace calmroom
