#include "breathing_cycle.hpp"
#include <algorithm>
#include <stdexcept>

namespace calmroom {

namespace {
constexpr double kMinRadiusRatio = 0.3;
}

void BreathingCycle::start_cycle(const BreathingPattern &pattern,
                                 Clock::time_point now) {
  if (is_running) {
    return;
  }
  if (pattern.inhale < 1 || pattern.hold < 0 || pattern.exhale < 1) {
    throw std::invalid_argument("Invalid breathing pattern");
  }

  current_pattern = pattern;
  is_running = true;
  enter_phase(BreathingPhase::Inhale, now);
  request_redraw();
}

TickResult BreathingCycle::tick(Clock::time_point now) {
  if (!is_running) {
    return TickResult::Stopped;
  }

  const auto duration = duration_of(current_phase);
  double progress = 1.0;
  if (duration.count() > 0) {
    std::chrono::duration<double> elapsed = now - phase_started_at;
    progress = elapsed.count() /
               std::chrono::duration<double>(duration).count();
  }
  // Never move backwards within a phase
  current_progress = std::max(current_progress, std::clamp(progress, 0.0, 1.0));
  request_redraw();

  if (current_progress < 1.0) {
    return TickResult::Continue;
  }

  // Anchor the next phase on the scheduled boundary, not on the tick time,
  // so the period stays inhale + hold + exhale. After a stall longer than a
  // whole period, restart from now rather than replaying missed phases.
  Clock::time_point boundary = phase_started_at + duration;
  if (now - boundary > std::chrono::seconds(current_pattern.period())) {
    boundary = now;
  }
  enter_phase(next_phase(current_phase), boundary);
  return TickResult::PhaseAdvanced;
}

void BreathingCycle::stop() {
  is_running = false;
  current_phase = BreathingPhase::Idle;
  current_progress = 0.0;
  request_redraw();
}

void BreathingCycle::enter_phase(BreathingPhase phase, Clock::time_point start) {
  current_phase = phase;
  current_progress = 0.0;
  phase_started_at = start;
}

std::chrono::seconds BreathingCycle::duration_of(BreathingPhase phase) const {
  switch (phase) {
  case BreathingPhase::Inhale:
    return std::chrono::seconds(current_pattern.inhale);
  case BreathingPhase::Hold:
    return std::chrono::seconds(current_pattern.hold);
  case BreathingPhase::Exhale:
    return std::chrono::seconds(current_pattern.exhale);
  case BreathingPhase::Idle:
    break;
  }
  return std::chrono::seconds(0);
}

void BreathingCycle::request_redraw() {
  if (on_redraw) {
    on_redraw();
  }
}

BreathingPhase next_phase(BreathingPhase phase) {
  switch (phase) {
  case BreathingPhase::Inhale:
    return BreathingPhase::Hold;
  case BreathingPhase::Hold:
    return BreathingPhase::Exhale;
  case BreathingPhase::Exhale:
    return BreathingPhase::Inhale;
  case BreathingPhase::Idle:
    break;
  }
  return BreathingPhase::Idle;
}

double breathing_radius(BreathingPhase phase, double progress,
                        double max_radius) {
  const double min_radius = max_radius * kMinRadiusRatio;
  progress = std::clamp(progress, 0.0, 1.0);
  switch (phase) {
  case BreathingPhase::Inhale:
    return min_radius + (max_radius - min_radius) * progress;
  case BreathingPhase::Hold:
    return max_radius;
  case BreathingPhase::Exhale:
    return max_radius - (max_radius - min_radius) * progress;
  case BreathingPhase::Idle:
    break;
  }
  return min_radius;
}

std::string phase_label(BreathingPhase phase) {
  switch (phase) {
  case BreathingPhase::Inhale:
    return "Breathe in…";
  case BreathingPhase::Hold:
    return "Hold…";
  case BreathingPhase::Exhale:
    return "Breathe out…";
  case BreathingPhase::Idle:
    break;
  }
  return "Tap to start";
}

} // namespace calmroom
