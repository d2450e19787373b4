// include/sx/core/types.hpp
#pragma once

#include <cstdint>
#include <string>

namespace sx {

// -----------------------------
// Basic identifiers
// -----------------------------

using SessionId = std::string;  // UUID v4 text form unless configured

// -----------------------------
// Time
// -----------------------------
// Timestamps are seconds as double. Live sources use the wall clock (epoch seconds),
// replay sources use whatever the recorded file uses. Ordering is "mostly monotonic".

using Seconds = double;

// -----------------------------
// Interaction events (timing only, never content)
// -----------------------------

enum class EventKind : std::uint8_t {
  kKeyPress,
  kKeyRelease,
  kMouseMove,
  kMouseClick,
  kMouseScroll,
  kFocusLost,
  kFocusGained,
  kIdlePeriod,
  kIdleEnd,
};

// Stable lowercase names ("key_press", "idle_period", ...). Used by replay files and telemetry.
const char* event_kind_name(EventKind kind) noexcept;
bool parse_event_kind(const std::string& name, EventKind* out);

struct InteractionEvent {
  Seconds timestamp = 0.0;
  EventKind kind = EventKind::kKeyPress;

  // Mouse events: screen position in pixels.
  std::int32_t x = 0;
  std::int32_t y = 0;

  // Idle events: idle duration in seconds.
  Seconds duration = 0.0;

  // Focus events: true when focus was lost.
  bool focus_lost = false;

  static InteractionEvent key_press(Seconds t) { return InteractionEvent{t, EventKind::kKeyPress}; }
  static InteractionEvent key_release(Seconds t) { return InteractionEvent{t, EventKind::kKeyRelease}; }

  static InteractionEvent mouse(EventKind kind, Seconds t, std::int32_t x, std::int32_t y) {
    InteractionEvent e{t, kind};
    e.x = x;
    e.y = y;
    return e;
  }

  static InteractionEvent focus(Seconds t, bool lost) {
    InteractionEvent e{t, lost ? EventKind::kFocusLost : EventKind::kFocusGained};
    e.focus_lost = lost;
    return e;
  }

  static InteractionEvent idle(Seconds t, Seconds duration, bool ended = false) {
    InteractionEvent e{t, ended ? EventKind::kIdleEnd : EventKind::kIdlePeriod};
    e.duration = duration;
    return e;
  }
};

// -----------------------------
// Aggregates
// -----------------------------

// Snapshot over one sliding window. Produced fresh per query.
struct FeatureVector {
  double avg_typing_speed = 0.0;    // key presses per minute
  double avg_idle_duration = 0.0;   // seconds per idle period
  int focus_loss_count = 0;
  double avg_mouse_speed = 0.0;     // pixels per second
  double inter_key_interval = 0.0;  // seconds between consecutive presses
  int key_press_count = 0;
  Seconds window_start = 0.0;
  Seconds window_end = 0.0;

  [[nodiscard]] Seconds window_length() const noexcept { return window_end - window_start; }
};

// Frozen reference profile for one session.
struct BaselineProfile {
  double avg_typing_speed = 0.0;   // keys/min
  double avg_idle_duration = 0.0;  // seconds
  double avg_focus_rate = 0.0;     // focus losses per minute
};

// Per-rule scores in [0,100]; overall is the max of the three.
struct AnomalyScores {
  double idle_burst = 0.0;
  double focus_instability = 0.0;
  double behavioral_drift = 0.0;
  double overall = 0.0;
};

// Boundary record handed to the report sink once per reporting interval.
struct RiskReport {
  Seconds timestamp = 0.0;
  double risk_score = 0.0;
  AnomalyScores anomaly_scores;
  SessionId session_id;
  std::string source = "sentinelx-client";
};

}  // namespace sx
