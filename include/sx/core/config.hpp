// include/sx/core/config.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "sx/core/status.hpp"
#include "sx/core/types.hpp"

namespace sx {

// Units policy:
// - Time in seconds (double), matching event timestamps
// - Typing speed in keys/min, focus rate in losses/min, mouse speed in px/s
// - Scores in [0,100]

// -----------------------------
// Sliding window
// -----------------------------
struct FeaturesConfig {
  // Trailing window the extractor aggregates over.
  Seconds window_s = 30.0;
};

// -----------------------------
// Baseline calibration
// -----------------------------
struct BaselineConfig {
  // How long we "learn normal" before forcing the baseline.
  Seconds calibration_s = 180.0;

  // Early convergence needs this many samples...
  int min_samples = 5;
  // ...and at least this fraction of calibration_s elapsed.
  double early_fraction = 0.5;

  // With no typing evidence at all, calibrate on every sample once we have this many.
  int fallback_min_samples = 10;

  // "Has typing data": any sample above either threshold.
  double typing_speed_evidence = 5.0;
  int key_press_evidence = 2;

  // Used when calibration times out with an empty history.
  BaselineProfile fallback{150.0, 2.0, 0.5};
};

// -----------------------------
// Activity shift rules
// -----------------------------
struct DetectorConfig {
  double idle_multiplier = 1.2;
  double typing_multiplier = 1.3;
  double focus_multiplier = 1.5;
  double drift_threshold = 0.3;  // fractional deviation from baseline typing speed

  // Per-rule score caps.
  double idle_scale = 70.0;
  double focus_scale = 70.0;
  double drift_scale = 70.0;

  // Score per unit of excess over the threshold.
  double idle_slope = 100.0;
  double focus_slope = 70.0;
  double drift_slope = 200.0;

  // Bands used by explain() and telemetry.
  double warning_band = 30.0;
  double critical_band = 60.0;

  int history_size = 10;
};

// -----------------------------
// Risk combination + smoothing
// -----------------------------
struct RiskConfig {
  int smoothing_window = 3;

  double weight_idle_burst = 0.4;
  double weight_focus_instability = 0.35;
  double weight_behavioral_drift = 0.25;

  // Weight of the newest raw sample against the mean of the older ones.
  double recency_weight = 0.6;
};

// -----------------------------
// Input sources
// -----------------------------
struct InputSynthConfig {
  std::uint32_t seed = 1;
  double mean_event_interval_s = 0.2;

  double typing_burst_probability = 0.3;
  double mouse_move_probability = 0.3;
  double mouse_click_probability = 0.2;
  // Remainder of the draw is a focus change.

  double idle_probability = 0.15;  // scaled by 0.1 per generator step
  double idle_exit_probability = 0.3;

  int screen_width = 1920;
  int screen_height = 1080;

  // Optional injected behaviour shift, e.g. for demos and soak tests.
  std::string anomaly = "none";  // none | typing_burst | focus_switching
  double anomaly_start_s = 0.0;  // 0 disables
};

struct InputReplayConfig {
  std::string path;
  // 1.0 = real-time according to timestamps, 0 = as fast as possible.
  double time_scale = 0.0;
};

struct InputConfig {
  std::string type = "synth";  // synth | replay
  double tick_hz = 1.0;
  double drain_timeout_s = 0.5;
  std::size_t queue_capacity = 10000;
  int heartbeat_every_s = 30;  // 0 disables
  std::int64_t max_ticks = 0;  // 0 disables
  double max_run_s = 0.0;      // 0 disables

  InputSynthConfig synth;
  InputReplayConfig replay;
};

// -----------------------------
// Output (reports + telemetry)
// -----------------------------
struct ReportConfig {
  Seconds interval_s = 5.0;
  std::string source;  // empty = name of the input source ("synth", "replay")
};

struct OutputConfig {
  // Telemetry JSONL and the report store live here.
  std::string out_dir = "out";
  std::string reports_file = "reports.jsonl";
  std::size_t keep_runs = 50;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  SessionId session_id;  // empty = generate per session

  FeaturesConfig features;
  BaselineConfig baseline;
  DetectorConfig detector;
  RiskConfig risk;

  InputConfig input;
  ReportConfig report;
  OutputConfig output;
};

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.features.window_s <= 0.0) {
    return Status::invalid_argument("features.window_s must be > 0");
  }
  if (cfg.baseline.calibration_s <= 0.0) {
    return Status::invalid_argument("baseline.calibration_s must be > 0");
  }
  if (cfg.baseline.min_samples <= 0) {
    return Status::invalid_argument("baseline.min_samples must be > 0");
  }
  if (cfg.baseline.early_fraction < 0.0 || cfg.baseline.early_fraction > 1.0) {
    return Status::invalid_argument("baseline.early_fraction must be in [0,1]");
  }
  if (cfg.baseline.fallback_min_samples <= 0) {
    return Status::invalid_argument("baseline.fallback_min_samples must be > 0");
  }
  if (cfg.detector.idle_multiplier <= 0.0 || cfg.detector.typing_multiplier <= 0.0 ||
      cfg.detector.focus_multiplier <= 0.0) {
    return Status::invalid_argument("detector multipliers must be > 0");
  }
  if (cfg.detector.drift_threshold < 0.0) {
    return Status::invalid_argument("detector.drift_threshold must be >= 0");
  }
  if (cfg.detector.idle_scale < 0.0 || cfg.detector.idle_scale > 100.0 ||
      cfg.detector.focus_scale < 0.0 || cfg.detector.focus_scale > 100.0 ||
      cfg.detector.drift_scale < 0.0 || cfg.detector.drift_scale > 100.0) {
    return Status::invalid_argument("detector scales must be in [0,100]");
  }
  if (cfg.detector.history_size <= 0) {
    return Status::invalid_argument("detector.history_size must be > 0");
  }
  if (cfg.risk.smoothing_window <= 0) {
    return Status::invalid_argument("risk.smoothing_window must be > 0");
  }
  if (cfg.risk.recency_weight < 0.0 || cfg.risk.recency_weight > 1.0) {
    return Status::invalid_argument("risk.recency_weight must be in [0,1]");
  }
  if (cfg.risk.weight_idle_burst < 0.0 || cfg.risk.weight_focus_instability < 0.0 ||
      cfg.risk.weight_behavioral_drift < 0.0) {
    return Status::invalid_argument("risk weights must be >= 0");
  }
  if (cfg.input.type != "synth" && cfg.input.type != "replay") {
    return Status::invalid_argument("input.type must be 'synth' or 'replay'");
  }
  if (cfg.input.type == "replay" && cfg.input.replay.path.empty()) {
    return Status::invalid_argument("input.replay.path must not be empty for replay input");
  }
  if (cfg.input.tick_hz <= 0.0) {
    return Status::invalid_argument("input.tick_hz must be > 0");
  }
  if (cfg.input.drain_timeout_s < 0.0) {
    return Status::invalid_argument("input.drain_timeout_s must be >= 0");
  }
  if (cfg.input.queue_capacity == 0) {
    return Status::invalid_argument("input.queue_capacity must be > 0");
  }
  if (cfg.input.heartbeat_every_s < 0) {
    return Status::invalid_argument("input.heartbeat_every_s must be >= 0");
  }
  if (cfg.input.max_ticks < 0) {
    return Status::invalid_argument("input.max_ticks must be >= 0");
  }
  if (cfg.input.max_run_s < 0.0) {
    return Status::invalid_argument("input.max_run_s must be >= 0");
  }
  if (cfg.input.synth.mean_event_interval_s <= 0.0) {
    return Status::invalid_argument("input.synth.mean_event_interval_s must be > 0");
  }
  const auto& a = cfg.input.synth.anomaly;
  if (a != "none" && a != "typing_burst" && a != "focus_switching") {
    return Status::invalid_argument("input.synth.anomaly must be none, typing_burst or focus_switching");
  }
  if (cfg.input.replay.time_scale < 0.0) {
    return Status::invalid_argument("input.replay.time_scale must be >= 0");
  }
  if (cfg.report.interval_s <= 0.0) {
    return Status::invalid_argument("report.interval_s must be > 0");
  }
  if (cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  if (cfg.output.reports_file.empty()) {
    return Status::invalid_argument("output.reports_file must not be empty");
  }
  return Status::ok_status();
}

}  // namespace sx
