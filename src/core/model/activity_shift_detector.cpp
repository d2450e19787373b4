// File: src/core/model/activity_shift_detector.cpp
#include "sx/core/model/activity_shift_detector.hpp"

#include <algorithm>
#include <cmath>

namespace sx {
namespace {

// Linear excess over a threshold, capped to [0, cap].
double excess_score(double value, double threshold, double slope, double cap) {
  return std::clamp((value - threshold) * slope, 0.0, cap);
}

}  // namespace

ActivityShiftDetector::ActivityShiftDetector(DetectorConfig cfg) : cfg_(cfg) {}

AnomalyScores ActivityShiftDetector::compute_scores(const FeatureVector& features) {
  AnomalyScores s;
  if (!baseline_) return s;

  s.idle_burst = idle_burst_score(features);
  s.focus_instability = focus_instability_score(features);
  s.behavioral_drift = behavioral_drift_score(features);
  s.overall = std::max({s.idle_burst, s.focus_instability, s.behavioral_drift});

  recent_overall_.push_back(s.overall);
  while (recent_overall_.size() > static_cast<std::size_t>(cfg_.history_size)) {
    recent_overall_.pop_front();
  }
  return s;
}

double ActivityShiftDetector::idle_burst_score(const FeatureVector& f) const {
  if (!baseline_) return 0.0;
  const BaselineProfile& b = *baseline_;

  if (f.avg_idle_duration <= b.avg_idle_duration * cfg_.idle_multiplier) return 0.0;
  if (f.avg_typing_speed <= b.avg_typing_speed * cfg_.typing_multiplier) return 0.0;

  // A zero typing baseline gives no reference ratio.
  if (b.avg_typing_speed <= 0.0) return 0.0;

  const double ratio = f.avg_typing_speed / b.avg_typing_speed;
  return excess_score(ratio, cfg_.typing_multiplier, cfg_.idle_slope, cfg_.idle_scale);
}

double ActivityShiftDetector::focus_instability_score(const FeatureVector& f) const {
  if (!baseline_) return 0.0;
  const BaselineProfile& b = *baseline_;

  const Seconds window = f.window_length();
  const double focus_rate =
      window > 0.0 ? static_cast<double>(f.focus_loss_count) * 60.0 / window : 0.0;

  if (b.avg_focus_rate <= 0.0) return 0.0;
  if (focus_rate <= b.avg_focus_rate * cfg_.focus_multiplier) return 0.0;

  const double ratio = focus_rate / b.avg_focus_rate;
  return excess_score(ratio, cfg_.focus_multiplier, cfg_.focus_slope, cfg_.focus_scale);
}

double ActivityShiftDetector::behavioral_drift_score(const FeatureVector& f) const {
  if (!baseline_) return 0.0;
  const BaselineProfile& b = *baseline_;
  if (b.avg_typing_speed <= 0.0) return 0.0;

  const double deviation_pct = std::abs(f.avg_typing_speed - b.avg_typing_speed) / b.avg_typing_speed;
  if (deviation_pct <= cfg_.drift_threshold) return 0.0;

  return excess_score(deviation_pct, cfg_.drift_threshold, cfg_.drift_slope, cfg_.drift_scale);
}

std::string ActivityShiftDetector::explain(const AnomalyScores& scores) const {
  struct Rule {
    double score;
    const char* critical;
    const char* warning;
  };
  const Rule rules[] = {
      {scores.idle_burst,
       "CRITICAL: Extreme typing burst after idle - possible copy-paste",
       "WARNING: Unusual typing pattern after idle"},
      {scores.focus_instability,
       "CRITICAL: Excessive window/tab switching",
       "WARNING: Frequent focus changes"},
      {scores.behavioral_drift,
       "CRITICAL: Typing speed drastically changed",
       "WARNING: Typing pattern shifted"},
  };

  std::string out;
  for (const auto& r : rules) {
    const char* msg = nullptr;
    if (r.score > cfg_.critical_band) msg = r.critical;
    else if (r.score > cfg_.warning_band) msg = r.warning;
    if (!msg) continue;

    if (!out.empty()) out += " | ";
    out += msg;
  }

  if (out.empty()) return "Normal behavior detected";
  return out;
}

}  // namespace sx
