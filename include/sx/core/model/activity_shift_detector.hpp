// File: include/sx/core/model/activity_shift_detector.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

#include "sx/core/config.hpp"
#include "sx/core/types.hpp"

namespace sx {

// Compares a live feature vector against the frozen baseline with three independent rules.
// Every rule score lies in [0, its scale] (70 by default); overall is the max of the three.
// Without a baseline all scores are zero.
class ActivityShiftDetector {
 public:
  explicit ActivityShiftDetector(DetectorConfig cfg = {});

  void set_baseline(const BaselineProfile& baseline) { baseline_ = baseline; }
  [[nodiscard]] bool has_baseline() const noexcept { return baseline_.has_value(); }
  [[nodiscard]] const std::optional<BaselineProfile>& baseline() const noexcept { return baseline_; }

  AnomalyScores compute_scores(const FeatureVector& features);

  // Long idle followed by a typing burst (copy-paste).
  [[nodiscard]] double idle_burst_score(const FeatureVector& features) const;
  // Focus losses per minute well above the baseline rate (window switching).
  [[nodiscard]] double focus_instability_score(const FeatureVector& features) const;
  // Typing speed far from the baseline in either direction (someone else typing).
  [[nodiscard]] double behavioral_drift_score(const FeatureVector& features) const;

  // Human-readable summary for reports. Not used for control flow.
  [[nodiscard]] std::string explain(const AnomalyScores& scores) const;

  // Clears the overall-score history; the baseline is kept.
  void reset() { recent_overall_.clear(); }

  [[nodiscard]] const std::deque<double>& recent_overall() const noexcept { return recent_overall_; }
  [[nodiscard]] const DetectorConfig& config() const noexcept { return cfg_; }

 private:
  DetectorConfig cfg_;
  std::optional<BaselineProfile> baseline_;
  std::deque<double> recent_overall_;
};

}  // namespace sx
