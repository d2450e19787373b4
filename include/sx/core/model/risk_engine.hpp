// File: include/sx/core/model/risk_engine.hpp
#pragma once

#include <cstddef>
#include <deque>

#include "sx/core/config.hpp"
#include "sx/core/types.hpp"

namespace sx {

enum class RiskLevel { kLow, kMedium, kHigh, kCritical };

// <30 low, <60 medium, <80 high, else critical.
RiskLevel classify_risk(double risk) noexcept;
const char* risk_level_name(RiskLevel level) noexcept;

// Weighted combination of the rule scores, then recency-biased smoothing:
//   raw      = clamp(w_idle*idle + w_focus*focus + w_drift*drift, 0, 100)
//   smoothed = raw                                   (one sample in history)
//            = r*raw + (1-r)*mean(older history)     (otherwise, r = recency_weight)
// History holds the last smoothing_window raw values, newest included.
class RiskEngine {
 public:
  explicit RiskEngine(RiskConfig cfg = {});

  // Returns the smoothed risk.
  double compute_risk(const AnomalyScores& scores);

  [[nodiscard]] double current_risk() const noexcept { return smoothed_; }
  [[nodiscard]] double raw_risk() const noexcept { return raw_; }
  [[nodiscard]] std::size_t history_size() const noexcept { return history_.size(); }

  // New session: history and both cached values back to zero.
  void reset();

 private:
  RiskConfig cfg_;
  std::deque<double> history_;
  double raw_{0.0};
  double smoothed_{0.0};
};

}  // namespace sx
