// File: src/core/model/risk_engine.cpp
#include "sx/core/model/risk_engine.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>

namespace sx {

RiskLevel classify_risk(double risk) noexcept {
  if (risk >= 80.0) return RiskLevel::kCritical;
  if (risk >= 60.0) return RiskLevel::kHigh;
  if (risk >= 30.0) return RiskLevel::kMedium;
  return RiskLevel::kLow;
}

const char* risk_level_name(RiskLevel level) noexcept {
  switch (level) {
    case RiskLevel::kLow: return "low";
    case RiskLevel::kMedium: return "medium";
    case RiskLevel::kHigh: return "high";
    case RiskLevel::kCritical: return "critical";
  }
  return "low";
}

RiskEngine::RiskEngine(RiskConfig cfg) : cfg_(cfg) {
  if (cfg_.smoothing_window < 1) cfg_.smoothing_window = 1;
}

double RiskEngine::compute_risk(const AnomalyScores& scores) {
  const double weighted = cfg_.weight_idle_burst * scores.idle_burst +
                          cfg_.weight_focus_instability * scores.focus_instability +
                          cfg_.weight_behavioral_drift * scores.behavioral_drift;
  raw_ = std::clamp(weighted, 0.0, 100.0);

  history_.push_back(raw_);
  while (history_.size() > static_cast<std::size_t>(cfg_.smoothing_window)) {
    history_.pop_front();
  }

  if (history_.size() == 1) {
    smoothed_ = raw_;
  } else {
    const double older_sum = std::accumulate(history_.begin(), std::prev(history_.end()), 0.0);
    const double older_mean = older_sum / static_cast<double>(history_.size() - 1);
    smoothed_ = cfg_.recency_weight * raw_ + (1.0 - cfg_.recency_weight) * older_mean;
  }

  return smoothed_;
}

void RiskEngine::reset() {
  history_.clear();
  raw_ = 0.0;
  smoothed_ = 0.0;
}

}  // namespace sx
