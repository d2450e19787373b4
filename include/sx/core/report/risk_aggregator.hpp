// File: include/sx/core/report/risk_aggregator.hpp
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

#include "sx/core/types.hpp"

namespace sx {

struct AnomalyCounts {
  std::size_t idle_burst = 0;
  std::size_t focus_instability = 0;
  std::size_t behavioral_drift = 0;
};

struct SessionSummary {
  SessionId session_id;
  std::size_t risk_count = 0;
  double average_risk = 0.0;
  double max_risk = 0.0;
  double min_risk = 0.0;
  AnomalyCounts anomaly_counts;
};

// In-memory per-session rollup of accepted reports. Not persisted.
// A rule counts as anomalous in a report when its sub-score exceeds anomaly_threshold.
// Not thread-safe; the owning sink serialises access.
class RiskAggregator {
 public:
  explicit RiskAggregator(double anomaly_threshold = 50.0) : anomaly_threshold_(anomaly_threshold) {}

  void add(const RiskReport& report);

  [[nodiscard]] std::optional<SessionSummary> summary(const SessionId& session_id) const;
  [[nodiscard]] std::vector<SessionId> sessions() const;

  void reset_session(const SessionId& session_id);

 private:
  // Running totals only; memory per session stays constant.
  struct Entry {
    std::size_t count = 0;
    double risk_sum = 0.0;
    double risk_min = 0.0;
    double risk_max = 0.0;
    AnomalyCounts counts;
  };

  double anomaly_threshold_;
  std::map<SessionId, Entry> sessions_;
};

}  // namespace sx
