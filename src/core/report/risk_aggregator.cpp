// File: src/core/report/risk_aggregator.cpp
#include "sx/core/report/risk_aggregator.hpp"

#include <algorithm>

namespace sx {

void RiskAggregator::add(const RiskReport& report) {
  Entry& e = sessions_[report.session_id];
  const double risk = report.risk_score;
  if (e.count == 0) {
    e.risk_min = risk;
    e.risk_max = risk;
  } else {
    e.risk_min = std::min(e.risk_min, risk);
    e.risk_max = std::max(e.risk_max, risk);
  }
  e.risk_sum += risk;
  ++e.count;

  const auto& a = report.anomaly_scores;
  if (a.idle_burst > anomaly_threshold_) ++e.counts.idle_burst;
  if (a.focus_instability > anomaly_threshold_) ++e.counts.focus_instability;
  if (a.behavioral_drift > anomaly_threshold_) ++e.counts.behavioral_drift;
}

std::optional<SessionSummary> RiskAggregator::summary(const SessionId& session_id) const {
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end() || it->second.count == 0) return std::nullopt;

  const Entry& e = it->second;
  SessionSummary s;
  s.session_id = session_id;
  s.risk_count = e.count;
  s.average_risk = e.risk_sum / static_cast<double>(e.count);
  s.min_risk = e.risk_min;
  s.max_risk = e.risk_max;
  s.anomaly_counts = e.counts;
  return s;
}

std::vector<SessionId> RiskAggregator::sessions() const {
  std::vector<SessionId> out;
  out.reserve(sessions_.size());
  for (const auto& kv : sessions_) out.push_back(kv.first);
  return out;
}

void RiskAggregator::reset_session(const SessionId& session_id) { sessions_.erase(session_id); }

}  // namespace sx
