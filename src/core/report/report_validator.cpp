// File: src/core/report/report_validator.cpp
#include "sx/core/report/report_validator.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>

namespace sx {
namespace {

bool in_range(double v, double lo, double hi) { return v >= lo && v <= hi; }  // false for NaN

bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

Status ReportValidator::validate(const RiskReport& r) const {
  if (!in_range(r.risk_score, cfg_.risk_score_min, cfg_.risk_score_max)) {
    std::ostringstream ss;
    ss << "risk score " << r.risk_score << " out of range [" << cfg_.risk_score_min << ", "
       << cfg_.risk_score_max << "]";
    return Status::invalid_argument(ss.str());
  }

  const auto& a = r.anomaly_scores;
  const struct {
    const char* name;
    double value;
  } subs[] = {
      {"idle_burst", a.idle_burst},
      {"focus_instability", a.focus_instability},
      {"behavioral_drift", a.behavioral_drift},
      {"overall", a.overall},
  };
  for (const auto& s : subs) {
    if (!in_range(s.value, cfg_.anomaly_score_min, cfg_.anomaly_score_max)) {
      std::ostringstream ss;
      ss << "anomaly score " << s.name << ": " << s.value << " out of range";
      return Status::invalid_argument(ss.str());
    }
  }

  if (r.risk_score == 0.0 &&
      (a.idle_burst != 0.0 || a.focus_instability != 0.0 || a.behavioral_drift != 0.0)) {
    return Status::invalid_argument("risk score is zero but anomaly scores are non-zero");
  }

  if (r.session_id.empty() || is_blank(r.session_id)) {
    return Status::invalid_argument("session id is empty or missing");
  }

  if (!(r.timestamp > 0.0)) {
    return Status::invalid_argument("invalid timestamp");
  }

  return Status::ok_status();
}

}  // namespace sx
