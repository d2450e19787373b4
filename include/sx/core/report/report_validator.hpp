// File: include/sx/core/report/report_validator.hpp
#pragma once

#include "sx/core/status.hpp"
#include "sx/core/types.hpp"

namespace sx {

struct ReportValidatorConfig {
  double risk_score_min = 0.0;
  double risk_score_max = 100.0;
  double anomaly_score_min = 0.0;
  double anomaly_score_max = 100.0;
};

// Sink-side plausibility checks on an incoming report. Returns OK or
// invalid_argument naming the first failed check:
//  - risk_score outside [min,max] (NaN included)
//  - any sub-score (idle_burst, focus_instability, behavioral_drift, overall) outside range
//  - risk_score == 0 while a sub-score is non-zero
//  - session_id empty or whitespace only
//  - timestamp <= 0
class ReportValidator {
 public:
  explicit ReportValidator(ReportValidatorConfig cfg = {}) : cfg_(cfg) {}

  [[nodiscard]] Status validate(const RiskReport& report) const;

 private:
  ReportValidatorConfig cfg_;
};

}  // namespace sx
