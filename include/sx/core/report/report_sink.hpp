// File: include/sx/core/report/report_sink.hpp
#pragma once

#include <string>

#include "sx/core/status.hpp"
#include "sx/core/types.hpp"

namespace sx {

// Receiver of periodic risk reports (transport + storage live behind this).
// post() outcome contract, all non-fatal for the caller:
//  - OK                 accepted and stored
//  - kInvalidArgument   rejected by the sink's validation (message says why)
//  - anything else      transient failure; the report is dropped, not retried
class ReportSink {
 public:
  virtual ~ReportSink() = default;

  virtual Status post(const RiskReport& report) = 0;
  virtual std::string name() const = 0;
};

}  // namespace sx
