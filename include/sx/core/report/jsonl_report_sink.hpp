// File: include/sx/core/report/jsonl_report_sink.hpp
#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

#include "sx/core/report/report_sink.hpp"
#include "sx/core/report/report_validator.hpp"
#include "sx/core/report/risk_aggregator.hpp"
#include "sx/core/status.hpp"

namespace sx {

// Local report store: validate, append one JSON line per accepted report, aggregate.
// Thread-safe; one instance may be shared by concurrent sessions.
class JsonlReportSink final : public ReportSink {
 public:
  explicit JsonlReportSink(ReportValidator validator = ReportValidator{});
  ~JsonlReportSink() override;

  // Opens (appends to) `path`, creating parent directories.
  Status open(const std::string& path);
  void close();

  Status post(const RiskReport& report) override;
  std::string name() const override { return "jsonl"; }

  [[nodiscard]] std::optional<SessionSummary> summary(const SessionId& session_id) const;

  [[nodiscard]] std::uint64_t accepted() const;
  [[nodiscard]] std::uint64_t rejected() const;
  [[nodiscard]] const std::string& path() const { return path_; }

  static std::string to_json(const RiskReport& report);

 private:
  ReportValidator validator_;

  mutable std::mutex mu_;
  std::ofstream f_;
  std::string path_;
  RiskAggregator aggregator_;
  std::uint64_t accepted_{0};
  std::uint64_t rejected_{0};
};

}  // namespace sx
