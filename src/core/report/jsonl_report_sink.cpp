// File: src/core/report/jsonl_report_sink.cpp
#include "sx/core/report/jsonl_report_sink.hpp"

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

#include "sx/core/util/session_id.hpp"

namespace sx {

JsonlReportSink::JsonlReportSink(ReportValidator validator) : validator_(std::move(validator)) {}

JsonlReportSink::~JsonlReportSink() { close(); }

Status JsonlReportSink::open(const std::string& path) {
  namespace fs = std::filesystem;
  std::lock_guard<std::mutex> lock(mu_);

  if (f_.is_open()) f_.close();

  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) return Status::io_error("failed creating '" + parent.string() + "': " + ec.message());
  }

  f_.open(path, std::ios::out | std::ios::app);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path + "'");
  path_ = path;
  return Status::ok_status();
}

void JsonlReportSink::close() {
  std::lock_guard<std::mutex> lock(mu_);
  if (f_.is_open()) f_.close();
}

std::string JsonlReportSink::to_json(const RiskReport& r) {
  const auto& a = r.anomaly_scores;
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);
  ss << "{"
     << "\"timestamp\":" << r.timestamp << ","
     << "\"risk_score\":" << r.risk_score << ","
     << "\"anomaly_scores\":{"
     << "\"idle_burst\":" << a.idle_burst << ","
     << "\"focus_instability\":" << a.focus_instability << ","
     << "\"behavioral_drift\":" << a.behavioral_drift << ","
     << "\"overall\":" << a.overall << "},"
     << "\"session_id\":\"" << json_escape(r.session_id) << "\","
     << "\"source\":\"" << json_escape(r.source) << "\""
     << "}";
  return ss.str();
}

Status JsonlReportSink::post(const RiskReport& report) {
  const Status v = validator_.validate(report);

  std::lock_guard<std::mutex> lock(mu_);
  if (!v.ok()) {
    ++rejected_;
    return v;
  }

  if (!f_.is_open()) return Status::unavailable("report store not open");

  f_ << to_json(report) << "\n";
  f_.flush();
  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");

  aggregator_.add(report);
  ++accepted_;
  return Status::ok_status();
}

std::optional<SessionSummary> JsonlReportSink::summary(const SessionId& session_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return aggregator_.summary(session_id);
}

std::uint64_t JsonlReportSink::accepted() const {
  std::lock_guard<std::mutex> lock(mu_);
  return accepted_;
}

std::uint64_t JsonlReportSink::rejected() const {
  std::lock_guard<std::mutex> lock(mu_);
  return rejected_;
}

}  // namespace sx
