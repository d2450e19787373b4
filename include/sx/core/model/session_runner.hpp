// File: include/sx/core/model/session_runner.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sx/core/config.hpp"
#include "sx/core/events/event_sink.hpp"
#include "sx/core/model/activity_shift_detector.hpp"
#include "sx/core/model/baseline_builder.hpp"
#include "sx/core/model/feature_extractor.hpp"
#include "sx/core/model/risk_engine.hpp"
#include "sx/core/report/report_sink.hpp"
#include "sx/core/status.hpp"
#include "sx/core/types.hpp"

namespace sx {

struct SessionStats {
  std::uint64_t events_ingested = 0;
  std::uint64_t ticks = 0;
  std::uint64_t reports_sent = 0;
  std::uint64_t reports_rejected = 0;
  std::uint64_t reports_dropped = 0;
};

// One session's pipeline: extractor -> baseline builder -> detector -> risk engine -> report sink.
// Owns its component instances; nothing is shared between sessions. Single-threaded.
//
// Time contract: every `now` is in the event source's time base (see IEventSource::now_s).
// Error contract: report sink outcomes never fail a tick; only telemetry write errors are returned,
// after the tick has run to completion.
class SessionRunner {
 public:
  SessionRunner(Config cfg, SessionId session_id, std::string source_name,
                std::string config_path = {});

  // Opens telemetry and anchors calibration at `now`.
  Status start(EventSink& sink, Seconds now);

  void ingest(const std::vector<InteractionEvent>& events);

  // One polling-loop iteration. `reports` may be null (scores are still computed).
  Status tick(EventSink& sink, ReportSink* reports, Seconds now);

  Status emit_heartbeat(EventSink& sink, Seconds now);
  Status emit_event(EventSink& sink, Seconds now, const std::string& type,
                    const std::string& message, Severity severity = Severity::kInfo);

  void stop(EventSink& sink, Seconds now, const std::string& reason);

  [[nodiscard]] const SessionId& session_id() const noexcept { return session_id_; }
  [[nodiscard]] const SessionStats& stats() const noexcept { return stats_; }
  [[nodiscard]] bool is_calibrated() const noexcept { return builder_.is_calibrated(); }
  [[nodiscard]] double calibration_progress(Seconds now) const noexcept {
    return builder_.calibration_progress(now);
  }

  [[nodiscard]] const BaselineBuilder& baseline_builder() const noexcept { return builder_; }
  [[nodiscard]] const ActivityShiftDetector& detector() const noexcept { return detector_; }
  [[nodiscard]] const RiskEngine& risk_engine() const noexcept { return risk_; }

  [[nodiscard]] const FeatureVector& last_features() const noexcept { return last_features_; }
  [[nodiscard]] const AnomalyScores& last_scores() const noexcept { return last_scores_; }
  [[nodiscard]] const std::optional<RiskReport>& last_report() const noexcept { return last_report_; }

 private:
  Status on_calibrated(EventSink& sink, Seconds now);
  Status maybe_report(EventSink& sink, ReportSink* reports, Seconds now);

  static std::int64_t wall_now_epoch_ns();

  Config cfg_;
  SessionId session_id_;
  std::string source_name_;
  std::string config_path_;

  FeatureExtractor extractor_;
  BaselineBuilder builder_;
  ActivityShiftDetector detector_;
  RiskEngine risk_;

  FeatureVector last_features_;
  AnomalyScores last_scores_;
  std::optional<RiskReport> last_report_;
  std::optional<Seconds> last_report_t_;

  Seconds start_t_{0.0};
  SessionStats stats_;
  bool started_{false};
};

}  // namespace sx
