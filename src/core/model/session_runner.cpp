// File: src/core/model/session_runner.cpp
#include "sx/core/model/session_runner.hpp"

#include <chrono>
#include <sstream>
#include <utility>

#include "sx/core/util/repro_hash.hpp"

namespace sx {

SessionRunner::SessionRunner(Config cfg, SessionId session_id, std::string source_name,
                             std::string config_path)
    : cfg_(std::move(cfg)),
      session_id_(std::move(session_id)),
      source_name_(std::move(source_name)),
      config_path_(std::move(config_path)),
      extractor_(cfg_.features),
      builder_(cfg_.baseline),
      detector_(cfg_.detector),
      risk_(cfg_.risk) {}

std::int64_t SessionRunner::wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

Status SessionRunner::start(EventSink& sink, Seconds now) {
  start_t_ = now;
  started_ = true;

  builder_.start_calibration(now);
  risk_.reset();
  detector_.reset();
  last_report_t_.reset();
  last_report_.reset();

  RunInfo run;
  run.session_id = session_id_;
  run.config_path = config_path_;
  run.out_dir = cfg_.output.out_dir;
  run.source = source_name_;
  run.config_hash = compute_config_hash(cfg_);
  run.start_time = now;
  run.wall_start_ns = wall_now_epoch_ns();

  SX_RETURN_IF_ERROR(sink.open(run));

  std::ostringstream msg;
  msg << "calibrating for " << cfg_.baseline.calibration_s << "s, window " << cfg_.features.window_s << "s";
  return emit_event(sink, now, "calibration_started", msg.str());
}

void SessionRunner::ingest(const std::vector<InteractionEvent>& events) {
  for (const auto& e : events) extractor_.add_event(e);
  stats_.events_ingested += events.size();
}

Status SessionRunner::tick(EventSink& sink, ReportSink* reports, Seconds now) {
  ++stats_.ticks;

  last_features_ = extractor_.compute_features(now);

  // A failed telemetry write must not skip scoring or reporting; keep the first error.
  Status telemetry = Status::ok_status();
  const auto keep_first = [&telemetry](Status s) {
    if (telemetry.ok() && !s.ok()) telemetry = std::move(s);
  };

  if (!builder_.is_calibrated()) {
    builder_.update(last_features_, last_features_.window_end);
    if (builder_.is_calibrated()) keep_first(on_calibrated(sink, now));
  }

  if (!detector_.has_baseline()) return telemetry;

  last_scores_ = detector_.compute_scores(last_features_);
  const double risk = risk_.compute_risk(last_scores_);

  const auto& d = cfg_.detector;
  if (last_scores_.overall > d.warning_band) {
    TelemetryEvent e;
    e.type = "anomaly";
    e.t = now;
    e.t_wall_ns = wall_now_epoch_ns();
    e.severity = last_scores_.overall > d.critical_band ? Severity::kWarning : Severity::kInfo;
    e.message = detector_.explain(last_scores_);
    e.fields = {{"overall", last_scores_.overall},
                {"idle_burst", last_scores_.idle_burst},
                {"focus_instability", last_scores_.focus_instability},
                {"behavioral_drift", last_scores_.behavioral_drift},
                {"risk", risk}};
    keep_first(sink.emit(e));
  }

  keep_first(maybe_report(sink, reports, now));
  return telemetry;
}

Status SessionRunner::on_calibrated(EventSink& sink, Seconds now) {
  const BaselineProfile& b = *builder_.baseline();
  detector_.set_baseline(b);

  TelemetryEvent e;
  e.type = "baseline_frozen";
  e.t = now;
  e.t_wall_ns = wall_now_epoch_ns();
  e.severity = builder_.used_fallback() ? Severity::kWarning : Severity::kInfo;
  e.message = builder_.used_fallback() ? "no calibration data, using fallback profile"
                                       : "baseline " + compute_baseline_hash(b);
  e.fields = {{"avg_typing_speed", b.avg_typing_speed},
              {"avg_idle_duration", b.avg_idle_duration},
              {"avg_focus_rate", b.avg_focus_rate},
              {"samples", static_cast<double>(builder_.samples_used())},
              {"elapsed_s", now - start_t_}};
  return sink.emit(e);
}

Status SessionRunner::maybe_report(EventSink& sink, ReportSink* reports, Seconds now) {
  if (last_report_t_ && now - *last_report_t_ < cfg_.report.interval_s) {
    return Status::ok_status();
  }

  RiskReport r;
  r.timestamp = now;
  r.risk_score = risk_.current_risk();
  r.anomaly_scores = last_scores_;
  r.session_id = session_id_;
  r.source = cfg_.report.source.empty() ? source_name_ : cfg_.report.source;
  last_report_ = r;

  if (!reports) {
    last_report_t_ = now;
    return Status::ok_status();
  }

  const Status posted = reports->post(r);

  TelemetryEvent e;
  e.t = now;
  e.t_wall_ns = wall_now_epoch_ns();
  e.fields = {{"risk", r.risk_score}, {"overall", r.anomaly_scores.overall}};

  if (posted.ok()) {
    ++stats_.reports_sent;
    last_report_t_ = now;
    e.type = "report_sent";
    e.message = risk_level_name(classify_risk(r.risk_score));
  } else if (posted.code() == Status::Code::kInvalidArgument) {
    // The sink answered; do not resend or recompute.
    ++stats_.reports_rejected;
    last_report_t_ = now;
    e.type = "report_rejected";
    e.severity = Severity::kWarning;
    e.message = posted.message();
  } else {
    // Dropped. Next tick tries again with fresh data.
    ++stats_.reports_dropped;
    e.type = "report_dropped";
    e.severity = Severity::kWarning;
    e.message = std::string(status_code_name(posted.code())) + ": " + posted.message();
  }

  return sink.emit(e);
}

Status SessionRunner::emit_heartbeat(EventSink& sink, Seconds now) {
  TelemetryEvent e;
  e.type = "heartbeat";
  e.t = now;
  e.t_wall_ns = wall_now_epoch_ns();
  e.message = calibration_state_name(builder_.state());
  e.fields = {{"calibration_progress", builder_.calibration_progress(now)},
              {"events", static_cast<double>(stats_.events_ingested)},
              {"buffered", static_cast<double>(extractor_.size())},
              {"risk", risk_.current_risk()}};
  return sink.emit(e);
}

Status SessionRunner::emit_event(EventSink& sink, Seconds now, const std::string& type,
                                 const std::string& message, Severity severity) {
  TelemetryEvent e;
  e.type = type;
  e.t = now;
  e.t_wall_ns = wall_now_epoch_ns();
  e.severity = severity;
  e.message = message;
  return sink.emit(e);
}

void SessionRunner::stop(EventSink& sink, Seconds now, const std::string& reason) {
  if (started_) {
    TelemetryEvent e;
    e.type = "shutdown";
    e.t = now;
    e.t_wall_ns = wall_now_epoch_ns();
    e.message = reason;
    e.fields = {{"ticks", static_cast<double>(stats_.ticks)},
                {"events", static_cast<double>(stats_.events_ingested)},
                {"reports_sent", static_cast<double>(stats_.reports_sent)},
                {"reports_rejected", static_cast<double>(stats_.reports_rejected)},
                {"reports_dropped", static_cast<double>(stats_.reports_dropped)},
                {"final_risk", risk_.current_risk()}};
    (void)sink.emit(e);  // best effort on the way out
  }
  (void)sink.flush();
  sink.close();
  started_ = false;
}

}  // namespace sx
