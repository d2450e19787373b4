// File: tests/session_runner_test.cpp
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <string>
#include <utility>
#include <vector>

#include "sx/adapters/replay/replay_event_source.hpp"
#include "sx/core/events/jsonl_event_sink.hpp"
#include "sx/core/model/session_runner.hpp"
#include "sx/core/report/jsonl_report_sink.hpp"
#include "sx/core/report/report_validator.hpp"

namespace sx {
namespace {

namespace fs = std::filesystem;

class RecordingEventSink final : public EventSink {
 public:
  Status open(const RunInfo& r) override {
    run = r;
    return Status::ok_status();
  }
  Status emit(const TelemetryEvent& e) override {
    events.push_back(e);
    return fail_emit ? Status::io_error("disk full") : Status::ok_status();
  }
  Status flush() override { return Status::ok_status(); }
  void close() override { closed = true; }

  int count(const std::string& type) const {
    return static_cast<int>(std::count_if(events.begin(), events.end(),
                                          [&](const TelemetryEvent& e) { return e.type == type; }));
  }

  RunInfo run;
  std::vector<TelemetryEvent> events;
  bool fail_emit{false};
  bool closed{false};
};

class ScriptedReportSink final : public ReportSink {
 public:
  explicit ScriptedReportSink(Status result) : result_(std::move(result)) {}

  Status post(const RiskReport& report) override {
    posted.push_back(report);
    return result_;
  }
  std::string name() const override { return "scripted"; }

  std::vector<RiskReport> posted;

 private:
  Status result_;
};

// 200 s of steady typing (2 keys/s) then 60 s with mouse movement only.
std::vector<InteractionEvent> typing_then_silence(Seconds t0 = 1000.0) {
  std::vector<InteractionEvent> ev;
  // Anchors the replay clock on t0, so ticks land on whole seconds.
  ev.push_back(InteractionEvent::mouse(EventKind::kMouseMove, t0, 0, 500));
  for (int i = 0; i < 260; ++i) {
    const Seconds s = t0 + i;
    if (i < 200) {
      ev.push_back(InteractionEvent::key_press(s + 0.1));
      ev.push_back(InteractionEvent::key_release(s + 0.2));
      ev.push_back(InteractionEvent::key_press(s + 0.6));
      ev.push_back(InteractionEvent::key_release(s + 0.7));
    }
    ev.push_back(InteractionEvent::mouse(EventKind::kMouseMove, s + 0.5, 10 * i, 500));
  }
  return ev;
}

void drive(SessionRunner& runner, IEventSource& src, EventSink& sink, ReportSink* reports) {
  std::vector<InteractionEvent> batch;
  while (true) {
    batch.clear();
    const Status st = src.poll(0.0, &batch);
    if (st.code() == Status::Code::kOutOfRange) break;
    ASSERT_TRUE(st.ok()) << st.message();
    runner.ingest(batch);
    (void)runner.tick(sink, reports, src.now_s());
  }
}

// Calibration finishes early at t0+90 (half of 180 s): 90 one-second samples whose
// typing speed ramps 4,8,...,120 over the first 30 s, then holds at 120.
constexpr double kBaselineTyping = 9060.0 / 90.0;
constexpr int kTicks = 260;
constexpr int kTicksAfterCalibration = 171;  // t0+90 .. t0+260
constexpr int kReports = 35;                 // every 5 s from t0+90

TEST(SessionRunnerTest, CalibratesThenFlagsDrift) {
  ReplayEventSource src(typing_then_silence(), 1.0);
  ASSERT_TRUE(src.start().ok());

  RecordingEventSink telemetry;
  ScriptedReportSink reports(Status::ok_status());
  SessionRunner runner(Config{}, "session-a", src.name(), "config/test.yaml");

  ASSERT_TRUE(runner.start(telemetry, src.now_s()).ok());
  EXPECT_EQ(telemetry.run.session_id, "session-a");
  EXPECT_EQ(telemetry.run.source, "replay");
  EXPECT_EQ(telemetry.run.config_hash.size(), 16u);
  EXPECT_EQ(telemetry.count("calibration_started"), 1);

  drive(runner, src, telemetry, &reports);

  ASSERT_TRUE(runner.is_calibrated());
  EXPECT_FALSE(runner.baseline_builder().used_fallback());
  EXPECT_NEAR(runner.baseline_builder().baseline()->avg_typing_speed, kBaselineTyping, 1e-6);
  EXPECT_EQ(telemetry.count("baseline_frozen"), 1);

  const SessionStats& st = runner.stats();
  EXPECT_EQ(st.ticks, static_cast<std::uint64_t>(kTicks));
  EXPECT_EQ(st.events_ingested, src.size());
  EXPECT_EQ(st.reports_sent, static_cast<std::uint64_t>(kReports));
  EXPECT_EQ(st.reports_dropped, 0u);
  EXPECT_EQ(telemetry.count("report_sent"), kReports);

  // Typing stopped 60 s before the end: full drift, smoothed risk settles at 0.25 * 70.
  EXPECT_DOUBLE_EQ(runner.last_scores().behavioral_drift, 70.0);
  EXPECT_DOUBLE_EQ(runner.last_scores().idle_burst, 0.0);
  EXPECT_NEAR(runner.risk_engine().current_risk(), 17.5, 1e-9);
  EXPECT_GT(telemetry.count("anomaly"), 0);

  ReportValidator validator;
  ASSERT_EQ(reports.posted.size(), static_cast<std::size_t>(kReports));
  for (std::size_t i = 0; i < reports.posted.size(); ++i) {
    const RiskReport& r = reports.posted[i];
    EXPECT_TRUE(validator.validate(r).ok()) << validator.validate(r).message();
    EXPECT_EQ(r.session_id, "session-a");
    EXPECT_EQ(r.source, "replay");
    if (i > 0) EXPECT_GE(r.timestamp - reports.posted[i - 1].timestamp, 5.0);
  }
  EXPECT_DOUBLE_EQ(reports.posted.front().risk_score, 0.0);  // normal typing right after calibration

  runner.stop(telemetry, src.now_s(), "input_eof");
  EXPECT_TRUE(telemetry.closed);
  EXPECT_EQ(telemetry.events.back().type, "shutdown");
  EXPECT_EQ(telemetry.events.back().message, "input_eof");
}

TEST(SessionRunnerTest, DroppedReportsRetryNextTick) {
  ReplayEventSource src(typing_then_silence(), 1.0);
  ASSERT_TRUE(src.start().ok());

  RecordingEventSink telemetry;
  ScriptedReportSink reports(Status::unavailable("collector down"));
  SessionRunner runner(Config{}, "session-b", src.name());
  ASSERT_TRUE(runner.start(telemetry, src.now_s()).ok());

  drive(runner, src, telemetry, &reports);

  EXPECT_EQ(runner.stats().reports_sent, 0u);
  EXPECT_EQ(runner.stats().reports_dropped, static_cast<std::uint64_t>(kTicksAfterCalibration));
  EXPECT_EQ(telemetry.count("report_dropped"), kTicksAfterCalibration);

  // Scoring is unaffected by the sink.
  EXPECT_DOUBLE_EQ(runner.last_scores().behavioral_drift, 70.0);
  EXPECT_NEAR(runner.risk_engine().current_risk(), 17.5, 1e-9);
}

TEST(SessionRunnerTest, RejectedReportsKeepCadence) {
  ReplayEventSource src(typing_then_silence(), 1.0);
  ASSERT_TRUE(src.start().ok());

  RecordingEventSink telemetry;
  ScriptedReportSink reports(Status::invalid_argument("risk score out of range"));
  SessionRunner runner(Config{}, "session-c", src.name());
  ASSERT_TRUE(runner.start(telemetry, src.now_s()).ok());

  drive(runner, src, telemetry, &reports);

  EXPECT_EQ(runner.stats().reports_rejected, static_cast<std::uint64_t>(kReports));
  EXPECT_EQ(telemetry.count("report_rejected"), kReports);
  const auto it = std::find_if(telemetry.events.begin(), telemetry.events.end(),
                               [](const TelemetryEvent& e) { return e.type == "report_rejected"; });
  ASSERT_NE(it, telemetry.events.end());
  EXPECT_EQ(it->severity, Severity::kWarning);
  EXPECT_EQ(it->message, "risk score out of range");
}

TEST(SessionRunnerTest, RunsWithoutReportSink) {
  ReplayEventSource src(typing_then_silence(), 1.0);
  ASSERT_TRUE(src.start().ok());

  RecordingEventSink telemetry;
  Config cfg;
  cfg.report.source = "lab-7";
  SessionRunner runner(cfg, "session-d", src.name());
  ASSERT_TRUE(runner.start(telemetry, src.now_s()).ok());

  drive(runner, src, telemetry, nullptr);

  ASSERT_TRUE(runner.last_report().has_value());
  EXPECT_EQ(runner.last_report()->source, "lab-7");
  EXPECT_EQ(telemetry.count("report_sent"), 0);
  EXPECT_EQ(runner.stats().reports_sent, 0u);
}

TEST(SessionRunnerTest, TelemetryFailureDoesNotStopScoring) {
  ReplayEventSource src(typing_then_silence(), 1.0);
  ASSERT_TRUE(src.start().ok());

  RecordingEventSink telemetry;
  ScriptedReportSink reports(Status::ok_status());
  SessionRunner runner(Config{}, "session-e", src.name());
  ASSERT_TRUE(runner.start(telemetry, src.now_s()).ok());
  telemetry.fail_emit = true;

  int failed_ticks = 0;
  std::vector<InteractionEvent> batch;
  while (src.poll(0.0, &batch).ok()) {
    runner.ingest(batch);
    batch.clear();
    if (!runner.tick(telemetry, &reports, src.now_s()).ok()) ++failed_ticks;
  }

  EXPECT_GT(failed_ticks, 0);
  EXPECT_TRUE(runner.is_calibrated());
  EXPECT_EQ(runner.stats().reports_sent, static_cast<std::uint64_t>(kReports));
}

TEST(SessionRunnerTest, ShortSessionFallsBackAfterTimeout) {
  // Nothing but a single mouse move every 20 s: no samples carry typing data.
  std::vector<InteractionEvent> ev;
  for (int i = 0; i <= 10; ++i) {
    ev.push_back(InteractionEvent::mouse(EventKind::kMouseMove, 20.0 * i, i, i));
  }
  ReplayEventSource src(ev, 1.0);
  ASSERT_TRUE(src.start().ok());

  Config cfg;
  cfg.baseline.calibration_s = 30.0;
  RecordingEventSink telemetry;
  SessionRunner runner(cfg, "session-f", src.name());
  ASSERT_TRUE(runner.start(telemetry, 0.0).ok());

  drive(runner, src, telemetry, nullptr);

  // 30 silent samples, then the first update past 30 s calibrates on all of them.
  ASSERT_TRUE(runner.is_calibrated());
  EXPECT_FALSE(runner.baseline_builder().used_fallback());
  EXPECT_DOUBLE_EQ(runner.baseline_builder().baseline()->avg_typing_speed, 0.0);
}

TEST(SessionRunnerTest, EndToEndWithFiles) {
  const fs::path dir = fs::temp_directory_path() / "sx_session_e2e";
  fs::remove_all(dir);
  fs::create_directories(dir);

  const fs::path csv = dir / "session.csv";
  {
    std::ofstream f(csv);
    f << "# two minutes of typing then a pause\n"
      << "timestamp,kind,a,b\n"
      << std::setprecision(12);
    for (const auto& e : typing_then_silence()) {
      f << e.timestamp << "," << event_kind_name(e.kind);
      if (e.kind == EventKind::kMouseMove) f << "," << e.x << "," << e.y;
      f << "\n";
    }
  }

  Config cfg;
  cfg.output.out_dir = (dir / "out").string();

  ReplayEventSourceConfig rc;
  rc.path = csv.string();
  ReplayEventSource src(rc);
  ASSERT_TRUE(src.start().ok());

  JsonlReportSink reports;
  ASSERT_TRUE(reports.open((dir / "out" / "reports.jsonl").string()).ok());

  JsonlEventSink telemetry(0, /*write_latest=*/false);
  SessionRunner runner(cfg, "session-e2e", src.name());
  ASSERT_TRUE(runner.start(telemetry, src.now_s()).ok());
  const std::string telemetry_path = telemetry.path();

  drive(runner, src, telemetry, &reports);
  runner.stop(telemetry, src.now_s(), "input_eof");
  reports.close();

  EXPECT_EQ(reports.accepted(), static_cast<std::uint64_t>(kReports));
  const auto summary = reports.summary("session-e2e");
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->risk_count, static_cast<std::size_t>(kReports));
  EXPECT_DOUBLE_EQ(summary->min_risk, 0.0);
  EXPECT_NEAR(summary->max_risk, 17.5, 1e-9);
  EXPECT_GT(summary->anomaly_counts.behavioral_drift, 0u);

  std::ifstream rf(dir / "out" / "reports.jsonl");
  int report_lines = 0;
  for (std::string line; std::getline(rf, line);) ++report_lines;
  EXPECT_EQ(report_lines, kReports);

  std::ifstream tf(telemetry_path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(tf, line);) lines.push_back(line);
  ASSERT_GE(lines.size(), 4u);
  EXPECT_NE(lines.front().find("\"type\":\"run_started\""), std::string::npos);
  EXPECT_NE(lines.back().find("\"type\":\"shutdown\""), std::string::npos);
  EXPECT_TRUE(std::any_of(lines.begin(), lines.end(), [](const std::string& l) {
    return l.find("\"type\":\"baseline_frozen\"") != std::string::npos;
  }));

  fs::remove_all(dir);
}

}  // namespace
}  // namespace sx
