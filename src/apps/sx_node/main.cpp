// File: src/apps/sx_node/main.cpp
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "sx/adapters/replay/replay_event_source.hpp"
#include "sx/adapters/synth/synth_event_source.hpp"
#include "sx/core/events/jsonl_event_sink.hpp"
#include "sx/core/io/event_source.hpp"
#include "sx/core/model/session_runner.hpp"
#include "sx/core/report/jsonl_report_sink.hpp"
#include "sx/core/util/config_loader.hpp"
#include "sx/core/util/session_id.hpp"

namespace {

std::atomic<bool> g_stop{false};

extern "C" void on_signal(int) { g_stop.store(true); }

std::mutex g_console_mu;

struct Args {
  std::string config_path;
  int sessions{1};
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--sessions" && i + 1 < argc) {
      char* end = nullptr;
      const long n = std::strtol(argv[++i], &end, 10);
      if (*end != '\0' || n <= 0 || n > 1000) {
        a.help = true;
        return a;
      }
      a.sessions = static_cast<int>(n);
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "sx_node\n"
            << "  --config <path>\n"
            << "  [--sessions <n>]   run n independent sessions concurrently (load test)\n";
}

std::unique_ptr<sx::IEventSource> make_source_from_config(const sx::Config& cfg) {
  if (cfg.input.type == "synth") {
    return std::make_unique<sx::SynthEventSource>(cfg.input.synth, cfg.input.queue_capacity);
  }

  if (cfg.input.type == "replay") {
    sx::ReplayEventSourceConfig rc;
    rc.path = cfg.input.replay.path;
    rc.tick_s = 1.0 / cfg.input.tick_hz;
    return std::make_unique<sx::ReplayEventSource>(rc);
  }

  return nullptr;
}

struct SessionOutcome {
  sx::SessionId session_id;
  sx::SessionStats stats;
  double final_risk{0.0};
  bool calibrated{false};
  std::string telemetry_path;
  std::string error;
  int exit_code{0};
};

std::string fmt_risk(double v) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << v;
  return ss.str();
}

// Runs one session until stop, eof, or a configured limit. Never throws.
void run_session(sx::Config cfg, const std::string& config_path, int index, bool multi,
                 sx::JsonlReportSink* reports, SessionOutcome* out) {
  if (cfg.session_id.empty()) {
    cfg.session_id = sx::generate_session_id();
  } else if (multi) {
    cfg.session_id += "-" + std::to_string(index);
  }
  cfg.input.synth.seed += static_cast<std::uint32_t>(index);
  out->session_id = cfg.session_id;

  std::unique_ptr<sx::IEventSource> source = make_source_from_config(cfg);
  if (!source) {
    out->error = "Unknown input.type: " + cfg.input.type;
    out->exit_code = 2;
    return;
  }

  const sx::Status st_src = source->start();
  if (!st_src.ok()) {
    out->error = st_src.message();
    out->exit_code = 2;
    return;
  }

  // Concurrent sessions share out_dir; pruning and the latest file are handled once in main.
  sx::JsonlEventSink sink(multi ? 0 : cfg.output.keep_runs, /*write_latest=*/!multi);
  sx::SessionRunner runner(cfg, cfg.session_id, source->name(), config_path);

  const sx::Status st_start = runner.start(sink, source->now_s());
  if (!st_start.ok()) {
    source->stop();
    out->error = st_start.message();
    out->exit_code = 2;
    return;
  }
  out->telemetry_path = sink.path();

  std::string stop_reason = "stopped";

  // Ensure we always stop the producer and close telemetry cleanly.
  struct Guard {
    sx::SessionRunner& r;
    sx::JsonlEventSink& s;
    sx::IEventSource& src;
    const std::string& reason;
    ~Guard() {
      src.stop();
      r.stop(s, src.now_s(), reason);
    }
  } guard{runner, sink, *source, stop_reason};

  if (!multi) {
    std::cout << "Session: " << cfg.session_id << "\n"
              << "Events: " << sink.path() << " (latest: " << sink.latest_path() << ")\n"
              << "Reports: " << reports->path() << "\n"
              << "Input: " << cfg.input.type << "  tick_hz=" << cfg.input.tick_hz
              << "  heartbeat_every_s=" << cfg.input.heartbeat_every_s << "\n\n";
  }

  using clock = std::chrono::steady_clock;

  const bool is_replay = cfg.input.type == "replay";
  const double pace = is_replay ? cfg.input.replay.time_scale : 1.0;
  const auto tick_period = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(pace / cfg.input.tick_hz));
  const double drain_timeout_s = is_replay ? 0.0 : cfg.input.drain_timeout_s;

  const auto t_start = clock::now();
  auto next_tick = t_start + tick_period;
  sx::Seconds last_hb = source->now_s();

  std::int64_t tick_count = 0;
  bool was_calibrated = false;
  bool telemetry_failed = false;
  std::uint64_t last_sent = 0;
  std::vector<sx::InteractionEvent> batch;

  const auto report_telemetry_error = [&](const sx::Status& st) {
    if (st.ok() || telemetry_failed) return;
    telemetry_failed = true;  // report once, keep monitoring
    std::lock_guard<std::mutex> lock(g_console_mu);
    std::cerr << "[" << cfg.session_id << "] telemetry: " << st.message() << "\n";
  };

  while (true) {
    if (g_stop.load()) {
      stop_reason = "signal";
      break;
    }

    if (cfg.input.max_ticks > 0 && tick_count >= cfg.input.max_ticks) {
      stop_reason = "max_ticks reached";
      break;
    }

    if (cfg.input.max_run_s > 0.0) {
      const auto max_d = std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::duration<double>(cfg.input.max_run_s));
      if (clock::now() - t_start >= max_d) {
        stop_reason = "max_runtime reached";
        break;
      }
    }

    batch.clear();
    const sx::Status st_poll = source->poll(drain_timeout_s, &batch);
    if (st_poll.code() == sx::Status::Code::kOutOfRange) {
      report_telemetry_error(
          runner.emit_event(sink, source->now_s(), "input_eof", "input source reached end"));
      stop_reason = "input_eof";
      break;
    }
    if (!st_poll.ok()) {
      out->error = st_poll.message();
      out->exit_code = 2;
      stop_reason = "input_error";
      break;
    }

    runner.ingest(batch);

    const sx::Seconds now = source->now_s();
    report_telemetry_error(runner.tick(sink, reports, now));

    if (cfg.input.heartbeat_every_s > 0 && now - last_hb >= cfg.input.heartbeat_every_s) {
      last_hb = now;
      report_telemetry_error(runner.emit_heartbeat(sink, now));
    }

    report_telemetry_error(sink.flush());

    if (!multi) {
      if (!was_calibrated && runner.is_calibrated()) {
        const auto& b = *runner.baseline_builder().baseline();
        std::cout << "Baseline frozen: typing=" << fmt_risk(b.avg_typing_speed)
                  << " keys/min  idle=" << fmt_risk(b.avg_idle_duration)
                  << "s  focus=" << fmt_risk(b.avg_focus_rate) << "/min"
                  << (runner.baseline_builder().used_fallback() ? "  (fallback)" : "") << "\n";
      }
      if (runner.stats().reports_sent != last_sent && runner.last_report()) {
        const auto& r = *runner.last_report();
        std::cout << "risk=" << fmt_risk(r.risk_score) << " ["
                  << sx::risk_level_name(sx::classify_risk(r.risk_score)) << "] "
                  << runner.detector().explain(r.anomaly_scores) << "\n";
      }
    }
    was_calibrated = runner.is_calibrated();
    last_sent = runner.stats().reports_sent;

    ++tick_count;

    if (tick_period.count() > 0) {
      const auto after = clock::now();
      if (after < next_tick) {
        std::this_thread::sleep_until(next_tick);
        next_tick += tick_period;
      } else {
        next_tick = after + tick_period;
      }
    }
  }

  out->stats = runner.stats();
  out->final_risk = runner.risk_engine().current_risk();
  out->calibrated = runner.is_calibrated();
}

void print_summary(const SessionOutcome& o, const sx::JsonlReportSink& reports) {
  std::cout << o.session_id << ": ticks=" << o.stats.ticks << " events=" << o.stats.events_ingested
            << " sent=" << o.stats.reports_sent << " rejected=" << o.stats.reports_rejected
            << " dropped=" << o.stats.reports_dropped
            << (o.calibrated ? "" : " (not calibrated)") << "\n";

  const auto s = reports.summary(o.session_id);
  if (!s) return;
  std::cout << "  risk avg=" << fmt_risk(s->average_risk) << " max=" << fmt_risk(s->max_risk)
            << " min=" << fmt_risk(s->min_risk) << "  anomalies idle_burst="
            << s->anomaly_counts.idle_burst << " focus_instability="
            << s->anomaly_counts.focus_instability
            << " behavioral_drift=" << s->anomaly_counts.behavioral_drift << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = sx::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  const sx::Config cfg = cfg_r.take_value();

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  sx::JsonlReportSink reports;
  const sx::Status st_reports =
      reports.open(cfg.output.out_dir + "/" + cfg.output.reports_file);
  if (!st_reports.ok()) {
    std::cerr << st_reports.message() << "\n";
    return 2;
  }

  const bool multi = args.sessions > 1;
  std::vector<SessionOutcome> outcomes(static_cast<std::size_t>(args.sessions));

  if (!multi) {
    run_session(cfg, args.config_path, 0, false, &reports, &outcomes[0]);
  } else {
    if (cfg.output.keep_runs > 0) {
      sx::JsonlEventSink::prune_out_dir(cfg.output.out_dir, cfg.output.keep_runs);
    }
    std::cout << "Running " << args.sessions << " sessions, reports: " << reports.path() << "\n";

    const auto t0 = std::chrono::steady_clock::now();
    std::vector<std::thread> workers;
    workers.reserve(outcomes.size());
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
      workers.emplace_back(run_session, cfg, args.config_path, static_cast<int>(i), true, &reports,
                           &outcomes[i]);
    }
    for (auto& w : workers) w.join();

    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    std::cout << "Finished in " << fmt_risk(elapsed) << "s, accepted=" << reports.accepted()
              << " rejected=" << reports.rejected() << "\n";
  }

  std::cout << "\n";
  int rc = 0;
  for (const auto& o : outcomes) {
    if (!o.error.empty()) {
      std::cerr << (o.session_id.empty() ? std::string("session") : o.session_id) << ": "
                << o.error << "\n";
    }
    if (o.exit_code != 0) rc = o.exit_code;
    print_summary(o, reports);
  }

  reports.close();
  if (rc != 0) return rc;
  std::cout << "OK\n";
  return 0;
}
