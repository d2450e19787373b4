// File: include/sx/core/events/jsonl_event_sink.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "sx/core/events/event_sink.hpp"
#include "sx/core/status.hpp"

namespace sx {

// JSONL sink for telemetry.
// Writes every event line to:
//   1) a unique per-run file: events_<session_id>_<wall_start_time_ns>.jsonl
//   2) a stable "latest" file: events_latest.jsonl (truncated each run), unless disabled
// When keep_runs > 0, open() prunes out_dir to the newest keep_runs per-run files.
// Concurrent sessions sharing out_dir should pass keep_runs = 0 and write_latest = false.
class JsonlEventSink final : public EventSink {
 public:
  explicit JsonlEventSink(std::size_t keep_runs = 50, bool write_latest = true);
  ~JsonlEventSink() override;

  const std::string& path() const { return path_; }
  const std::string& latest_path() const { return latest_path_; }

  Status open(const RunInfo& run) override;
  Status emit(const TelemetryEvent& e) override;
  Status flush() override;
  void close() override;

  // Deletes all but the newest `keep_last` events_*.jsonl run files (never events_latest.jsonl).
  static void prune_out_dir(const std::string& out_dir, std::size_t keep_last);

 private:
  Status write_line_(const std::string& line);

  std::size_t keep_runs_;
  bool write_latest_;
  bool open_{false};

  std::string path_;
  std::string latest_path_;

  std::ofstream f_;
  std::ofstream latest_;
};

}  // namespace sx
