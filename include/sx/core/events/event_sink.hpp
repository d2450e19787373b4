// File: include/sx/core/events/event_sink.hpp
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "sx/core/status.hpp"
#include "sx/core/types.hpp"

namespace sx {

// Telemetry model. One sink per session; nothing here is global, so concurrent
// sessions never share logger state.
// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  SessionId session_id;
  std::string config_path;
  std::string out_dir;
  std::string source;  // input source name

  std::string config_hash;

  Seconds start_time = 0.0;       // session clock (source time base)
  std::int64_t wall_start_ns = 0;  // absolute epoch ns
};

enum class Severity { kInfo, kWarning, kError };

struct TelemetryEvent {
  std::string type;  // e.g. "heartbeat", "baseline_frozen", "report_rejected"
  Seconds t = 0.0;   // session clock
  std::int64_t t_wall_ns = 0;
  Severity severity = Severity::kInfo;

  std::string message;  // optional human-readable hint

  // Optional numeric fields, emitted in order ("risk", 42.0).
  std::vector<std::pair<std::string, double>> fields;
};

const char* severity_name(Severity s) noexcept;

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const TelemetryEvent& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace sx
