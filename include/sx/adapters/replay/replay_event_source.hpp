// File: include/sx/adapters/replay/replay_event_source.hpp
#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "sx/core/io/event_source.hpp"

namespace sx {

struct ReplayEventSourceConfig {
  std::string path;  // CSV: timestamp,kind,a,b
  double tick_s{1.0};  // virtual time advanced per poll()
};

// Replays a recorded event file on a virtual clock. Each poll() advances the cursor by
// tick_s and returns the events at or before it, so a 30 minute recording runs as fast as
// the caller ticks.
class ReplayEventSource final : public IEventSource {
 public:
  explicit ReplayEventSource(ReplayEventSourceConfig cfg);

  // Construct over already parsed events (no file). Events are sorted by timestamp.
  ReplayEventSource(std::vector<InteractionEvent> events, double tick_s);

  // Loads and parses the file (no-op for the in-memory constructor).
  Status start() override;
  void stop() override;
  Status poll(double timeout_s, std::vector<InteractionEvent>* out) override;

  Seconds now_s() const override { return cursor_; }
  std::string name() const override { return "replay"; }

  [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }
  [[nodiscard]] std::size_t remaining() const noexcept { return events_.size() - idx_; }

  // Line format, blank lines and '#' comments allowed, optional header line:
  //   timestamp,kind[,a[,b]]
  // a,b = x,y for mouse events; a = duration for idle events; a = lost flag (0/1) for focus
  // events, defaulting to the kind.
  static Result<std::vector<InteractionEvent>> parse(std::istream& in);
  static Result<std::vector<InteractionEvent>> parse_string(const std::string& text);

 private:
  void rewind();

  ReplayEventSourceConfig cfg_;
  bool from_file_{true};

  std::vector<InteractionEvent> events_;
  std::size_t idx_{0};
  Seconds cursor_{0.0};
};

}  // namespace sx
