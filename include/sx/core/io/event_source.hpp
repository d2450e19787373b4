// File: include/sx/core/io/event_source.hpp
#pragma once

#include <string>
#include <vector>

#include "sx/core/status.hpp"
#include "sx/core/types.hpp"

namespace sx {

// Producer of timestamp-only interaction events.
class IEventSource {
 public:
  virtual ~IEventSource() = default;

  virtual Status start() = 0;

  // Idempotent. Safe to call from the polling thread while a producer thread is running.
  virtual void stop() = 0;

  // Appends whatever arrived within `timeout_s` (bounded wait, never blocks longer).
  // Returns:
  //  - OK (possibly with nothing appended)
  //  - out_of_range("eof") once a finite source is exhausted
  //  - other error codes on failure
  virtual Status poll(double timeout_s, std::vector<InteractionEvent>* out) = 0;

  // The source's time base: wall clock for live capture, the replay cursor for recordings.
  virtual Seconds now_s() const = 0;

  virtual std::string name() const = 0;
};

// Wall clock as epoch seconds.
Seconds wall_now_s();

}  // namespace sx
