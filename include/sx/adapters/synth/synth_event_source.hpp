// File: include/sx/adapters/synth/synth_event_source.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "sx/core/config.hpp"
#include "sx/core/io/event_queue.hpp"
#include "sx/core/io/event_source.hpp"

namespace sx {

// Synthetic interaction generator for development and soak runs. Not a capture backend.
//
// A producer thread draws one step at a time (typing burst, mouse move/click, focus change,
// idle period) and sleeps an exponentially distributed interval between steps. Events are
// stamped with wall-clock seconds and handed to the polling loop through an EventQueue.
class SynthEventSource final : public IEventSource {
 public:
  SynthEventSource(InputSynthConfig cfg, std::size_t queue_capacity);
  ~SynthEventSource() override;

  SynthEventSource(const SynthEventSource&) = delete;
  SynthEventSource& operator=(const SynthEventSource&) = delete;

  Status start() override;
  void stop() override;
  Status poll(double timeout_s, std::vector<InteractionEvent>* out) override;

  Seconds now_s() const override { return wall_now_s(); }
  std::string name() const override { return "synth"; }

  [[nodiscard]] std::uint64_t dropped() const { return queue_.dropped(); }

  // One generator step at time `now`; appends to `out` and returns the requested pause (s).
  // Exposed so tests can drive the generator without a thread.
  double step(Seconds now, std::vector<InteractionEvent>* out);

 private:
  void run();
  void sleep_for(double seconds);

  bool anomaly_active(Seconds now) const;
  void emit_typing_burst(Seconds now, int min_keys, int max_keys, double min_gap, double max_gap,
                         std::vector<InteractionEvent>* out);

  InputSynthConfig cfg_;
  EventQueue<InteractionEvent> queue_;

  std::mt19937 rng_;
  bool in_idle_{false};
  Seconds idle_start_{0.0};
  Seconds started_at_{0.0};

  std::atomic<bool> running_{false};
  std::mutex sleep_mu_;
  std::condition_variable sleep_cv_;
  std::thread worker_;
};

}  // namespace sx
