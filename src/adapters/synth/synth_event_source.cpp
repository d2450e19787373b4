// File: src/adapters/synth/synth_event_source.cpp
#include "sx/adapters/synth/synth_event_source.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace sx {
namespace {

constexpr double kIdleTickS = 0.1;
constexpr double kAnomalyShare = 0.5;  // fraction of steps replaced by the injected pattern

std::chrono::nanoseconds seconds_to_ns(double s) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(std::max(0.0, s)));
}

}  // namespace

SynthEventSource::SynthEventSource(InputSynthConfig cfg, std::size_t queue_capacity)
    : cfg_(std::move(cfg)), queue_(queue_capacity), rng_(cfg_.seed) {}

SynthEventSource::~SynthEventSource() { stop(); }

Status SynthEventSource::start() {
  if (running_.load()) return Status::ok_status();
  if (cfg_.mean_event_interval_s <= 0.0) {
    return Status::invalid_argument("SynthEventSource: mean_event_interval_s must be > 0");
  }

  in_idle_ = false;
  started_at_ = wall_now_s();
  running_.store(true);
  worker_ = std::thread([this] { run(); });
  return Status::ok_status();
}

void SynthEventSource::stop() {
  {
    std::lock_guard<std::mutex> lock(sleep_mu_);
    running_.store(false);
  }
  sleep_cv_.notify_all();
  queue_.wake();
  if (worker_.joinable()) worker_.join();
}

Status SynthEventSource::poll(double timeout_s, std::vector<InteractionEvent>* out) {
  if (!out) return Status::invalid_argument("SynthEventSource::poll: out is null");
  queue_.drain(seconds_to_ns(timeout_s), out);
  return Status::ok_status();
}

void SynthEventSource::run() {
  std::vector<InteractionEvent> batch;
  while (running_.load()) {
    batch.clear();
    const double pause = step(wall_now_s(), &batch);
    for (auto& e : batch) queue_.push(std::move(e));
    sleep_for(pause);
  }
}

void SynthEventSource::sleep_for(double seconds) {
  std::unique_lock<std::mutex> lock(sleep_mu_);
  sleep_cv_.wait_for(lock, seconds_to_ns(seconds), [this] { return !running_.load(); });
}

bool SynthEventSource::anomaly_active(Seconds now) const {
  if (cfg_.anomaly == "none" || cfg_.anomaly_start_s <= 0.0) return false;
  return now - started_at_ >= cfg_.anomaly_start_s;
}

void SynthEventSource::emit_typing_burst(Seconds now, int min_keys, int max_keys, double min_gap,
                                         double max_gap, std::vector<InteractionEvent>* out) {
  std::uniform_int_distribution<int> n_keys(min_keys, max_keys);
  std::uniform_real_distribution<double> gap(min_gap, max_gap);
  std::uniform_real_distribution<double> hold(0.05, 0.10);

  const int n = n_keys(rng_);
  for (int i = 0; i < n; ++i) {
    const Seconds press = now + i * gap(rng_);
    out->push_back(InteractionEvent::key_press(press));
    out->push_back(InteractionEvent::key_release(press + hold(rng_)));
  }
}

double SynthEventSource::step(Seconds now, std::vector<InteractionEvent>* out) {
  std::uniform_real_distribution<double> u01(0.0, 1.0);

  if (in_idle_) {
    if (u01(rng_) >= cfg_.idle_exit_probability) return kIdleTickS;
    in_idle_ = false;
    const double duration = now - idle_start_;
    out->push_back(InteractionEvent::idle(now, duration));
    out->push_back(InteractionEvent::idle(now, duration, /*ended=*/true));
  }

  if (anomaly_active(now) && u01(rng_) < kAnomalyShare) {
    if (cfg_.anomaly == "typing_burst") {
      // Paste-like bursts: many keys with almost no gap.
      emit_typing_burst(now, 15, 30, 0.01, 0.03, out);
    } else {
      out->push_back(InteractionEvent::focus(now, /*lost=*/true));
      out->push_back(InteractionEvent::focus(now + 0.2, /*lost=*/false));
    }
    std::exponential_distribution<double> interval(1.0 / cfg_.mean_event_interval_s);
    return interval(rng_);
  }

  if (u01(rng_) < cfg_.idle_probability * 0.1) {
    in_idle_ = true;
    idle_start_ = now;
    return kIdleTickS;
  }

  const double draw = u01(rng_);
  const double p_typing = cfg_.typing_burst_probability;
  const double p_move = p_typing + cfg_.mouse_move_probability;
  const double p_click = p_move + cfg_.mouse_click_probability;

  std::uniform_int_distribution<int> px(0, std::max(0, cfg_.screen_width));
  std::uniform_int_distribution<int> py(0, std::max(0, cfg_.screen_height));

  if (draw < p_typing) {
    emit_typing_burst(now, 1, 5, 0.05, 0.15, out);
  } else if (draw < p_move) {
    out->push_back(InteractionEvent::mouse(EventKind::kMouseMove, now, px(rng_), py(rng_)));
  } else if (draw < p_click) {
    out->push_back(InteractionEvent::mouse(EventKind::kMouseClick, now, px(rng_), py(rng_)));
  } else {
    out->push_back(InteractionEvent::focus(now, /*lost=*/u01(rng_) < 0.5));
  }

  std::exponential_distribution<double> interval(1.0 / cfg_.mean_event_interval_s);
  return interval(rng_);
}

}  // namespace sx
