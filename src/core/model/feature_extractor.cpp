// File: src/core/model/feature_extractor.cpp
#include "sx/core/model/feature_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace sx {

FeatureExtractor::FeatureExtractor(FeaturesConfig cfg) : cfg_(cfg) {}

void FeatureExtractor::add_event(const InteractionEvent& e) {
  if (buffer_.empty() || e.timestamp >= buffer_.back().timestamp) {
    buffer_.push_back(e);
    return;
  }

  // Rare out-of-order delivery: insert after any events with an equal timestamp.
  const auto pos = std::upper_bound(
      buffer_.begin(), buffer_.end(), e.timestamp,
      [](Seconds t, const InteractionEvent& b) { return t < b.timestamp; });
  buffer_.insert(pos, e);
}

void FeatureExtractor::prune(Seconds now) {
  const Seconds cutoff = now - cfg_.window_s;
  while (!buffer_.empty() && buffer_.front().timestamp < cutoff) {
    buffer_.pop_front();
  }
}

FeatureVector FeatureExtractor::compute_features(Seconds now) {
  prune(now);

  FeatureVector fv;
  fv.window_start = now - cfg_.window_s;
  fv.window_end = now;

  int key_presses = 0;
  Seconds first_press = 0.0;
  Seconds last_press = 0.0;

  double idle_sum = 0.0;
  int idle_n = 0;

  int mouse_n = 0;
  double mouse_distance = 0.0;
  Seconds first_move = 0.0;
  Seconds last_move = 0.0;
  std::int32_t prev_x = 0;
  std::int32_t prev_y = 0;

  // Buffer is sorted, so one pass gives consecutive deltas directly.
  for (const auto& e : buffer_) {
    switch (e.kind) {
      case EventKind::kKeyPress:
        if (key_presses == 0) first_press = e.timestamp;
        last_press = e.timestamp;
        ++key_presses;
        break;

      case EventKind::kIdlePeriod:
        idle_sum += e.duration;
        ++idle_n;
        break;

      case EventKind::kFocusLost:
        ++fv.focus_loss_count;
        break;

      case EventKind::kMouseMove:
        if (mouse_n == 0) {
          first_move = e.timestamp;
        } else {
          const double dx = static_cast<double>(e.x) - static_cast<double>(prev_x);
          const double dy = static_cast<double>(e.y) - static_cast<double>(prev_y);
          mouse_distance += std::sqrt(dx * dx + dy * dy);
        }
        last_move = e.timestamp;
        prev_x = e.x;
        prev_y = e.y;
        ++mouse_n;
        break;

      default:
        break;
    }
  }

  fv.key_press_count = key_presses;
  if (key_presses >= 2) {
    // Mean of consecutive deltas telescopes to (last - first) / (n - 1).
    fv.inter_key_interval = (last_press - first_press) / static_cast<double>(key_presses - 1);

    const Seconds span = now - fv.window_start;
    if (span > 0.0) {
      fv.avg_typing_speed = (static_cast<double>(key_presses) / span) * 60.0;
    }
  }

  if (idle_n > 0) fv.avg_idle_duration = idle_sum / static_cast<double>(idle_n);

  if (mouse_n >= 2) {
    const Seconds span = last_move - first_move;
    if (span > 0.0) fv.avg_mouse_speed = mouse_distance / span;
  }

  return fv;
}

}  // namespace sx
