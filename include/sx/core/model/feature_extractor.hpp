// File: include/sx/core/model/feature_extractor.hpp
#pragma once

#include <cstddef>
#include <deque>

#include "sx/core/config.hpp"
#include "sx/core/types.hpp"

namespace sx {

// Sliding-window aggregator.
// Buffer contract:
//  - kept sorted by timestamp (append when in order, binary-search insert otherwise)
//  - after compute_features(now), holds nothing older than now - window_s
class FeatureExtractor {
 public:
  explicit FeatureExtractor(FeaturesConfig cfg = {});

  void add_event(const InteractionEvent& e);

  // Prunes, then aggregates the trailing window ending at `now`.
  // Never fails: an empty window yields zeros with the window bounds set.
  FeatureVector compute_features(Seconds now);

  void clear() { buffer_.clear(); }

  [[nodiscard]] std::size_t size() const noexcept { return buffer_.size(); }
  [[nodiscard]] Seconds window_duration() const noexcept { return cfg_.window_s; }

 private:
  void prune(Seconds now);

  FeaturesConfig cfg_;
  std::deque<InteractionEvent> buffer_;
};

}  // namespace sx
