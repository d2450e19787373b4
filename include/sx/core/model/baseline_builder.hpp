// File: include/sx/core/model/baseline_builder.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "sx/core/config.hpp"
#include "sx/core/types.hpp"

namespace sx {

enum class CalibrationState {
  kUninitialized,
  kCalibrating,
  kCalibrated,  // terminal until reset()
};

const char* calibration_state_name(CalibrationState s) noexcept;

// Observes feature vectors during calibration and freezes a BaselineProfile once.
//
// Convergence:
//  - early: >= min_samples recorded AND >= early_fraction of calibration_s elapsed
//           AND some sample shows typing activity
//  - forced: first update after calibration_s has elapsed
// A forced build may still defer when no sample has typing data and fewer than
// fallback_min_samples were recorded; an empty history forces the fixed fallback profile.
class BaselineBuilder {
 public:
  explicit BaselineBuilder(BaselineConfig cfg = {});

  void start_calibration(Seconds t0);
  void update(const FeatureVector& fv, Seconds t);

  void reset();

  [[nodiscard]] bool is_calibrated() const noexcept { return state_ == CalibrationState::kCalibrated; }
  [[nodiscard]] CalibrationState state() const noexcept { return state_; }

  // Engaged only in kCalibrated.
  [[nodiscard]] const std::optional<BaselineProfile>& baseline() const noexcept { return baseline_; }

  // 0 before start, 100 once calibrated, else elapsed fraction of calibration_s (capped at 100).
  [[nodiscard]] double calibration_progress(Seconds now) const noexcept;

  // Samples currently held (history is released once the profile is frozen).
  [[nodiscard]] std::size_t sample_count() const noexcept { return history_.size(); }

  // Samples the frozen profile was computed from (0 for the fixed fallback).
  [[nodiscard]] std::size_t samples_used() const noexcept { return samples_used_; }
  [[nodiscard]] bool used_fallback() const noexcept { return used_fallback_; }

 private:
  bool has_typing_data() const;
  void build_baseline(bool forced);
  void freeze(const BaselineProfile& p, std::size_t samples_used, bool fallback);

  BaselineConfig cfg_;

  CalibrationState state_{CalibrationState::kUninitialized};
  Seconds calibration_start_{0.0};
  std::vector<FeatureVector> history_;

  std::optional<BaselineProfile> baseline_;
  std::size_t samples_used_{0};
  bool used_fallback_{false};
};

}  // namespace sx
