// File: src/core/model/baseline_builder.cpp
#include "sx/core/model/baseline_builder.hpp"

#include <algorithm>

namespace sx {

const char* calibration_state_name(CalibrationState s) noexcept {
  switch (s) {
    case CalibrationState::kUninitialized: return "uninitialized";
    case CalibrationState::kCalibrating: return "calibrating";
    case CalibrationState::kCalibrated: return "calibrated";
  }
  return "unknown";
}

BaselineBuilder::BaselineBuilder(BaselineConfig cfg) : cfg_(cfg) {}

void BaselineBuilder::start_calibration(Seconds t0) {
  history_.clear();
  baseline_.reset();
  samples_used_ = 0;
  used_fallback_ = false;
  calibration_start_ = t0;
  state_ = CalibrationState::kCalibrating;
}

void BaselineBuilder::reset() {
  history_.clear();
  history_.shrink_to_fit();
  baseline_.reset();
  samples_used_ = 0;
  used_fallback_ = false;
  calibration_start_ = 0.0;
  state_ = CalibrationState::kUninitialized;
}

void BaselineBuilder::update(const FeatureVector& fv, Seconds t) {
  switch (state_) {
    case CalibrationState::kCalibrated:
      return;
    case CalibrationState::kUninitialized:
      // First observation only anchors the calibration clock.
      start_calibration(t);
      return;
    case CalibrationState::kCalibrating:
      break;
  }

  const Seconds elapsed = t - calibration_start_;
  if (elapsed > cfg_.calibration_s) {
    build_baseline(/*forced=*/true);
    return;
  }

  history_.push_back(fv);

  const bool enough_samples = history_.size() >= static_cast<std::size_t>(cfg_.min_samples);
  const bool enough_time = elapsed >= cfg_.calibration_s * cfg_.early_fraction;
  if (enough_samples && enough_time && has_typing_data()) {
    build_baseline(/*forced=*/false);
  }
}

bool BaselineBuilder::has_typing_data() const {
  return std::any_of(history_.begin(), history_.end(), [this](const FeatureVector& fv) {
    return fv.avg_typing_speed > cfg_.typing_speed_evidence ||
           fv.key_press_count > cfg_.key_press_evidence;
  });
}

void BaselineBuilder::build_baseline(bool forced) {
  if (history_.empty()) {
    // Only reachable on the forced path; never leave the session uncalibrated.
    if (forced) freeze(cfg_.fallback, 0, /*fallback=*/true);
    return;
  }

  std::vector<const FeatureVector*> valid;
  valid.reserve(history_.size());
  for (const auto& fv : history_) {
    if (fv.avg_typing_speed > 0.0 || fv.key_press_count > 0) valid.push_back(&fv);
  }

  if (valid.empty()) {
    if (history_.size() < static_cast<std::size_t>(cfg_.fallback_min_samples)) {
      return;  // insufficient data: stay calibrating
    }
    for (const auto& fv : history_) valid.push_back(&fv);
  }

  double typing_sum = 0.0;
  double idle_sum = 0.0;
  double focus_sum = 0.0;
  for (const FeatureVector* fv : valid) {
    typing_sum += fv->avg_typing_speed;
    idle_sum += fv->avg_idle_duration;
    focus_sum += static_cast<double>(fv->focus_loss_count);
  }

  const double n = static_cast<double>(valid.size());

  // Per-window focus count -> per-minute rate, using the first valid window's length.
  Seconds window = valid.front()->window_length();
  if (window <= 0.0) window = 30.0;

  BaselineProfile p;
  p.avg_typing_speed = typing_sum / n;
  p.avg_idle_duration = idle_sum / n;
  p.avg_focus_rate = (focus_sum / n) * (60.0 / window);

  freeze(p, valid.size(), /*fallback=*/false);
}

void BaselineBuilder::freeze(const BaselineProfile& p, std::size_t samples_used, bool fallback) {
  baseline_ = p;
  samples_used_ = samples_used;
  used_fallback_ = fallback;
  state_ = CalibrationState::kCalibrated;

  // Release memory; the profile is all we keep.
  history_.clear();
  history_.shrink_to_fit();
}

double BaselineBuilder::calibration_progress(Seconds now) const noexcept {
  switch (state_) {
    case CalibrationState::kUninitialized: return 0.0;
    case CalibrationState::kCalibrated: return 100.0;
    case CalibrationState::kCalibrating: break;
  }
  if (cfg_.calibration_s <= 0.0) return 100.0;
  const double pct = (now - calibration_start_) / cfg_.calibration_s * 100.0;
  return std::clamp(pct, 0.0, 100.0);
}

}  // namespace sx
