// File: src/core/util/repro_hash.cpp
#include "sx/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

namespace sx {
namespace {

// FNV-1a 64-bit. Not cryptographic; stable fingerprints only.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_string(const std::string& s) {
    // Length prefix so ("ab","c") != ("a","bc").
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) { add_u64(std::bit_cast<std::uint64_t>(v)); }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_profile(Fnv1a64& h, const BaselineProfile& p) {
  h.add_double(p.avg_typing_speed);
  h.add_double(p.avg_idle_duration);
  h.add_double(p.avg_focus_rate);
}

}  // namespace

std::string compute_baseline_hash(const BaselineProfile& profile) {
  Fnv1a64 h;
  add_profile(h, profile);
  return to_hex(h.h);
}

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  h.add_double(cfg.features.window_s);

  // Calibration.
  h.add_double(cfg.baseline.calibration_s);
  h.add_i32(cfg.baseline.min_samples);
  h.add_double(cfg.baseline.early_fraction);
  h.add_i32(cfg.baseline.fallback_min_samples);
  h.add_double(cfg.baseline.typing_speed_evidence);
  h.add_i32(cfg.baseline.key_press_evidence);
  add_profile(h, cfg.baseline.fallback);

  // Rules.
  const auto& d = cfg.detector;
  h.add_double(d.idle_multiplier);
  h.add_double(d.typing_multiplier);
  h.add_double(d.focus_multiplier);
  h.add_double(d.drift_threshold);
  h.add_double(d.idle_scale);
  h.add_double(d.focus_scale);
  h.add_double(d.drift_scale);
  h.add_double(d.idle_slope);
  h.add_double(d.focus_slope);
  h.add_double(d.drift_slope);

  // Risk.
  h.add_i32(cfg.risk.smoothing_window);
  h.add_double(cfg.risk.weight_idle_burst);
  h.add_double(cfg.risk.weight_focus_instability);
  h.add_double(cfg.risk.weight_behavioral_drift);
  h.add_double(cfg.risk.recency_weight);

  // Cadence and input.
  h.add_string(cfg.input.type);
  h.add_double(cfg.input.tick_hz);
  h.add_double(cfg.report.interval_s);
  h.add_i64(static_cast<std::int64_t>(cfg.input.synth.seed));
  h.add_string(cfg.input.synth.anomaly);
  h.add_double(cfg.input.synth.anomaly_start_s);
  h.add_string(cfg.input.replay.path);

  return to_hex(h.h);
}

}  // namespace sx
