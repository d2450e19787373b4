// File: include/sx/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "sx/core/config.hpp"

namespace sx {

// Hash of every tunable that shapes scores (window, calibration, rules, weights, cadence).
// Two sessions with equal hashes were scored by identical formulas.
std::string compute_config_hash(const Config& cfg);

// Hash of a frozen baseline. Written to telemetry so a replay can be checked for the same profile.
std::string compute_baseline_hash(const BaselineProfile& profile);

}  // namespace sx
