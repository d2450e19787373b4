// src/core/util/config_loader.cpp
#include "sx/core/util/config_loader.hpp"

#include <filesystem>
#include <set>

#include <yaml-cpp/yaml.h>

namespace sx {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

// File paths inside a config are relative to the file that sets them, like includes.
static void resolve_relative_paths(YAML::Node& root, const fs::path& dir) {
  if (!is_map(root) || !is_map(root["input"])) return;
  YAML::Node input = root["input"];
  if (!is_map(input["replay"])) return;
  YAML::Node replay = input["replay"];
  if (!replay["path"] || !replay["path"].IsScalar()) return;

  const fs::path p = replay["path"].as<std::string>();
  if (p.empty() || p.is_absolute()) return;
  replay["path"] = (dir / p).lexically_normal().string();
}

static Result<YAML::Node> load_with_includes(const fs::path& path, std::set<std::string>& visiting) {
  std::error_code ec;
  const fs::path abs = fs::absolute(path, ec);
  const std::string key = (ec ? path : abs).lexically_normal().string();
  if (visiting.count(key)) {
    return Result<YAML::Node>::err(Status::invalid_argument("include cycle at " + path.string()));
  }
  visiting.insert(key);

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;
  const fs::path dir = path.parent_path();
  resolve_relative_paths(root, dir);

  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, visiting);
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);

  visiting.erase(key);
  return Result<YAML::Node>::ok(merged);
}

static void apply_baseline(const YAML::Node& b, BaselineConfig& out) {
  maybe_set(b, "calibration_s", out.calibration_s);
  maybe_set(b, "min_samples", out.min_samples);
  maybe_set(b, "early_fraction", out.early_fraction);
  maybe_set(b, "fallback_min_samples", out.fallback_min_samples);
  maybe_set(b, "typing_speed_evidence", out.typing_speed_evidence);
  maybe_set(b, "key_press_evidence", out.key_press_evidence);

  if (is_map(b["fallback"])) {
    const auto f = b["fallback"];
    maybe_set(f, "avg_typing_speed", out.fallback.avg_typing_speed);
    maybe_set(f, "avg_idle_duration", out.fallback.avg_idle_duration);
    maybe_set(f, "avg_focus_rate", out.fallback.avg_focus_rate);
  }
}

static void apply_detector(const YAML::Node& d, DetectorConfig& out) {
  maybe_set(d, "idle_multiplier", out.idle_multiplier);
  maybe_set(d, "typing_multiplier", out.typing_multiplier);
  maybe_set(d, "focus_multiplier", out.focus_multiplier);
  maybe_set(d, "drift_threshold", out.drift_threshold);
  maybe_set(d, "idle_scale", out.idle_scale);
  maybe_set(d, "focus_scale", out.focus_scale);
  maybe_set(d, "drift_scale", out.drift_scale);
  maybe_set(d, "idle_slope", out.idle_slope);
  maybe_set(d, "focus_slope", out.focus_slope);
  maybe_set(d, "drift_slope", out.drift_slope);
  maybe_set(d, "warning_band", out.warning_band);
  maybe_set(d, "critical_band", out.critical_band);
  maybe_set(d, "history_size", out.history_size);
}

static void apply_risk(const YAML::Node& r, RiskConfig& out) {
  maybe_set(r, "smoothing_window", out.smoothing_window);
  maybe_set(r, "weight_idle_burst", out.weight_idle_burst);
  maybe_set(r, "weight_focus_instability", out.weight_focus_instability);
  maybe_set(r, "weight_behavioral_drift", out.weight_behavioral_drift);
  maybe_set(r, "recency_weight", out.recency_weight);
}

static void apply_input(const YAML::Node& i, InputConfig& out) {
  maybe_set(i, "type", out.type);
  maybe_set(i, "tick_hz", out.tick_hz);
  maybe_set(i, "drain_timeout_s", out.drain_timeout_s);
  maybe_set(i, "queue_capacity", out.queue_capacity);
  maybe_set(i, "heartbeat_every_s", out.heartbeat_every_s);
  maybe_set(i, "max_ticks", out.max_ticks);
  maybe_set(i, "max_run_s", out.max_run_s);

  if (is_map(i["synth"])) {
    const auto s = i["synth"];
    maybe_set(s, "seed", out.synth.seed);
    maybe_set(s, "mean_event_interval_s", out.synth.mean_event_interval_s);
    maybe_set(s, "typing_burst_probability", out.synth.typing_burst_probability);
    maybe_set(s, "mouse_move_probability", out.synth.mouse_move_probability);
    maybe_set(s, "mouse_click_probability", out.synth.mouse_click_probability);
    maybe_set(s, "idle_probability", out.synth.idle_probability);
    maybe_set(s, "idle_exit_probability", out.synth.idle_exit_probability);
    maybe_set(s, "screen_width", out.synth.screen_width);
    maybe_set(s, "screen_height", out.synth.screen_height);
    maybe_set(s, "anomaly", out.synth.anomaly);
    maybe_set(s, "anomaly_start_s", out.synth.anomaly_start_s);
  }

  if (is_map(i["replay"])) {
    const auto r = i["replay"];
    maybe_set(r, "path", out.replay.path);
    maybe_set(r, "time_scale", out.replay.time_scale);
  }
}

static Result<Config> config_from_yaml(const YAML::Node& y) {
  Config cfg;  // defaults

  try {
    if (is_map(y["session"])) {
      maybe_set(y["session"], "id", cfg.session_id);
    }

    if (is_map(y["features"])) {
      maybe_set(y["features"], "window_s", cfg.features.window_s);
    }
    if (is_map(y["baseline"])) apply_baseline(y["baseline"], cfg.baseline);
    if (is_map(y["detector"])) apply_detector(y["detector"], cfg.detector);
    if (is_map(y["risk"])) apply_risk(y["risk"], cfg.risk);
    if (is_map(y["input"])) apply_input(y["input"], cfg.input);

    if (is_map(y["report"])) {
      const auto r = y["report"];
      maybe_set(r, "interval_s", cfg.report.interval_s);
      maybe_set(r, "source", cfg.report.source);
    }

    if (is_map(y["output"])) {
      const auto o = y["output"];
      maybe_set(o, "out_dir", cfg.output.out_dir);
      maybe_set(o, "reports_file", cfg.output.reports_file);
      maybe_set(o, "keep_runs", cfg.output.keep_runs);
    }
  } catch (const YAML::Exception& e) {
    // Typed conversion failures (e.g. "abc" for a double) surface here.
    return Result<Config>::err(Status::parse_error(std::string("bad config value: ") + e.what()));
  }

  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

Result<Config> load_config(const std::string& path_str) {
  std::set<std::string> visiting;
  auto yaml_r = load_with_includes(fs::path(path_str), visiting);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  return config_from_yaml(yaml_r.take_value());
}

Result<Config> load_config_from_string(const std::string& yaml_text) {
  YAML::Node y;
  try {
    y = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }
  if (y && !y.IsNull() && !y.IsMap()) {
    return Result<Config>::err(Status::invalid_argument("config root must be a YAML map"));
  }
  return config_from_yaml(y);
}

}  // namespace sx
