// include/sx/core/util/config_loader.hpp
#pragma once

#include <string>

#include "sx/core/config.hpp"
#include "sx/core/status.hpp"

namespace sx {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
// - So is a relative input.replay.path, against the file that sets it.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// Same, from an in-memory document (no includes). Used by tests and --set style overrides.
Result<Config> load_config_from_string(const std::string& yaml_text);

}  // namespace sx
