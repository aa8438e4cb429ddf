#pragma once

#include <string>
#include <vector>

#include "chaosmine/core/config.h"
#include "chaosmine/util/json.h"

namespace chaosmine {

// Validate an EngineConfig for internal consistency.
//
// Returns a list of human-readable error strings. An empty list means "valid".
std::vector<std::string> validate_engine_config(const EngineConfig& cfg);

// Overlay a JSON document onto `base`. Keys that are absent keep their base value;
// tables (eras, zones, quirks, phase_thresholds, ...) are replaced wholesale when present.
//
// Throws EngineError(InvalidConfig) on malformed values or if the result fails
// validate_engine_config.
EngineConfig engine_config_from_json(const json::Value& doc, const EngineConfig& base = {});

EngineConfig engine_config_from_json_text(const std::string& text, const EngineConfig& base = {});

EngineConfig load_engine_config_file(const std::string& path);

json::Value engine_config_to_json(const EngineConfig& cfg);

// Writes engine_config_to_json(cfg) with a trailing newline. The file loads back
// through load_engine_config_file.
void save_engine_config_file(const std::string& path, const EngineConfig& cfg);

} // namespace chaosmine
