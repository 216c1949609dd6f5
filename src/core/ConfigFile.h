#pragma once
#include <string>
#include "Config.h"

namespace bacnet_scan {

// Applies a JSON object with camelCase keys (localName, lowLimit,
// configuredBbmdList, ...) onto cfg. Keys that are absent keep their current
// value; unknown keys are logged and ignored. Throws std::runtime_error on
// malformed JSON or ill-typed values.
void apply_config_json(const std::string& text, Config& cfg);
void load_config_file(const std::string& path, Config& cfg);

}
