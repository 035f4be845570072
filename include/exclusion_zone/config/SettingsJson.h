#pragma once

#include "exclusion_zone/generation/WorldGenerator.h"
#include <nlohmann/json.hpp>
#include <string>

namespace exclusion_zone {
namespace config {

// Serialize every generator setting. Ranges are {"start", "end"} objects,
// the spawn order is a list of phase names.
nlohmann::json settingsToJson(const generation::WorldGeneratorSettings& settings);

// Override fields of `settings` with the keys present in the JSON text.
// Missing keys keep their current value. On failure the error is logged,
// `settings` is left untouched and false is returned.
bool loadSettingsJsonString(const std::string& text, generation::WorldGeneratorSettings& settings);
bool loadSettingsJson(const std::string& path, generation::WorldGeneratorSettings& settings);

// Same as above, except that when the JSON changes "size" the size-derived defaults
// are rebuilt for the new size (keeping the effective seed) before the keys apply.
bool loadScaledSettingsJsonString(const std::string& text, generation::WorldGeneratorSettings& settings);
bool loadScaledSettingsJson(const std::string& path, generation::WorldGeneratorSettings& settings);

bool saveSettingsJson(const std::string& path, const generation::WorldGeneratorSettings& settings);

} // namespace config
} // namespace exclusion_zone
