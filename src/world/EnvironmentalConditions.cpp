#include "exclusion_zone/world/EnvironmentalConditions.h"
#include "exclusion_zone/utils/Errors.h"
#include <string>

namespace exclusion_zone {
namespace world {

const char* getWeatherTypeName(WeatherType type) {
    switch (type) {
        case WeatherType::Sunny: return "Sunny";
        case WeatherType::Rainy: return "Rainy";
        case WeatherType::Foggy: return "Foggy";
        case WeatherType::TropicalMonsoon: return "TropicalMonsoon";
        case WeatherType::TrentinoSnow: return "TrentinoSnow";
        default: return "Unknown";
    }
}

EnvironmentalConditions::EnvironmentalConditions(const std::vector<WeatherType>& forecast,
                                                 uint32_t tickLengthMinutes, uint8_t initialHour)
    : forecast(forecast)
    , tickLengthMinutes(tickLengthMinutes)
    , initialHour(initialHour) {
    if (forecast.empty()) {
        throw ConfigError("Weather forecast must contain at least one entry");
    }
    if (tickLengthMinutes == 0) {
        throw ConfigError("Tick length must be at least one minute");
    }
    if (initialHour >= 24) {
        throw ConfigError("Initial hour must be in [0, 24), got " + std::to_string(initialHour));
    }
}

EnvironmentalConditions EnvironmentalConditions::generatorDefault() {
    return EnvironmentalConditions(
        {WeatherType::Rainy, WeatherType::Sunny, WeatherType::Foggy,
         WeatherType::TropicalMonsoon, WeatherType::TrentinoSnow},
        1, 9);
}

} // namespace world
} // namespace exclusion_zone
