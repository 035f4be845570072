#pragma once

#include <cstdint>
#include <vector>

namespace exclusion_zone {
namespace world {

enum class WeatherType : uint8_t {
    Sunny = 0,
    Rainy,
    Foggy,
    TropicalMonsoon,
    TrentinoSnow
};

const char* getWeatherTypeName(WeatherType type);

// Weather forecast, tick length and starting hour handed to the simulation.
// The generator never interprets these values.
class EnvironmentalConditions {
public:
    // Throws ConfigError on an empty forecast, zero tick length or hour >= 24
    EnvironmentalConditions(const std::vector<WeatherType>& forecast,
                            uint32_t tickLengthMinutes, uint8_t initialHour);

    // Forecast emitted with every generated world
    static EnvironmentalConditions generatorDefault();

    const std::vector<WeatherType>& getForecast() const { return forecast; }
    uint32_t getTickLengthMinutes() const { return tickLengthMinutes; }
    uint8_t getInitialHour() const { return initialHour; }

private:
    std::vector<WeatherType> forecast;
    uint32_t tickLengthMinutes;
    uint8_t initialHour;
};

} // namespace world
} // namespace exclusion_zone
