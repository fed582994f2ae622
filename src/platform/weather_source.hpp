#ifndef PLATFORM_WEATHER_SOURCE_HPP
#define PLATFORM_WEATHER_SOURCE_HPP

#include "core/models.hpp"

#include <optional>
#include <string>

namespace idleview {
// Reads an Open-Meteo forecast response (current conditions plus the daily
// sunrise/sunset arrays) and converts temperature and wind speed to `units`.
bool parse_open_meteo(const std::string& json, const UnitsSettings& units, WeatherObservation& weather,
                      std::string& error);

std::optional<double> read_cpu_temp_celsius(const std::string& path = "/sys/class/thermal/thermal_zone0/temp");
}

class WeatherSource {
public:
    explicit WeatherSource(std::string cache_path);

    // Re-reads the cached provider response; nothing when there is none or
    // it cannot be parsed.
    std::optional<WeatherObservation> load(const UnitsSettings& units) const;

    const std::string& cache_path() const;

private:
    std::string m_cache_path;
};

#endif
