#include "platform/weather_source.hpp"

#include "test_support.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <string>

namespace {
const char* const kForecast = R"({
  "timezone": "Europe/Berlin",
  "current": {
    "temperature_2m": 20,
    "relative_humidity_2m": 55,
    "rain": 0.4,
    "snowfall": 0.0,
    "cloudcover": 75,
    "wind_speed_10m": 36.0
  },
  "daily": {
    "sunrise": ["2024-06-15T05:01", "2024-06-16T05:01"],
    "sunset": ["2024-06-15T21:30", "2024-06-16T21:31"]
  }
})";

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-6;
}
}

int main() {
    {
        UnitsSettings units;
        WeatherObservation weather;
        std::string error;
        assert(idleview::parse_open_meteo(kForecast, units, weather, error));
        assert(near(weather.temperature, 20.0));
        assert(weather.temperature_unit == "celsius");
        assert(near(weather.humidity, 55.0));
        assert(near(weather.wind_speed, 36.0));
        assert(weather.wind_speed_label == "km/h");
        assert(near(weather.cloudcover, 75.0));
        assert(near(weather.rain, 0.4));
        assert(near(weather.snowfall, 0.0));
        assert(weather.sunrise == "2024-06-15T05:01");
        assert(weather.sunset == "2024-06-15T21:30");
        assert(weather.timezone == "Europe/Berlin");
    }

    {
        UnitsSettings units;
        units.temperature_unit = "fahrenheit";
        units.wind_speed_unit = "ms";
        WeatherObservation weather;
        std::string error;
        assert(idleview::parse_open_meteo(kForecast, units, weather, error));
        assert(near(weather.temperature, 68.0));
        assert(weather.temperature_unit == "fahrenheit");
        assert(near(weather.wind_speed, 10.0));
        assert(weather.wind_speed_unit == "ms");
        assert(weather.wind_speed_label == "m/s");
    }

    {
        UnitsSettings units;
        WeatherObservation weather;
        weather.timezone = "untouched";
        std::string error;
        assert(!idleview::parse_open_meteo("{", units, weather, error));
        assert(!error.empty());
        assert(!idleview::parse_open_meteo(R"({"current":{}})", units, weather, error));
        assert(!idleview::parse_open_meteo(R"({"current":{"temperature_2m":1},"daily":{}})", units, weather, error));
        assert(weather.timezone == "untouched");
    }

    const std::filesystem::path dir = test_support::fresh_dir("weather-source");

    {
        const std::filesystem::path sensor = dir / "temp";
        test_support::write_text(sensor, "45600\n");
        auto celsius = idleview::read_cpu_temp_celsius(sensor.string());
        assert(celsius);
        assert(near(*celsius, 45.6));

        test_support::write_text(sensor, "garbage");
        assert(!idleview::read_cpu_temp_celsius(sensor.string()));
        assert(!idleview::read_cpu_temp_celsius((dir / "absent").string()));
    }

    {
        UnitsSettings units;
        assert(!WeatherSource("").load(units));
        assert(!WeatherSource((dir / "absent.json").string()).load(units));

        const std::filesystem::path cache = dir / "forecast.json";
        test_support::write_text(cache, "[]");
        assert(!WeatherSource(cache.string()).load(units));

        test_support::write_text(cache, kForecast);
        WeatherSource source(cache.string());
        assert(source.cache_path() == cache.string());
        auto weather = source.load(units);
        assert(weather);
        assert(weather->sunrise == "2024-06-15T05:01");
    }

    std::filesystem::remove_all(dir);
    return 0;
}
