#ifndef CORE_DISPLAY_FORMAT_HPP
#define CORE_DISPLAY_FORMAT_HPP

#include "core/models.hpp"

#include <glibmm/datetime.h>

#include <cstdint>
#include <string>

struct FormattedTime {
    std::string time;
    std::string date;
    std::string day_of_week;
    std::int64_t timestamp_ms = 0;
};

struct PrecipitationDisplay {
    std::string icon;
    std::string label;
    std::string value;
};

namespace idleview {
FormattedTime formatted_time(const Glib::DateTime& now, const UnitsSettings& units, std::int64_t timestamp_ms);
PrecipitationDisplay precipitation_display(const WeatherObservation& weather);

bool is_cache_valid(std::int64_t now_ms, std::int64_t cache_timestamp_ms, const PhotosSettings& photos);
std::string format_time_remaining(std::int64_t milliseconds);
std::string format_photo_age(std::int64_t now_ms, std::int64_t cache_timestamp_ms);

// Legacy labels map to fixed values, numeric strings in 0..100 are used
// as-is, everything else falls back to 80.
int resolve_photo_quality(const std::string& quality);

double convert_temperature(double celsius, const UnitsSettings& units);
double convert_wind_speed(double kmh, const UnitsSettings& units);
std::string wind_speed_label(const UnitsSettings& units);
std::string format_temperature(double value, const UnitsSettings& units);
std::string format_amount(double value, const char* unit);
std::string format_cpu_temp(double celsius, const UnitsSettings& units);

std::string photo_url_with_params(const std::string& url, int width, int height, int quality,
                                  std::int64_t timestamp_ms);
}

#endif
