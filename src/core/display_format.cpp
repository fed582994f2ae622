#include "core/display_format.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace {
constexpr int kDefaultPhotoQuality = 80;

std::string one_decimal(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

std::string two_digits(std::int64_t value) {
    std::ostringstream out;
    out << std::setw(2) << std::setfill('0') << value;
    return out.str();
}

bool is_fahrenheit(const UnitsSettings& units) {
    return units.temperature_unit == "fahrenheit";
}
}

FormattedTime idleview::formatted_time(const Glib::DateTime& now, const UnitsSettings& units,
                                       std::int64_t timestamp_ms) {
    FormattedTime formatted;
    formatted.time = now.format(units.time_format == "12h" ? "%-I:%M %p" : "%H:%M").raw();

    if (units.date_format == "dmy") {
        formatted.date = now.format("%d %b %Y").raw();
    } else if (units.date_format == "ymd") {
        formatted.date = now.format("%Y %b %d").raw();
    } else {
        formatted.date = now.format("%b %d, %Y").raw();
    }

    formatted.day_of_week = now.format("%A").uppercase().raw();
    formatted.timestamp_ms = timestamp_ms;
    return formatted;
}

PrecipitationDisplay idleview::precipitation_display(const WeatherObservation& weather) {
    if (weather.snowfall > 0.0) {
        return {"snowflake.svg", "Snow", one_decimal(weather.snowfall) + " cm"};
    }
    if (weather.rain > 0.0) {
        return {"droplets.svg", "Rain", one_decimal(weather.rain) + " mm"};
    }
    return {"umbrella.svg", "Precip", "Clear"};
}

bool idleview::is_cache_valid(std::int64_t now_ms, std::int64_t cache_timestamp_ms, const PhotosSettings& photos) {
    constexpr std::int64_t kMsPerMinute = 60 * 1000;
    const std::int64_t age = cache_timestamp_ms >= now_ms ? 0 : now_ms - cache_timestamp_ms;
    // Intervals too long to express in milliseconds never expire.
    if (photos.refresh_interval > std::numeric_limits<std::int64_t>::max() / kMsPerMinute) {
        return true;
    }
    return age < static_cast<std::int64_t>(photos.refresh_interval) * kMsPerMinute;
}

std::string idleview::format_time_remaining(std::int64_t milliseconds) {
    if (milliseconds <= 0) {
        return "0s";
    }

    const std::int64_t total_seconds = milliseconds / 1000;
    const std::int64_t hours = total_seconds / 3600;
    const std::int64_t minutes = (total_seconds % 3600) / 60;
    const std::int64_t seconds = total_seconds % 60;

    if (hours > 0) {
        return std::to_string(hours) + "h " + two_digits(minutes) + "m";
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + two_digits(seconds) + "s";
    }
    return std::to_string(seconds) + "s";
}

std::string idleview::format_photo_age(std::int64_t now_ms, std::int64_t cache_timestamp_ms) {
    const std::int64_t seconds = std::max<std::int64_t>(0, now_ms - cache_timestamp_ms) / 1000;
    if (seconds < 60) {
        return std::to_string(seconds) + "s ago";
    }
    const std::int64_t minutes = seconds / 60;
    if (minutes < 60) {
        return std::to_string(minutes) + "m ago";
    }
    const std::int64_t hours = minutes / 60;
    if (hours < 24) {
        return std::to_string(hours) + "h ago";
    }
    return std::to_string(hours / 24) + "d ago";
}

int idleview::resolve_photo_quality(const std::string& quality) {
    if (quality == "low") {
        return 65;
    }
    if (quality == "medium") {
        return 80;
    }
    if (quality == "high" || quality == "maximum") {
        return 100;
    }

    if (quality.empty() || quality.size() > 3 ||
        !std::all_of(quality.begin(), quality.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
        return kDefaultPhotoQuality;
    }
    const int value = std::atoi(quality.c_str());
    return value <= 100 ? value : kDefaultPhotoQuality;
}

double idleview::convert_temperature(double celsius, const UnitsSettings& units) {
    return is_fahrenheit(units) ? celsius * 9.0 / 5.0 + 32.0 : celsius;
}

double idleview::convert_wind_speed(double kmh, const UnitsSettings& units) {
    if (units.wind_speed_unit == "mph") {
        return kmh * 0.621371;
    }
    if (units.wind_speed_unit == "ms") {
        return kmh / 3.6;
    }
    return kmh;
}

std::string idleview::wind_speed_label(const UnitsSettings& units) {
    if (units.wind_speed_unit == "mph") {
        return "mph";
    }
    if (units.wind_speed_unit == "ms") {
        return "m/s";
    }
    return "km/h";
}

std::string idleview::format_temperature(double value, const UnitsSettings& units) {
    return one_decimal(value) + (is_fahrenheit(units) ? "°F" : "°C");
}

std::string idleview::format_amount(double value, const char* unit) {
    return one_decimal(value) + unit;
}

std::string idleview::format_cpu_temp(double celsius, const UnitsSettings& units) {
    if (celsius <= 0.0) {
        return "";
    }
    const long rounded = std::lround(convert_temperature(celsius, units));
    return std::to_string(rounded) + (is_fahrenheit(units) ? " °F" : " °C");
}

std::string idleview::photo_url_with_params(const std::string& url, int width, int height, int quality,
                                            std::int64_t timestamp_ms) {
    std::string base = url;
    size_t pos = base.find("&q=");
    if (pos != std::string::npos) {
        size_t end = base.find('&', pos + 1);
        if (end != std::string::npos) {
            base.erase(pos, end - pos);
        } else {
            base.erase(pos);
        }
    }

    const char* separator = base.find('?') != std::string::npos ? "&" : "?";
    return base + separator + "w=" + std::to_string(width) + "&h=" + std::to_string(height) +
           "&fit=crop&q=" + std::to_string(quality) + "&t=" + std::to_string(timestamp_ms);
}
