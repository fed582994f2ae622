#ifndef CORE_MODELS_HPP
#define CORE_MODELS_HPP

#include <string>

struct UnitsSettings {
    std::string temperature_unit = "celsius";  // "celsius" or "fahrenheit"
    std::string time_format = "24h";           // "24h" or "12h"
    std::string date_format = "dmy";           // "mdy", "dmy", "ymd"
    std::string wind_speed_unit = "kmh";       // "kmh", "mph", "ms"

    bool operator==(const UnitsSettings& other) const {
        return temperature_unit == other.temperature_unit && time_format == other.time_format &&
               date_format == other.date_format && wind_speed_unit == other.wind_speed_unit;
    }
};

struct DisplaySettings {
    bool show_humidity_wind = true;
    bool show_precipitation_cloudiness = true;
    bool show_sunrise_sunset = true;
    bool show_cpu_temp = false;
    std::string theme = "default";

    bool operator==(const DisplaySettings& other) const {
        return show_humidity_wind == other.show_humidity_wind &&
               show_precipitation_cloudiness == other.show_precipitation_cloudiness &&
               show_sunrise_sunset == other.show_sunrise_sunset && show_cpu_temp == other.show_cpu_temp &&
               theme == other.theme;
    }
};

struct PhotosSettings {
    long long refresh_interval = 30;  // minutes
    std::string photo_quality = "80";  // "0".."100" or legacy "low"/"medium"/"high"/"maximum"

    bool operator==(const PhotosSettings& other) const {
        return refresh_interval == other.refresh_interval && photo_quality == other.photo_quality;
    }
};

struct SettingsDocument {
    UnitsSettings units;
    DisplaySettings display;
    PhotosSettings photos;

    bool operator==(const SettingsDocument& other) const {
        return units == other.units && display == other.display && photos == other.photos;
    }
    bool operator!=(const SettingsDocument& other) const { return !(*this == other); }
};

// Current conditions as delivered by the weather provider, already converted
// to the configured units. Sun times are naive local "YYYY-MM-DDTHH:MM".
struct WeatherObservation {
    double temperature = 0.0;
    std::string temperature_unit = "celsius";
    double humidity = 0.0;
    double wind_speed = 0.0;
    std::string wind_speed_unit = "kmh";
    std::string wind_speed_label = "km/h";
    double cloudcover = 0.0;
    double rain = 0.0;      // mm
    double snowfall = 0.0;  // cm
    std::string sunrise;
    std::string sunset;
    std::string timezone;
};

struct CurrentPhoto {
    std::string url;
    std::string author;
    std::string author_url;
};

#endif
