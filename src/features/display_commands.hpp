#ifndef FEATURES_DISPLAY_COMMANDS_HPP
#define FEATURES_DISPLAY_COMMANDS_HPP

#include "core/context_engine.hpp"
#include "core/display_format.hpp"
#include "core/models.hpp"
#include "core/sun_time_cache.hpp"
#include "features/settings_store.hpp"

#include <glibmm/datetime.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

struct SettingsCommandResult {
    bool success = false;
    SettingsDocument settings;
    std::string error;
};

struct DebugRequest {
    std::optional<std::int64_t> cache_timestamp_ms;
    std::optional<std::string> query;
    std::optional<std::string> sunrise;
    std::optional<std::string> sunset;
    std::optional<double> temperature;
    std::optional<double> rain;
    std::optional<double> snowfall;
    std::optional<double> cloudcover;
};

struct DebugInfo {
    std::string photo_age;
    std::string query;
    std::string time_source;
    std::string time_of_day;
    std::string temperature;
    std::string rain;
    std::string snowfall;
    std::string cloudcover;
    std::string season;
};

// The command set the display window calls. Settings failures come back as a
// message for the user; everything else is total.
class DisplayCommands {
public:
    struct Clock {
        std::function<Glib::DateTime()> local_now;
        std::function<std::int64_t()> epoch_ms;
    };

    static Clock system_clock();

    DisplayCommands(SettingsStore& store, SunTimeCache& sun_cache, Clock clock = system_clock());

    SettingsCommandResult get_settings() const;
    SettingsCommandResult save_settings(const SettingsDocument& settings);
    SettingsCommandResult update_settings(const std::string& patch_json);
    SettingsCommandResult reset_settings();

    Season get_season() const;
    std::optional<std::string> get_holiday() const;
    TimeOfDay get_time_of_day(const std::optional<std::string>& sunrise,
                              const std::optional<std::string>& sunset) const;
    std::string build_photo_query(const WeatherObservation& weather, const std::optional<std::string>& sunrise,
                                  const std::optional<std::string>& sunset,
                                  std::optional<bool> enable_festive = std::nullopt) const;

    FormattedTime get_current_time() const;
    PrecipitationDisplay get_precipitation_display(const WeatherObservation& weather) const;
    bool is_cache_valid(std::int64_t cache_timestamp_ms) const;
    std::string format_time_remaining(std::int64_t milliseconds) const;
    std::string photo_url(const std::string& url, int width, int height) const;
    std::string get_cpu_temp(const std::string& sensor_path) const;
    DebugInfo get_debug_info(const DebugRequest& request) const;

private:
    static SettingsCommandResult to_command_result(const SettingsResult& result);

    SettingsStore& m_store;
    SunTimeCache& m_sun_cache;
    Clock m_clock;
};

#endif
