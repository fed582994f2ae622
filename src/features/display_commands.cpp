#include "features/display_commands.hpp"

#include "platform/weather_source.hpp"

#include <glib.h>
#include <utility>

DisplayCommands::Clock DisplayCommands::system_clock() {
    Clock clock;
    clock.local_now = idleview::naive_local_now;
    clock.epoch_ms = []() { return static_cast<std::int64_t>(g_get_real_time() / 1000); };
    return clock;
}

DisplayCommands::DisplayCommands(SettingsStore& store, SunTimeCache& sun_cache, Clock clock)
    : m_store(store),
      m_sun_cache(sun_cache),
      m_clock(std::move(clock)) {}

SettingsCommandResult DisplayCommands::get_settings() const {
    SettingsCommandResult result;
    result.success = true;
    result.settings = m_store.get();
    return result;
}

SettingsCommandResult DisplayCommands::save_settings(const SettingsDocument& settings) {
    return to_command_result(m_store.replace(settings));
}

SettingsCommandResult DisplayCommands::update_settings(const std::string& patch_json) {
    return to_command_result(m_store.merge_patch(patch_json));
}

SettingsCommandResult DisplayCommands::reset_settings() {
    return to_command_result(m_store.reset());
}

Season DisplayCommands::get_season() const {
    return idleview::season(m_clock.local_now());
}

std::optional<std::string> DisplayCommands::get_holiday() const {
    return idleview::holiday(m_clock.local_now());
}

TimeOfDay DisplayCommands::get_time_of_day(const std::optional<std::string>& sunrise,
                                           const std::optional<std::string>& sunset) const {
    return idleview::time_of_day(m_clock.local_now(), m_sun_cache, sunrise, sunset);
}

std::string DisplayCommands::build_photo_query(const WeatherObservation& weather,
                                               const std::optional<std::string>& sunrise,
                                               const std::optional<std::string>& sunset,
                                               std::optional<bool> enable_festive) const {
    return idleview::photo_query(m_clock.local_now(), m_sun_cache, weather, sunrise, sunset,
                                 enable_festive.value_or(true));
}

FormattedTime DisplayCommands::get_current_time() const {
    return idleview::formatted_time(m_clock.local_now(), m_store.get().units, m_clock.epoch_ms());
}

PrecipitationDisplay DisplayCommands::get_precipitation_display(const WeatherObservation& weather) const {
    return idleview::precipitation_display(weather);
}

bool DisplayCommands::is_cache_valid(std::int64_t cache_timestamp_ms) const {
    return idleview::is_cache_valid(m_clock.epoch_ms(), cache_timestamp_ms, m_store.get().photos);
}

std::string DisplayCommands::format_time_remaining(std::int64_t milliseconds) const {
    return idleview::format_time_remaining(milliseconds);
}

std::string DisplayCommands::photo_url(const std::string& url, int width, int height) const {
    const int quality = idleview::resolve_photo_quality(m_store.get().photos.photo_quality);
    return idleview::photo_url_with_params(url, width, height, quality, m_clock.epoch_ms());
}

std::string DisplayCommands::get_cpu_temp(const std::string& sensor_path) const {
    auto celsius = idleview::read_cpu_temp_celsius(sensor_path);
    if (!celsius) {
        return "";
    }
    return idleview::format_cpu_temp(*celsius, m_store.get().units);
}

DebugInfo DisplayCommands::get_debug_info(const DebugRequest& request) const {
    const UnitsSettings units = m_store.get().units;
    const TimeOfDay tod = get_time_of_day(request.sunrise, request.sunset);

    DebugInfo info;
    info.photo_age = request.cache_timestamp_ms
                         ? idleview::format_photo_age(m_clock.epoch_ms(), *request.cache_timestamp_ms)
                         : "unknown";
    info.query = request.query.value_or("n/a");
    info.time_source = idleview::time_source_name(tod.source);
    info.time_of_day = idleview::day_phase_name(tod.phase);
    info.temperature = request.temperature ? idleview::format_temperature(*request.temperature, units) : "n/a";
    info.rain = request.rain ? idleview::format_amount(*request.rain, "mm") : "n/a";
    info.snowfall = request.snowfall ? idleview::format_amount(*request.snowfall, "cm") : "n/a";
    info.cloudcover = request.cloudcover ? std::to_string(static_cast<int>(*request.cloudcover)) + "%" : "n/a";
    info.season = idleview::season_name(get_season());
    return info;
}

SettingsCommandResult DisplayCommands::to_command_result(const SettingsResult& result) {
    SettingsCommandResult command;
    command.success = result.success;
    command.settings = result.settings;
    command.error = result.error;
    return command;
}
