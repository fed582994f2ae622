#include "features/display_commands.hpp"

#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <string>

namespace {
constexpr std::int64_t kNowMs = 1'720'612'800'000;

DisplayCommands::Clock fixed_clock() {
    DisplayCommands::Clock clock;
    clock.local_now = []() { return idleview::naive_time(2024, 7, 10, 12, 0); };
    clock.epoch_ms = []() { return kNowMs; };
    return clock;
}
}

int main() {
    const std::filesystem::path dir = test_support::fresh_dir("display-commands");
    SettingsStore store((dir / "settings.json").string());
    assert(store.initialize().success);
    SunTimeCache cache;
    DisplayCommands commands(store, cache, fixed_clock());

    {
        SettingsCommandResult result = commands.get_settings();
        assert(result.success);
        assert(result.settings == SettingsDocument());
        assert(result.error.empty());
    }

    {
        FormattedTime now = commands.get_current_time();
        assert(now.time == "12:00");
        assert(now.date == "10 Jul 2024");
        assert(now.day_of_week == "WEDNESDAY");
        assert(now.timestamp_ms == kNowMs);

        SettingsCommandResult result = commands.update_settings(R"({"units":{"time_format":"12h","date_format":"ymd"}})");
        assert(result.success);
        assert(result.settings.units.time_format == "12h");
        now = commands.get_current_time();
        assert(now.time == "12:00 PM");
        assert(now.date == "2024 Jul 10");
    }

    {
        SettingsCommandResult result = commands.update_settings(R"({"photos":{"refresh_interval":"soon"}})");
        assert(!result.success);
        assert(!result.error.empty());
        assert(store.get().photos.refresh_interval == 30);

        result = commands.update_settings(R"({"photos":{"refresh_interval":200000000000000}})");
        assert(!result.success);
        assert(store.get().photos.refresh_interval == 30);
        assert(commands.is_cache_valid(kNowMs - 29 * 60 * 1000));

        SettingsDocument settings = store.get();
        settings.photos.photo_quality = "high";
        settings.photos.refresh_interval = 10;
        result = commands.save_settings(settings);
        assert(result.success);
        assert(commands.get_settings().settings == settings);
    }

    {
        assert(commands.get_season() == Season::Summer);
        assert(!commands.get_holiday());

        TimeOfDay tod = commands.get_time_of_day(std::string("2024-07-10T05:30"), std::string("2024-07-10T21:00"));
        assert(tod.phase == DayPhase::Day);
        assert(tod.source == TimeSource::Api);

        WeatherObservation cloudy;
        cloudy.cloudcover = 90;
        assert(commands.build_photo_query(cloudy, std::string("2024-07-10T05:30"), std::string("2024-07-10T21:00")) ==
               "summer cloudy");
        assert(commands.build_photo_query(cloudy, std::nullopt, std::nullopt, false) == "summer night");
    }

    {
        // refresh_interval is 10 minutes at this point.
        assert(commands.is_cache_valid(kNowMs - 9 * 60 * 1000));
        assert(!commands.is_cache_valid(kNowMs - 10 * 60 * 1000));
        assert(commands.format_time_remaining(65000) == "1m 05s");

        assert(commands.photo_url("https://img.example/p1?q=75", 800, 480) ==
               "https://img.example/p1?q=75&w=800&h=480&fit=crop&q=100&t=" + std::to_string(kNowMs));

        WeatherObservation snowy;
        snowy.snowfall = 1.5;
        assert(commands.get_precipitation_display(snowy).value == "1.5 cm");
    }

    {
        const std::filesystem::path sensor = dir / "thermal";
        test_support::write_text(sensor, "45600\n");
        assert(commands.get_cpu_temp(sensor.string()) == "46 °C");
        assert(commands.get_cpu_temp((dir / "missing").string()).empty());
    }

    {
        DebugRequest request;
        request.cache_timestamp_ms = kNowMs - 90 * 1000;
        request.query = "summer cloudy";
        request.sunrise = "2024-07-10T05:30";
        request.sunset = "2024-07-10T21:00";
        request.temperature = 21.5;
        request.rain = 1.2;
        request.cloudcover = 80.0;

        DebugInfo info = commands.get_debug_info(request);
        assert(info.photo_age == "1m ago");
        assert(info.query == "summer cloudy");
        assert(info.time_source == "api");
        assert(info.time_of_day == "day");
        assert(info.temperature == "21.5°C");
        assert(info.rain == "1.2mm");
        assert(info.snowfall == "n/a");
        assert(info.cloudcover == "80%");
        assert(info.season == "summer");

        info = commands.get_debug_info(DebugRequest());
        assert(info.photo_age == "unknown");
        assert(info.query == "n/a");
        assert(info.time_source == "fallback");
        assert(info.time_of_day == "night");
    }

    {
        SettingsCommandResult result = commands.reset_settings();
        assert(result.success);
        assert(result.settings == SettingsDocument());
        assert(commands.get_current_time().time == "12:00");
    }

    std::filesystem::remove_all(dir);
    return 0;
}
