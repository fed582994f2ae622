#include "core/display_format.hpp"
#include "core/sun_time_cache.hpp"

#include <cassert>
#include <cmath>
#include <limits>
#include <string>

namespace {
UnitsSettings units(const char* temperature, const char* time, const char* date, const char* wind) {
    UnitsSettings settings;
    settings.temperature_unit = temperature;
    settings.time_format = time;
    settings.date_format = date;
    settings.wind_speed_unit = wind;
    return settings;
}

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-6;
}
}

int main() {
    {
        const Glib::DateTime now = idleview::naive_time(2025, 11, 28, 15, 7);

        FormattedTime formatted = idleview::formatted_time(now, units("celsius", "24h", "dmy", "kmh"), 1234);
        assert(formatted.time == "15:07");
        assert(formatted.date == "28 Nov 2025");
        assert(formatted.day_of_week == "FRIDAY");
        assert(formatted.timestamp_ms == 1234);

        formatted = idleview::formatted_time(now, units("celsius", "12h", "mdy", "kmh"), 0);
        assert(formatted.time == "3:07 PM");
        assert(formatted.date == "Nov 28, 2025");

        formatted = idleview::formatted_time(now, units("celsius", "24h", "ymd", "kmh"), 0);
        assert(formatted.date == "2025 Nov 28");

        // Unknown labels read as the defaults of their branch.
        formatted = idleview::formatted_time(now, units("celsius", "bogus", "bogus", "kmh"), 0);
        assert(formatted.time == "15:07");
        assert(formatted.date == "Nov 28, 2025");

        formatted = idleview::formatted_time(idleview::naive_time(2025, 11, 28, 0, 5),
                                             units("celsius", "12h", "dmy", "kmh"), 0);
        assert(formatted.time == "12:05 AM");
    }

    {
        WeatherObservation weather;
        PrecipitationDisplay display = idleview::precipitation_display(weather);
        assert(display.label == "Precip");
        assert(display.value == "Clear");
        assert(display.icon == "umbrella.svg");

        weather.rain = 3.2;
        display = idleview::precipitation_display(weather);
        assert(display.label == "Rain");
        assert(display.value == "3.2 mm");

        weather.snowfall = 2.0;
        display = idleview::precipitation_display(weather);
        assert(display.label == "Snow");
        assert(display.value == "2.0 cm");
        assert(display.icon == "snowflake.svg");
    }

    {
        PhotosSettings photos;
        photos.refresh_interval = 30;
        const std::int64_t now = 10'000'000'000;
        assert(idleview::is_cache_valid(now, now - 29 * 60 * 1000, photos));
        assert(!idleview::is_cache_valid(now, now - 30 * 60 * 1000, photos));
        assert(idleview::is_cache_valid(now, now + 5000, photos));
        photos.refresh_interval = 1;
        assert(!idleview::is_cache_valid(now, now - 61 * 1000, photos));

        photos.refresh_interval = 153722867280912LL;
        assert(idleview::is_cache_valid(now, 0, photos));
        assert(idleview::is_cache_valid(std::numeric_limits<std::int64_t>::max(), 0, photos));
        photos.refresh_interval = 200000000000000LL;
        assert(idleview::is_cache_valid(0, 0, photos));
        assert(idleview::is_cache_valid(std::numeric_limits<std::int64_t>::max(), 0, photos));
    }

    {
        assert(idleview::format_time_remaining(0) == "0s");
        assert(idleview::format_time_remaining(-500) == "0s");
        assert(idleview::format_time_remaining(5000) == "5s");
        assert(idleview::format_time_remaining(65000) == "1m 05s");
        assert(idleview::format_time_remaining(3723000) == "1h 02m");
    }

    {
        const std::int64_t now = 1'000'000'000;
        assert(idleview::format_photo_age(now, now - 30 * 1000) == "30s ago");
        assert(idleview::format_photo_age(now, now - 90 * 1000) == "1m ago");
        assert(idleview::format_photo_age(now, now - 2LL * 3600 * 1000) == "2h ago");
        assert(idleview::format_photo_age(now, now - 3LL * 86400 * 1000) == "3d ago");
        assert(idleview::format_photo_age(now, now + 60 * 1000) == "0s ago");
    }

    {
        assert(idleview::resolve_photo_quality("low") == 65);
        assert(idleview::resolve_photo_quality("medium") == 80);
        assert(idleview::resolve_photo_quality("high") == 100);
        assert(idleview::resolve_photo_quality("maximum") == 100);
        assert(idleview::resolve_photo_quality("85") == 85);
        assert(idleview::resolve_photo_quality("0") == 0);
        assert(idleview::resolve_photo_quality("100") == 100);
        assert(idleview::resolve_photo_quality("150") == 80);
        assert(idleview::resolve_photo_quality("-5") == 80);
        assert(idleview::resolve_photo_quality("abc") == 80);
        assert(idleview::resolve_photo_quality("") == 80);
    }

    {
        const UnitsSettings metric = units("celsius", "24h", "dmy", "kmh");
        const UnitsSettings imperial = units("fahrenheit", "12h", "mdy", "mph");
        const UnitsSettings si = units("celsius", "24h", "dmy", "ms");

        assert(near(idleview::convert_temperature(20.0, metric), 20.0));
        assert(near(idleview::convert_temperature(20.0, imperial), 68.0));
        assert(near(idleview::convert_wind_speed(36.0, metric), 36.0));
        assert(near(idleview::convert_wind_speed(36.0, si), 10.0));
        assert(near(idleview::convert_wind_speed(100.0, imperial), 62.1371));
        assert(idleview::wind_speed_label(metric) == "km/h");
        assert(idleview::wind_speed_label(imperial) == "mph");
        assert(idleview::wind_speed_label(si) == "m/s");
        assert(idleview::format_temperature(21.5, metric) == "21.5°C");
        assert(idleview::format_temperature(70.0, imperial) == "70.0°F");
        assert(idleview::format_amount(1.2, "mm") == "1.2mm");

        assert(idleview::format_cpu_temp(45.6, metric) == "46 °C");
        assert(idleview::format_cpu_temp(45.6, imperial) == "114 °F");
        assert(idleview::format_cpu_temp(0.0, metric).empty());
    }

    {
        assert(idleview::photo_url_with_params("https://img.example/p1?ixid=abc&q=80&w=1080", 1920, 1080, 90, 123) ==
               "https://img.example/p1?ixid=abc&w=1080&w=1920&h=1080&fit=crop&q=90&t=123");
        assert(idleview::photo_url_with_params("https://img.example/p1?ixid=abc&q=80", 800, 480, 65, 7) ==
               "https://img.example/p1?ixid=abc&w=800&h=480&fit=crop&q=65&t=7");
        assert(idleview::photo_url_with_params("https://img.example/p1", 800, 480, 100, 7) ==
               "https://img.example/p1?w=800&h=480&fit=crop&q=100&t=7");
    }

    return 0;
}
