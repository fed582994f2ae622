#include "core/context_engine.hpp"

namespace {
constexpr int kTwilightMinutes = 30;
constexpr double kPrecipitationThreshold = 0.5;
constexpr double kCloudyThreshold = 70.0;

bool within(const Glib::DateTime& now, const Glib::DateTime& start, const Glib::DateTime& end) {
    return now.compare(start) >= 0 && now.compare(end) <= 0;
}
}

const char* idleview::season_name(Season season) {
    switch (season) {
        case Season::Spring: return "spring";
        case Season::Summer: return "summer";
        case Season::Autumn: return "autumn";
        case Season::Winter: return "winter";
    }
    return "winter";
}

const char* idleview::day_phase_name(DayPhase phase) {
    switch (phase) {
        case DayPhase::Dawn: return "dawn";
        case DayPhase::Day: return "day";
        case DayPhase::Dusk: return "dusk";
        case DayPhase::Night: return "night";
    }
    return "night";
}

const char* idleview::time_source_name(TimeSource source) {
    return source == TimeSource::Api ? "api" : "fallback";
}

Season idleview::season(const Glib::DateTime& now) {
    switch (now.get_month()) {
        case 3:
        case 4:
        case 5:
            return Season::Spring;
        case 6:
        case 7:
        case 8:
            return Season::Summer;
        case 9:
        case 10:
        case 11:
            return Season::Autumn;
        default:
            return Season::Winter;
    }
}

TimeOfDay idleview::time_of_day(const Glib::DateTime& now, SunTimeCache& cache,
                                const std::optional<std::string>& sunrise,
                                const std::optional<std::string>& sunset) {
    TimeOfDay result;
    if (!sunrise || !sunset) {
        return result;
    }

    auto times = cache.resolve(*sunrise, *sunset);
    if (!times) {
        return result;
    }

    const Glib::DateTime dawn_start = times->sunrise.add_minutes(-kTwilightMinutes);
    const Glib::DateTime dawn_end = times->sunrise.add_minutes(kTwilightMinutes);
    const Glib::DateTime dusk_start = times->sunset.add_minutes(-kTwilightMinutes);
    const Glib::DateTime dusk_end = times->sunset.add_minutes(kTwilightMinutes);

    result.source = TimeSource::Api;
    if (now.compare(dawn_start) < 0 || now.compare(dusk_end) > 0) {
        result.phase = DayPhase::Night;
    } else if (within(now, dawn_start, dawn_end)) {
        result.phase = DayPhase::Dawn;
    } else if (within(now, dusk_start, dusk_end)) {
        result.phase = DayPhase::Dusk;
    } else {
        result.phase = DayPhase::Day;
    }
    return result;
}

std::optional<std::string> idleview::holiday(const Glib::DateTime& now) {
    const int month = now.get_month();
    const int day = now.get_day_of_month();

    if (month == 12 && day <= 26) {
        return std::string("christmas");
    }
    if ((month == 12 && day >= 27) || (month == 1 && day <= 5)) {
        return std::string("new year");
    }
    if (month == 10 && day >= 25) {
        return std::string("halloween");
    }
    if ((month == 3 && day >= 20) || (month == 4 && day <= 20)) {
        return std::string("easter");
    }
    return std::nullopt;
}

std::optional<std::string> idleview::festive_label(const Glib::DateTime& now) {
    const int month = now.get_month();
    const int day = now.get_day_of_month();

    if (month == 12 && day >= 20 && day <= 26) {
        return std::string("christmas");
    }
    if ((month == 12 && day >= 27) || (month == 1 && day <= 5)) {
        return std::string("new year");
    }
    if (month == 10 && day >= 25) {
        return std::string("halloween");
    }
    return std::nullopt;
}

std::string idleview::photo_query(const Glib::DateTime& now, SunTimeCache& cache, const WeatherObservation& weather,
                                  const std::optional<std::string>& sunrise,
                                  const std::optional<std::string>& sunset,
                                  bool festive_enabled) {
    if (festive_enabled) {
        if (auto label = festive_label(now)) {
            return *label;
        }
    }

    const TimeOfDay tod = time_of_day(now, cache, sunrise, sunset);
    const Season current_season = season(now);
    const std::string name = season_name(current_season);
    const bool has_snow = weather.snowfall > kPrecipitationThreshold;
    const bool has_rain = weather.rain > kPrecipitationThreshold;

    switch (tod.phase) {
        case DayPhase::Night:
            if (has_snow) {
                return name + " snowy night";
            }
            if (has_rain) {
                return name + " rainy night";
            }
            return name + " night";
        case DayPhase::Dawn:
            return name + " dawn";
        case DayPhase::Dusk:
            return name + " dusk";
        case DayPhase::Day:
            break;
    }

    if (has_snow) {
        return name + " snow";
    }
    if (has_rain) {
        return name + " rain";
    }
    if (weather.cloudcover > kCloudyThreshold && current_season != Season::Winter) {
        return name + " cloudy";
    }
    return name;
}
