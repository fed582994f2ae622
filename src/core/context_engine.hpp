#ifndef CORE_CONTEXT_ENGINE_HPP
#define CORE_CONTEXT_ENGINE_HPP

#include "core/models.hpp"
#include "core/sun_time_cache.hpp"

#include <glibmm/datetime.h>

#include <optional>
#include <string>

enum class Season { Spring, Summer, Autumn, Winter };

enum class DayPhase { Dawn, Day, Dusk, Night };

enum class TimeSource { Api, Fallback };

struct TimeOfDay {
    DayPhase phase = DayPhase::Night;
    TimeSource source = TimeSource::Fallback;
};

// Every function here takes the current instant as naive local wall-clock
// time (see idleview::naive_local_now) and never fails.
namespace idleview {
const char* season_name(Season season);
const char* day_phase_name(DayPhase phase);
const char* time_source_name(TimeSource source);

Season season(const Glib::DateTime& now);

// Dawn and dusk span 30 minutes either side of sunrise and sunset. Without a
// parseable sunrise/sunset pair the answer is night from the fallback source.
TimeOfDay time_of_day(const Glib::DateTime& now, SunTimeCache& cache,
                      const std::optional<std::string>& sunrise,
                      const std::optional<std::string>& sunset);

std::optional<std::string> holiday(const Glib::DateTime& now);

// Narrower windows than holiday(): christmas starts on Dec 20 and there is
// no easter.
std::optional<std::string> festive_label(const Glib::DateTime& now);

std::string photo_query(const Glib::DateTime& now, SunTimeCache& cache, const WeatherObservation& weather,
                        const std::optional<std::string>& sunrise,
                        const std::optional<std::string>& sunset,
                        bool festive_enabled = true);
}

#endif
