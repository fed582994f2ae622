#ifndef CORE_SUN_TIME_CACHE_HPP
#define CORE_SUN_TIME_CACHE_HPP

#include <glibmm/datetime.h>

#include <mutex>
#include <optional>
#include <string>

// Wall-clock instants carry no zone. They are held as UTC DateTimes whose
// fields are the local calendar and clock readings, which keeps comparisons
// and minute arithmetic free of DST jumps.
namespace idleview {
Glib::DateTime naive_time(int year, int month, int day, int hour, int minute, double seconds = 0.0);
Glib::DateTime naive_local_now();

// Accepts exactly "YYYY-MM-DDTHH:MM".
std::optional<Glib::DateTime> parse_naive_timestamp(const std::string& text);
}

struct SunTimes {
    Glib::DateTime sunrise;
    Glib::DateTime sunset;
};

// Remembers the parse of the last sunrise/sunset pair it saw.
class SunTimeCache {
public:
    std::optional<SunTimes> resolve(const std::string& sunrise_raw, const std::string& sunset_raw);

    // Whether the entry is keyed by exactly this pair. Lets tests observe hits
    // and that failed parses leave the entry alone.
    bool holds(const std::string& sunrise_raw, const std::string& sunset_raw) const;

private:
    struct Entry {
        std::string sunrise_raw;
        std::string sunset_raw;
        SunTimes times;
    };

    mutable std::mutex m_mutex;
    std::optional<Entry> m_entry;
};

#endif
