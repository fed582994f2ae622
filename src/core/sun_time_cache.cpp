#include "core/sun_time_cache.hpp"

#include <regex>

Glib::DateTime idleview::naive_time(int year, int month, int day, int hour, int minute, double seconds) {
    return Glib::DateTime::create_utc(year, month, day, hour, minute, seconds);
}

Glib::DateTime idleview::naive_local_now() {
    Glib::DateTime local = Glib::DateTime::create_now_local();
    return naive_time(local.get_year(), local.get_month(), local.get_day_of_month(), local.get_hour(),
                      local.get_minute(), local.get_seconds());
}

std::optional<Glib::DateTime> idleview::parse_naive_timestamp(const std::string& text) {
    static const std::regex pattern(R"(^(\d{4})-(\d{1,2})-(\d{1,2})T(\d{1,2}):(\d{1,2})$)");
    std::smatch match;
    if (!std::regex_match(text, match, pattern)) {
        return std::nullopt;
    }

    Glib::DateTime parsed = naive_time(std::stoi(match[1]), std::stoi(match[2]), std::stoi(match[3]),
                                       std::stoi(match[4]), std::stoi(match[5]));
    if (!parsed) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<SunTimes> SunTimeCache::resolve(const std::string& sunrise_raw, const std::string& sunset_raw) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_entry && m_entry->sunrise_raw == sunrise_raw && m_entry->sunset_raw == sunset_raw) {
            return m_entry->times;
        }
    }

    auto sunrise = idleview::parse_naive_timestamp(sunrise_raw);
    auto sunset = idleview::parse_naive_timestamp(sunset_raw);
    if (!sunrise || !sunset) {
        return std::nullopt;
    }

    SunTimes times{*sunrise, *sunset};
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entry = Entry{sunrise_raw, sunset_raw, times};
    return times;
}

bool SunTimeCache::holds(const std::string& sunrise_raw, const std::string& sunset_raw) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entry && m_entry->sunrise_raw == sunrise_raw && m_entry->sunset_raw == sunset_raw;
}
