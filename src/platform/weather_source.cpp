#include "platform/weather_source.hpp"

#include "config_io.hpp"
#include "core/display_format.hpp"
#include "core/json_tree.hpp"

#include <fstream>
#include <iostream>
#include <json-glib/json-glib.h>
#include <utility>

namespace {
std::optional<double> json_node_to_double(JsonObject* data_obj, const char* member) {
    if (!json_object_has_member(data_obj, member)) {
        return std::nullopt;
    }

    JsonNode* node = json_object_get_member(data_obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) {
        return std::nullopt;
    }

    GType type = json_node_get_value_type(node);
    if (type == G_TYPE_DOUBLE) {
        return json_node_get_double(node);
    }
    if (type == G_TYPE_INT64) {
        return static_cast<double>(json_node_get_int(node));
    }
    return std::nullopt;
}

std::string first_string_element(JsonObject* data_obj, const char* member) {
    if (!json_object_has_member(data_obj, member)) {
        return "";
    }

    JsonNode* node = json_object_get_member(data_obj, member);
    if (!node || !JSON_NODE_HOLDS_ARRAY(node)) {
        return "";
    }

    JsonArray* array = json_node_get_array(node);
    if (json_array_get_length(array) == 0) {
        return "";
    }

    JsonNode* first = json_array_get_element(array, 0);
    if (!JSON_NODE_HOLDS_VALUE(first) || json_node_get_value_type(first) != G_TYPE_STRING) {
        return "";
    }
    return json_node_get_string(first);
}

JsonObject* object_member(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) {
        return nullptr;
    }
    JsonNode* node = json_object_get_member(obj, member);
    return JSON_NODE_HOLDS_OBJECT(node) ? json_node_get_object(node) : nullptr;
}
}

bool idleview::parse_open_meteo(const std::string& json, const UnitsSettings& units, WeatherObservation& weather,
                                std::string& error) {
    JsonNode* root = parse_json(json, error);
    if (!root) {
        error = "Failed to parse weather data: " + error;
        return false;
    }
    if (!JSON_NODE_HOLDS_OBJECT(root)) {
        json_node_unref(root);
        error = "Failed to parse weather data: expected an object";
        return false;
    }

    JsonObject* obj = json_node_get_object(root);
    JsonObject* current = object_member(obj, "current");
    JsonObject* daily = object_member(obj, "daily");
    if (!current || !daily) {
        json_node_unref(root);
        error = "Failed to parse weather data: missing current or daily section";
        return false;
    }

    auto temperature = json_node_to_double(current, "temperature_2m");
    auto humidity = json_node_to_double(current, "relative_humidity_2m");
    auto rain = json_node_to_double(current, "rain");
    auto snowfall = json_node_to_double(current, "snowfall");
    auto cloudcover = json_node_to_double(current, "cloudcover");
    auto wind = json_node_to_double(current, "wind_speed_10m");
    if (!temperature || !humidity || !rain || !snowfall || !cloudcover || !wind) {
        json_node_unref(root);
        error = "Failed to parse weather data: incomplete current conditions";
        return false;
    }

    WeatherObservation parsed;
    parsed.temperature = convert_temperature(*temperature, units);
    parsed.temperature_unit = units.temperature_unit;
    parsed.humidity = *humidity;
    parsed.wind_speed = convert_wind_speed(*wind, units);
    parsed.wind_speed_unit = units.wind_speed_unit;
    parsed.wind_speed_label = wind_speed_label(units);
    parsed.cloudcover = *cloudcover;
    parsed.rain = *rain;
    parsed.snowfall = *snowfall;
    parsed.sunrise = first_string_element(daily, "sunrise");
    parsed.sunset = first_string_element(daily, "sunset");
    if (json_object_has_member(obj, "timezone")) {
        JsonNode* tz = json_object_get_member(obj, "timezone");
        if (JSON_NODE_HOLDS_VALUE(tz) && json_node_get_value_type(tz) == G_TYPE_STRING) {
            parsed.timezone = json_node_get_string(tz);
        }
    }

    json_node_unref(root);
    weather = parsed;
    return true;
}

std::optional<double> idleview::read_cpu_temp_celsius(const std::string& path) {
    std::ifstream inFile(path);
    if (!inFile.is_open()) {
        return std::nullopt;
    }

    long millidegrees = 0;
    if (!(inFile >> millidegrees)) {
        std::cerr << "[host] Unreadable CPU temperature in " << path << '\n';
        return std::nullopt;
    }
    return static_cast<double>(millidegrees) / 1000.0;
}

WeatherSource::WeatherSource(std::string cache_path)
    : m_cache_path(std::move(cache_path)) {}

std::optional<WeatherObservation> WeatherSource::load(const UnitsSettings& units) const {
    if (m_cache_path.empty()) {
        return std::nullopt;
    }

    std::string contents;
    std::string error;
    ConfigIO::ReadStatus status = ConfigIO::readFile(m_cache_path, contents, error);
    if (status == ConfigIO::ReadStatus::Missing) {
        std::cerr << "[weather] No weather data at " << m_cache_path << '\n';
        return std::nullopt;
    }
    if (status == ConfigIO::ReadStatus::Failed) {
        std::cerr << "[weather] " << error << '\n';
        return std::nullopt;
    }

    WeatherObservation weather;
    if (!idleview::parse_open_meteo(contents, units, weather, error)) {
        std::cerr << "[weather] " << error << '\n';
        return std::nullopt;
    }
    return weather;
}

const std::string& WeatherSource::cache_path() const {
    return m_cache_path;
}
