#include "core/settings_json.hpp"

#include "core/json_tree.hpp"

#include <algorithm>
#include <initializer_list>
#include <string>

namespace {
// Largest interval whose length in milliseconds still fits an int64.
constexpr gint64 kMaxRefreshIntervalMinutes = G_MAXINT64 / (60 * 1000);

JsonNode* member_value(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) {
        return nullptr;
    }
    return json_object_get_member(obj, member);
}

bool holds_type(JsonNode* node, GType type) {
    return node && JSON_NODE_HOLDS_VALUE(node) && json_node_get_value_type(node) == type;
}

bool read_string(JsonObject* obj, const char* section, const char* member, std::string& out,
                 std::string& error) {
    JsonNode* node = member_value(obj, member);
    if (!node) {
        return true;
    }
    if (!holds_type(node, G_TYPE_STRING)) {
        error = std::string(section) + "." + member + ": expected a string";
        return false;
    }
    out = json_node_get_string(node);
    return true;
}

bool read_bool(JsonObject* obj, const char* section, const char* member, bool& out, std::string& error) {
    JsonNode* node = member_value(obj, member);
    if (!node) {
        return true;
    }
    if (!holds_type(node, G_TYPE_BOOLEAN)) {
        error = std::string(section) + "." + member + ": expected a boolean";
        return false;
    }
    out = json_node_get_boolean(node);
    return true;
}

// The quality used to be a number on disk, newer files store the string form.
bool read_quality(JsonObject* obj, std::string& out, std::string& error) {
    JsonNode* node = member_value(obj, "photo_quality");
    if (!node) {
        return true;
    }
    if (holds_type(node, G_TYPE_STRING)) {
        out = json_node_get_string(node);
        return true;
    }
    if (holds_type(node, G_TYPE_INT64) && json_node_get_int(node) >= 0) {
        out = std::to_string(json_node_get_int(node));
        return true;
    }
    error = "photos.photo_quality: expected a string or a non-negative integer";
    return false;
}

bool read_refresh_interval(JsonObject* obj, long long& out, std::string& error) {
    JsonNode* node = member_value(obj, "refresh_interval");
    if (!node) {
        return true;
    }
    if (!holds_type(node, G_TYPE_INT64)) {
        error = "photos.refresh_interval: expected an integer number of minutes";
        return false;
    }
    gint64 minutes = json_node_get_int(node);
    if (minutes <= 0) {
        error = "photos.refresh_interval: must be greater than zero";
        return false;
    }
    if (minutes > kMaxRefreshIntervalMinutes) {
        error = "photos.refresh_interval: must not exceed " + std::to_string(kMaxRefreshIntervalMinutes) +
                " minutes";
        return false;
    }
    out = static_cast<long long>(minutes);
    return true;
}

// Returns the section object, nullptr when the section is absent (defaults
// apply). Sets `error` when the member is present but not an object.
JsonObject* section_object(JsonObject* root, const char* section, std::string& error) {
    JsonNode* node = member_value(root, section);
    if (!node) {
        return nullptr;
    }
    if (!JSON_NODE_HOLDS_OBJECT(node)) {
        error = std::string(section) + ": expected an object";
        return nullptr;
    }
    return json_node_get_object(node);
}

bool is_one_of(const std::string& value, std::initializer_list<const char*> labels) {
    return std::any_of(labels.begin(), labels.end(), [&value](const char* label) { return value == label; });
}

void add_string(JsonBuilder* builder, const char* name, const std::string& value) {
    json_builder_set_member_name(builder, name);
    json_builder_add_string_value(builder, value.c_str());
}

void add_bool(JsonBuilder* builder, const char* name, bool value) {
    json_builder_set_member_name(builder, name);
    json_builder_add_boolean_value(builder, value);
}
}

JsonNode* idleview::settings_to_json(const SettingsDocument& settings) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "units");
    json_builder_begin_object(builder);
    add_string(builder, "temperature_unit", settings.units.temperature_unit);
    add_string(builder, "time_format", settings.units.time_format);
    add_string(builder, "date_format", settings.units.date_format);
    add_string(builder, "wind_speed_unit", settings.units.wind_speed_unit);
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "display");
    json_builder_begin_object(builder);
    add_bool(builder, "show_humidity_wind", settings.display.show_humidity_wind);
    add_bool(builder, "show_precipitation_cloudiness", settings.display.show_precipitation_cloudiness);
    add_bool(builder, "show_sunrise_sunset", settings.display.show_sunrise_sunset);
    add_bool(builder, "show_cpu_temp", settings.display.show_cpu_temp);
    add_string(builder, "theme", settings.display.theme);
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "photos");
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "refresh_interval");
    json_builder_add_int_value(builder, settings.photos.refresh_interval);
    add_string(builder, "photo_quality", settings.photos.photo_quality);
    json_builder_end_object(builder);

    json_builder_end_object(builder);
    JsonNode* root = json_builder_get_root(builder);
    g_object_unref(builder);
    return root;
}

std::string idleview::settings_to_string(const SettingsDocument& settings, bool pretty) {
    JsonNode* node = settings_to_json(settings);
    std::string text = json_to_string(node, pretty);
    json_node_unref(node);
    return text;
}

bool idleview::settings_from_json(JsonNode* node, SettingsDocument& settings, std::string& error) {
    if (!node || !JSON_NODE_HOLDS_OBJECT(node)) {
        error = "settings: expected an object";
        return false;
    }

    error.clear();
    JsonObject* root = json_node_get_object(node);
    SettingsDocument parsed;

    if (JsonObject* units = section_object(root, "units", error)) {
        if (!read_string(units, "units", "temperature_unit", parsed.units.temperature_unit, error) ||
            !read_string(units, "units", "time_format", parsed.units.time_format, error) ||
            !read_string(units, "units", "date_format", parsed.units.date_format, error) ||
            !read_string(units, "units", "wind_speed_unit", parsed.units.wind_speed_unit, error)) {
            return false;
        }
    } else if (!error.empty()) {
        return false;
    }

    if (JsonObject* display = section_object(root, "display", error)) {
        if (!read_bool(display, "display", "show_humidity_wind", parsed.display.show_humidity_wind, error) ||
            !read_bool(display, "display", "show_precipitation_cloudiness",
                       parsed.display.show_precipitation_cloudiness, error) ||
            !read_bool(display, "display", "show_sunrise_sunset", parsed.display.show_sunrise_sunset, error) ||
            !read_bool(display, "display", "show_cpu_temp", parsed.display.show_cpu_temp, error) ||
            !read_string(display, "display", "theme", parsed.display.theme, error)) {
            return false;
        }
    } else if (!error.empty()) {
        return false;
    }

    if (JsonObject* photos = section_object(root, "photos", error)) {
        if (!read_refresh_interval(photos, parsed.photos.refresh_interval, error) ||
            !read_quality(photos, parsed.photos.photo_quality, error)) {
            return false;
        }
    } else if (!error.empty()) {
        return false;
    }

    settings = parsed;
    return true;
}

bool idleview::settings_from_string(const std::string& text, SettingsDocument& settings, std::string& error) {
    JsonNode* node = parse_json(text, error);
    if (!node) {
        return false;
    }
    bool ok = settings_from_json(node, settings, error);
    json_node_unref(node);
    return ok;
}

std::vector<std::string> idleview::unrecognized_enum_fields(const SettingsDocument& settings) {
    std::vector<std::string> fields;
    if (!is_one_of(settings.units.temperature_unit, {"celsius", "fahrenheit"})) {
        fields.push_back("units.temperature_unit");
    }
    if (!is_one_of(settings.units.time_format, {"24h", "12h"})) {
        fields.push_back("units.time_format");
    }
    if (!is_one_of(settings.units.date_format, {"mdy", "dmy", "ymd"})) {
        fields.push_back("units.date_format");
    }
    if (!is_one_of(settings.units.wind_speed_unit, {"kmh", "mph", "ms"})) {
        fields.push_back("units.wind_speed_unit");
    }
    return fields;
}

JsonNode* idleview::photo_to_json(const CurrentPhoto& photo) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    add_string(builder, "url", photo.url);
    add_string(builder, "author", photo.author);
    add_string(builder, "author_url", photo.author_url);
    json_builder_end_object(builder);
    JsonNode* root = json_builder_get_root(builder);
    g_object_unref(builder);
    return root;
}

bool idleview::photo_from_json(JsonNode* node, CurrentPhoto& photo, std::string& error) {
    if (!node || !JSON_NODE_HOLDS_OBJECT(node)) {
        error = "photo: expected an object";
        return false;
    }

    JsonObject* obj = json_node_get_object(node);
    CurrentPhoto parsed;
    for (const char* member : {"url", "author", "author_url"}) {
        if (!json_object_has_member(obj, member)) {
            error = std::string("photo.") + member + ": missing field";
            return false;
        }
    }
    if (!read_string(obj, "photo", "url", parsed.url, error) ||
        !read_string(obj, "photo", "author", parsed.author, error) ||
        !read_string(obj, "photo", "author_url", parsed.author_url, error)) {
        return false;
    }

    photo = parsed;
    return true;
}
