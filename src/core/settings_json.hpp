#ifndef CORE_SETTINGS_JSON_HPP
#define CORE_SETTINGS_JSON_HPP

#include "core/models.hpp"

#include <json-glib/json-glib.h>

#include <string>
#include <vector>

namespace idleview {
JsonNode* settings_to_json(const SettingsDocument& settings);
std::string settings_to_string(const SettingsDocument& settings, bool pretty = true);

// Missing sections and members keep their defaults. A member of the wrong
// JSON type, a non-positive refresh interval or a non-object root fails with
// a message naming the offending field.
bool settings_from_json(JsonNode* node, SettingsDocument& settings, std::string& error);
bool settings_from_string(const std::string& text, SettingsDocument& settings, std::string& error);

// Enum-like fields holding a label the display does not know. Such values are
// stored as given and read back with the default interpretation.
std::vector<std::string> unrecognized_enum_fields(const SettingsDocument& settings);

JsonNode* photo_to_json(const CurrentPhoto& photo);
bool photo_from_json(JsonNode* node, CurrentPhoto& photo, std::string& error);
}

#endif
