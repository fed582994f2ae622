#ifndef FEATURES_SETTINGS_STORE_HPP
#define FEATURES_SETTINGS_STORE_HPP

#include "core/models.hpp"

#include <json-glib/json-glib.h>

#include <mutex>
#include <shared_mutex>
#include <string>

enum class SettingsError {
    None,
    Storage,      // settings file unreadable or corrupt at load time
    Persistence,  // in-memory document changed, writing it out failed
    Validation    // document or patch result does not fit the schema
};

struct SettingsResult {
    bool success = false;
    SettingsError kind = SettingsError::None;
    std::string error;
    SettingsDocument settings;
};

const char* settings_error_name(SettingsError kind);

// Owns the one settings document of the installation and mirrors every
// change to the settings file. Readers share a lock with each other, writers
// are serialized end to end (memory swap and file write) in lock order.
class SettingsStore {
public:
    explicit SettingsStore(std::string file_path);

    SettingsResult initialize();

    SettingsDocument get() const;
    SettingsResult replace(const SettingsDocument& settings);
    SettingsResult merge_patch(JsonNode* patch);
    SettingsResult merge_patch(const std::string& patch_json);
    SettingsResult reset();

    const std::string& file_path() const;

private:
    SettingsResult commit(const SettingsDocument& settings);

    std::string m_file_path;
    mutable std::shared_mutex m_mutex;
    std::mutex m_write_mutex;
    SettingsDocument m_settings;
};

#endif
