#include "features/settings_store.hpp"

#include "config_io.hpp"
#include "core/json_tree.hpp"
#include "core/settings_json.hpp"

#include <iostream>
#include <utility>

const char* settings_error_name(SettingsError kind) {
    switch (kind) {
        case SettingsError::None: return "none";
        case SettingsError::Storage: return "storage";
        case SettingsError::Persistence: return "persistence";
        case SettingsError::Validation: return "validation";
    }
    return "unknown";
}

namespace {
SettingsResult failure(SettingsError kind, const std::string& error, const SettingsDocument& settings) {
    SettingsResult result;
    result.kind = kind;
    result.error = error;
    result.settings = settings;
    return result;
}
}

SettingsStore::SettingsStore(std::string file_path)
    : m_file_path(std::move(file_path)) {}

SettingsResult SettingsStore::initialize() {
    std::lock_guard<std::mutex> write_lock(m_write_mutex);

    std::string contents;
    std::string error;
    switch (ConfigIO::readFile(m_file_path, contents, error)) {
        case ConfigIO::ReadStatus::Missing: {
            std::cerr << "[settings] No settings file at " << m_file_path << ", using defaults\n";
            SettingsResult result;
            result.success = true;
            result.settings = get();
            return result;
        }
        case ConfigIO::ReadStatus::Failed:
            std::cerr << "[settings] " << error << '\n';
            return failure(SettingsError::Storage, error, get());
        case ConfigIO::ReadStatus::Ok:
            break;
    }

    SettingsDocument loaded;
    if (!idleview::settings_from_string(contents, loaded, error)) {
        error = "Failed to parse settings JSON: " + error;
        std::cerr << "[settings] " << error << '\n';
        return failure(SettingsError::Storage, error, get());
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_settings = loaded;
    }
    std::cerr << "[settings] Loaded settings from " << m_file_path << '\n';

    SettingsResult result;
    result.success = true;
    result.settings = loaded;
    return result;
}

SettingsDocument SettingsStore::get() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_settings;
}

SettingsResult SettingsStore::replace(const SettingsDocument& settings) {
    std::lock_guard<std::mutex> write_lock(m_write_mutex);
    return commit(settings);
}

SettingsResult SettingsStore::merge_patch(JsonNode* patch) {
    std::lock_guard<std::mutex> write_lock(m_write_mutex);

    // Writers hold m_write_mutex, so the document cannot change until commit.
    SettingsDocument current = get();
    if (!patch || !JSON_NODE_HOLDS_OBJECT(patch)) {
        return failure(SettingsError::Validation, "Settings patch must be a JSON object", current);
    }

    JsonNode* current_json = idleview::settings_to_json(current);
    JsonNode* merged_json = idleview::json_merge_patch(current_json, patch);

    SettingsDocument merged;
    std::string error;
    bool valid = idleview::settings_from_json(merged_json, merged, error);
    json_node_unref(merged_json);
    json_node_unref(current_json);

    if (!valid) {
        error = "Failed to parse updated settings: " + error;
        std::cerr << "[settings] " << error << '\n';
        return failure(SettingsError::Validation, error, current);
    }

    return commit(merged);
}

SettingsResult SettingsStore::merge_patch(const std::string& patch_json) {
    std::string error;
    JsonNode* patch = idleview::parse_json(patch_json, error);
    if (!patch) {
        return failure(SettingsError::Validation, "Invalid settings patch: " + error, get());
    }

    SettingsResult result = merge_patch(patch);
    json_node_unref(patch);
    return result;
}

SettingsResult SettingsStore::reset() {
    return replace(SettingsDocument());
}

const std::string& SettingsStore::file_path() const {
    return m_file_path;
}

SettingsResult SettingsStore::commit(const SettingsDocument& settings) {
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_settings = settings;
    }

    for (const auto& field : idleview::unrecognized_enum_fields(settings)) {
        std::cerr << "[settings] Warning: unrecognized value for " << field << ", the default applies\n";
    }

    std::string error;
    if (!ConfigIO::writeFile(m_file_path, idleview::settings_to_string(settings), error)) {
        std::cerr << "[settings] " << error << '\n';
        return failure(SettingsError::Persistence, error, settings);
    }

    SettingsResult result;
    result.success = true;
    result.settings = settings;
    return result;
}
