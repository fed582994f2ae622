#include "features/http_api.hpp"

#include "core/json_tree.hpp"
#include "core/settings_json.hpp"

#include <iostream>
#include <json-glib/json-glib.h>

namespace {
std::string message_body(const char* key, const std::string& message) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, key);
    json_builder_add_string_value(builder, message.c_str());
    json_builder_end_object(builder);
    JsonNode* root = json_builder_get_root(builder);
    std::string body = idleview::json_to_string(root, false);
    json_node_unref(root);
    g_object_unref(builder);
    return body;
}

ApiResponse error_response(int status, const std::string& message) {
    return ApiResponse{status, message_body("error", message)};
}

ApiResponse settings_body(const SettingsDocument& settings) {
    return ApiResponse{200, idleview::settings_to_string(settings, false)};
}

std::string strip_query(const std::string& path) {
    size_t pos = path.find('?');
    return pos == std::string::npos ? path : path.substr(0, pos);
}
}

HttpApi::HttpApi(SettingsStore& store)
    : m_store(store) {}

ApiResponse HttpApi::handle_request(const std::string& method, const std::string& path, const std::string& body) {
    const std::string route = strip_query(path);

    if (route == "/api/settings") {
        if (method == "GET") {
            return get_settings();
        }
        if (method == "PUT") {
            return put_settings(body);
        }
        if (method == "PATCH") {
            return patch_settings(body);
        }
        return error_response(405, "Method not allowed");
    }
    if (route == "/api/settings/reset") {
        return method == "POST" ? reset_settings() : error_response(405, "Method not allowed");
    }
    if (route == "/api/health") {
        return method == "GET" ? health() : error_response(405, "Method not allowed");
    }
    if (route == "/api/photo/current") {
        if (method == "GET") {
            return get_current_photo();
        }
        if (method == "POST") {
            return post_current_photo(body);
        }
        return error_response(405, "Method not allowed");
    }
    return error_response(404, "Not found");
}

ApiResponse HttpApi::get_settings() const {
    return settings_body(m_store.get());
}

ApiResponse HttpApi::put_settings(const std::string& body) {
    std::string error;
    JsonNode* node = idleview::parse_json(body, error);
    if (!node) {
        return error_response(400, "Invalid JSON body: " + error);
    }

    SettingsDocument settings;
    bool valid = idleview::settings_from_json(node, settings, error);
    json_node_unref(node);
    if (!valid) {
        std::cerr << "[api] Settings update failed (validation): " << error << '\n';
        return error_response(500, error);
    }

    return settings_response(m_store.replace(settings), "update");
}

ApiResponse HttpApi::patch_settings(const std::string& body) {
    std::string error;
    JsonNode* patch = idleview::parse_json(body, error);
    if (!patch) {
        return error_response(400, "Invalid JSON body: " + error);
    }

    SettingsResult result = m_store.merge_patch(patch);
    json_node_unref(patch);
    return settings_response(result, "partial update");
}

ApiResponse HttpApi::reset_settings() {
    return settings_response(m_store.reset(), "reset");
}

ApiResponse HttpApi::health() const {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "status");
    json_builder_add_string_value(builder, "healthy");
    json_builder_set_member_name(builder, "service");
    json_builder_add_string_value(builder, idleview::kServiceName);
    json_builder_end_object(builder);
    JsonNode* root = json_builder_get_root(builder);
    std::string body = idleview::json_to_string(root, false);
    json_node_unref(root);
    g_object_unref(builder);
    return ApiResponse{200, body};
}

ApiResponse HttpApi::get_current_photo() const {
    std::lock_guard<std::mutex> lock(m_photo_mutex);
    if (!m_current_photo) {
        return ApiResponse{200, "null"};
    }

    JsonNode* node = idleview::photo_to_json(*m_current_photo);
    std::string body = idleview::json_to_string(node, false);
    json_node_unref(node);
    return ApiResponse{200, body};
}

ApiResponse HttpApi::post_current_photo(const std::string& body) {
    std::string error;
    JsonNode* node = idleview::parse_json(body, error);
    if (!node) {
        return error_response(400, "Invalid JSON body: " + error);
    }

    CurrentPhoto photo;
    bool valid = idleview::photo_from_json(node, photo, error);
    json_node_unref(node);
    if (!valid) {
        return error_response(400, error);
    }

    {
        std::lock_guard<std::mutex> lock(m_photo_mutex);
        m_current_photo = photo;
    }
    std::cerr << "[api] Current photo updated: " << photo.url << " by " << photo.author << '\n';

    JsonNode* echo = idleview::photo_to_json(photo);
    std::string response = idleview::json_to_string(echo, false);
    json_node_unref(echo);
    return ApiResponse{200, response};
}

sigc::connection HttpApi::connect_settings_updated(const SettingsUpdatedSlot& slot) {
    std::lock_guard<std::mutex> lock(m_signal_mutex);
    return m_signal_settings_updated.connect(slot);
}

ApiResponse HttpApi::settings_response(const SettingsResult& result, const char* action) {
    // A failed write still leaves the new document in memory.
    if (result.success || result.kind == SettingsError::Persistence) {
        std::lock_guard<std::mutex> lock(m_signal_mutex);
        m_signal_settings_updated.emit(result.settings);
    }

    if (!result.success) {
        std::cerr << "[api] Settings " << action << " failed (" << settings_error_name(result.kind)
                  << "): " << result.error << '\n';
        return error_response(500, result.error);
    }

    std::cerr << "[api] Settings " << action << " applied\n";
    return settings_body(result.settings);
}
