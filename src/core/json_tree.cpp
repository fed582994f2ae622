#include "core/json_tree.hpp"

namespace {
JsonNode* wrap_object(JsonObject* object) {
    JsonNode* node = json_node_new(JSON_NODE_OBJECT);
    json_node_take_object(node, object);
    return node;
}
}

JsonNode* idleview::parse_json(const std::string& text, std::string& error) {
    GError* gerror = nullptr;
    JsonParser* parser = json_parser_new();
    bool parsed = json_parser_load_from_data(parser, text.c_str(), static_cast<gssize>(text.size()), &gerror);
    if (!parsed) {
        error = gerror ? gerror->message : "Invalid JSON";
        if (gerror) {
            g_error_free(gerror);
        }
        g_object_unref(parser);
        return nullptr;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root) {
        error = "Empty JSON document";
        g_object_unref(parser);
        return nullptr;
    }

    JsonNode* result = json_node_copy(root);
    g_object_unref(parser);
    return result;
}

std::string idleview::json_to_string(JsonNode* node, bool pretty) {
    JsonGenerator* generator = json_generator_new();
    json_generator_set_root(generator, node);
    json_generator_set_pretty(generator, pretty);
    if (pretty) {
        json_generator_set_indent(generator, 2);
    }

    gchar* data = json_generator_to_data(generator, nullptr);
    std::string text = data ? data : "";
    g_free(data);
    g_object_unref(generator);
    return text;
}

JsonNode* idleview::json_deep_copy(JsonNode* node) {
    if (JSON_NODE_HOLDS_OBJECT(node)) {
        JsonObject* source = json_node_get_object(node);
        JsonObject* copy = json_object_new();
        GList* members = json_object_get_members(source);
        for (GList* l = members; l != nullptr; l = l->next) {
            const char* key = static_cast<const char*>(l->data);
            json_object_set_member(copy, key, json_deep_copy(json_object_get_member(source, key)));
        }
        g_list_free(members);
        return wrap_object(copy);
    }

    if (JSON_NODE_HOLDS_ARRAY(node)) {
        JsonArray* source = json_node_get_array(node);
        guint length = json_array_get_length(source);
        JsonArray* copy = json_array_sized_new(length);
        for (guint i = 0; i < length; ++i) {
            json_array_add_element(copy, json_deep_copy(json_array_get_element(source, i)));
        }
        JsonNode* result = json_node_new(JSON_NODE_ARRAY);
        json_node_take_array(result, copy);
        return result;
    }

    return json_node_copy(node);
}

JsonNode* idleview::json_merge_patch(JsonNode* target, JsonNode* patch) {
    if (!JSON_NODE_HOLDS_OBJECT(target) || !JSON_NODE_HOLDS_OBJECT(patch)) {
        return json_deep_copy(patch);
    }

    JsonObject* target_obj = json_node_get_object(target);
    JsonObject* patch_obj = json_node_get_object(patch);
    JsonObject* merged = json_object_new();

    GList* members = json_object_get_members(target_obj);
    for (GList* l = members; l != nullptr; l = l->next) {
        const char* key = static_cast<const char*>(l->data);
        json_object_set_member(merged, key, json_deep_copy(json_object_get_member(target_obj, key)));
    }
    g_list_free(members);

    members = json_object_get_members(patch_obj);
    for (GList* l = members; l != nullptr; l = l->next) {
        const char* key = static_cast<const char*>(l->data);
        JsonNode* patch_value = json_object_get_member(patch_obj, key);
        JsonNode* current = json_object_get_member(target_obj, key);
        if (current && JSON_NODE_HOLDS_OBJECT(current) && JSON_NODE_HOLDS_OBJECT(patch_value)) {
            json_object_set_member(merged, key, json_merge_patch(current, patch_value));
        } else {
            json_object_set_member(merged, key, json_deep_copy(patch_value));
        }
    }
    g_list_free(members);

    return wrap_object(merged);
}
