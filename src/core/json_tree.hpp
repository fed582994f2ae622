#ifndef CORE_JSON_TREE_HPP
#define CORE_JSON_TREE_HPP

#include <json-glib/json-glib.h>

#include <string>

// Helpers over json-glib's generic node tree. Every function returning a
// JsonNode* hands over a new reference; release it with json_node_unref().
namespace idleview {
JsonNode* parse_json(const std::string& text, std::string& error);
std::string json_to_string(JsonNode* node, bool pretty);

// json_node_copy() shares object and array storage, this does not.
JsonNode* json_deep_copy(JsonNode* node);

// Merge `patch` onto `target`: members that are objects on both sides are
// merged recursively, any other patch member replaces the target member,
// target members the patch does not name are kept. When either side is not
// an object the result is a copy of the patch. Neither input is modified.
JsonNode* json_merge_patch(JsonNode* target, JsonNode* patch);
}

#endif
