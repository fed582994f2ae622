#ifndef TESTS_TEST_SUPPORT_HPP
#define TESTS_TEST_SUPPORT_HPP

#include "core/json_tree.hpp"

#include <json-glib/json-glib.h>
#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace test_support {
inline std::filesystem::path fresh_dir(const std::string& name) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
                                ("idleview-" + name + "-" + std::to_string(getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

// Parses `json` and returns the string found under "section.key", or the
// top-level member `key` when `section` is empty.
inline std::string string_at(const std::string& json, const char* section, const char* key) {
    std::string error;
    JsonNode* root = idleview::parse_json(json, error);
    assert(root != nullptr);
    assert(JSON_NODE_HOLDS_OBJECT(root));
    JsonObject* obj = json_node_get_object(root);
    if (section[0] != '\0') {
        obj = json_object_get_object_member(obj, section);
    }
    std::string value = json_object_get_string_member(obj, key);
    json_node_unref(root);
    return value;
}
}  // namespace test_support

#endif
