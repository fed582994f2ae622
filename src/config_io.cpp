#include "config_io.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace {
std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}
}  // namespace

ConfigIO::ReadStatus ConfigIO::readFile(const std::string& filePath, std::string& contents, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::exists(filePath, ec)) {
        if (ec) {
            error = "Failed to access file " + filePath + ": " + ec.message();
            return ReadStatus::Failed;
        }
        return ReadStatus::Missing;
    }

    std::ifstream inFile(filePath);
    if (!inFile.is_open()) {
        error = "Failed to read file " + filePath + ": " + std::strerror(errno);
        return ReadStatus::Failed;
    }

    std::ostringstream buffer;
    buffer << inFile.rdbuf();
    if (inFile.bad()) {
        error = "Failed to read file " + filePath;
        return ReadStatus::Failed;
    }

    contents = buffer.str();
    return ReadStatus::Ok;
}

bool ConfigIO::writeFile(const std::string& filePath, const std::string& contents, std::string& error) {
    std::filesystem::path path(filePath);
    std::error_code ec;
    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path(), ec)) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "Failed to create directory " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::string tmpPath = filePath + ".tmp";
    {
        std::ofstream outFile(tmpPath, std::ios::trunc);
        if (!outFile.is_open()) {
            error = "Failed to write file " + filePath + ": " + std::strerror(errno);
            return false;
        }
        outFile << contents;
        outFile.flush();
        if (!outFile) {
            error = "Failed to write file " + filePath;
            std::error_code ignored;
            std::filesystem::remove(tmpPath, ignored);
            return false;
        }
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        error = "Failed to replace file " + filePath + ": " + ec.message();
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        return false;
    }
    return true;
}

std::string ConfigIO::defaultSettingsPath() {
    std::string overridePath = env_or_empty("IDLEVIEW_SETTINGS_PATH");
    if (!overridePath.empty()) {
        return overridePath;
    }

    std::string configHome = env_or_empty("XDG_CONFIG_HOME");
    if (!configHome.empty()) {
        return configHome + "/idleview/settings.json";
    }

    std::string home = env_or_empty("HOME");
    return !home.empty() ? home + "/.config/idleview/settings.json" : "settings.json";
}
