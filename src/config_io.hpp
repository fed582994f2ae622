#ifndef CONFIG_IO_HPP
#define CONFIG_IO_HPP

#include <string>

class ConfigIO {
public:
    enum class ReadStatus { Ok, Missing, Failed };

    static ReadStatus readFile(const std::string& filePath, std::string& contents, std::string& error);

    // Creates missing parent directories and replaces the file through a
    // sibling temporary, so readers never see a half-written document.
    static bool writeFile(const std::string& filePath, const std::string& contents, std::string& error);

    static std::string defaultSettingsPath();
};

#endif // CONFIG_IO_HPP
