#pragma once

#include <map>
#include <string>

namespace LvTiles {

class ConfigParser {
private:
    std::map<std::string, std::string> configValues;

public:
    ConfigParser() = default;

    // Load key = value pairs from file, later keys win
    bool loadFromFile(const std::string& filename);

    // Load from an in-memory buffer, same syntax as files
    void loadFromString(const std::string& content);

    std::string get(const std::string& key, const std::string& defaultValue = "") const;

    void set(const std::string& key, const std::string& value);

    bool hasKey(const std::string& key) const;

    const std::map<std::string, std::string>& getAllValues() const { return configValues; }

private:
    bool parseLine(const std::string& line);

    std::string trim(const std::string& str) const;
};

} // namespace LvTiles
