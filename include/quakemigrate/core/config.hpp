#pragma once

#include "exception.hpp"
#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace quakemigrate {

/**
 * Config - INI-style key/value store
 *
 * Keys are "section.key". Lines starting with '#' or ';' and text after
 * " #" are comments. Typed getters return the fallback when a key is
 * absent and throw ConfigError when its value does not parse.
 */
class Config {
public:
    Config() = default;

    // False if the file cannot be opened; ConfigError on a malformed line
    bool loadFromFile(const std::string& filename);

    bool has(const std::string& key) const { return values_.count(key) > 0; }

    std::string getString(const std::string& key, const std::string& fallback = "") const;
    int getInt(const std::string& key, int fallback = 0) const;
    double getDouble(const std::string& key, double fallback = 0.0) const;
    bool getBool(const std::string& key, bool fallback = false) const;

    // Comma-separated values; empty items are dropped
    std::vector<std::string> getStringList(const std::string& key) const;
    std::vector<double> getDoubleList(const std::string& key) const;

    // Exactly three comma-separated numbers
    Point3 getPoint3(const std::string& key, const Point3& fallback) const;

    void set(const std::string& key, const std::string& value) { values_[key] = value; }
    void set(const std::string& key, const char* value) { values_[key] = value; }
    void set(const std::string& key, int value) { values_[key] = std::to_string(value); }
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value) { values_[key] = value ? "true" : "false"; }

    // Whole string as a number; key names the setting in the error
    static double parseDouble(const std::string& key, const std::string& text);

private:
    std::map<std::string, std::string> values_;
};

} // namespace quakemigrate
