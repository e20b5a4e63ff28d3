#include "quakemigrate/core/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace quakemigrate {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool onlySpaceFrom(const std::string& s, size_t from) {
    for (size_t i = from; i < s.size(); i++) {
        if (!std::isspace(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

} // namespace

bool Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::string raw, section;
    int line_no = 0;
    while (std::getline(file, raw)) {
        line_no++;
        std::string line = raw;
        size_t hash = line.find(" #");
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        auto where = [&]() { return filename + ":" + std::to_string(line_no) + ": "; };

        if (line[0] == '[') {
            if (line.back() != ']' || line.size() < 3) {
                throw ConfigError(where() + "bad section header '" + line + "'");
            }
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError(where() + "expected key = value, got '" + line + "'");
        }
        std::string key = trim(line.substr(0, eq));
        if (key.empty()) throw ConfigError(where() + "missing key");
        values_[section.empty() ? key : section + "." + key] = trim(line.substr(eq + 1));
    }
    return true;
}

std::string Config::getString(const std::string& key, const std::string& fallback) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : fallback;
}

int Config::getInt(const std::string& key, int fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) return fallback;
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(it->second, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || !onlySpaceFrom(it->second, used)) {
        throw ConfigError("'" + key + "' is not an integer: " + it->second);
    }
    return value;
}

double Config::getDouble(const std::string& key, double fallback) const {
    auto it = values_.find(key);
    return it == values_.end() ? fallback : parseDouble(key, it->second);
}

bool Config::getBool(const std::string& key, bool fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) return fallback;
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if (v == "true" || v == "yes" || v == "1" || v == "on") return true;
    if (v == "false" || v == "no" || v == "0" || v == "off") return false;
    throw ConfigError("'" + key + "' is not a boolean: " + it->second);
}

std::vector<std::string> Config::getStringList(const std::string& key) const {
    std::vector<std::string> result;
    std::stringstream ss(getString(key));
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

std::vector<double> Config::getDoubleList(const std::string& key) const {
    std::vector<double> result;
    for (const auto& item : getStringList(key)) {
        result.push_back(parseDouble(key, item));
    }
    return result;
}

Point3 Config::getPoint3(const std::string& key, const Point3& fallback) const {
    if (!has(key)) return fallback;
    std::vector<double> v = getDoubleList(key);
    if (v.size() != 3) {
        throw ConfigError("'" + key + "' needs three comma-separated values");
    }
    return Point3(v[0], v[1], v[2]);
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss.precision(17);
    oss << value;
    values_[key] = oss.str();
}

double Config::parseDouble(const std::string& key, const std::string& text) {
    size_t used = 0;
    double value = 0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || !onlySpaceFrom(text, used)) {
        throw ConfigError("'" + key + "' is not a number: " + text);
    }
    return value;
}

} // namespace quakemigrate
