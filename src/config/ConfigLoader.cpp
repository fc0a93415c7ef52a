#include "shieldcore/config/ConfigLoader.hpp"
#include "shieldcore/core/Errors.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace shieldcore {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void ConfigLoader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("config file not found: " + path);
    }
    path_ = path;
    parse(file);
    if (values_.empty() && sections_.empty()) {
        throw ConfigError("config file is empty: " + path);
    }
}

void ConfigLoader::load_string(const std::string& text) {
    std::istringstream in(text);
    path_ = "<memory>";
    parse(in);
}

void ConfigLoader::parse(std::istream& in) {
    values_.clear();
    sections_.clear();

    std::string line;
    std::string currentSection;
    int lineno = 0;

    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            size_t closePos = line.find(']');
            if (closePos == std::string::npos) {
                throw ConfigError("unterminated section header at line " + std::to_string(lineno));
            }
            currentSection = trim(line.substr(1, closePos - 1));
            if (std::find(sections_.begin(), sections_.end(), currentSection) == sections_.end()) {
                sections_.push_back(currentSection);
            }
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            throw ConfigError("expected key = value at line " + std::to_string(lineno));
        }

        std::string key = trim(line.substr(0, eqPos));
        std::string value = trim(line.substr(eqPos + 1));
        if (key.empty()) {
            throw ConfigError("empty key at line " + std::to_string(lineno));
        }

        values_[currentSection + "." + key] = value;
    }
}

bool ConfigLoader::has(const std::string& section, const std::string& key) const {
    return values_.count(section + "." + key) != 0;
}

std::string ConfigLoader::get(const std::string& section, const std::string& key,
                              const std::string& defaultVal) const {
    auto it = values_.find(section + "." + key);
    if (it != values_.end()) {
        return it->second;
    }
    return defaultVal;
}

int64_t ConfigLoader::getInt(const std::string& section, const std::string& key,
                             int64_t defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t pos = 0;
        int64_t v = std::stoll(val, &pos);
        if (pos != val.size()) throw std::invalid_argument(val);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError("[" + section + "] " + key + ": not an integer: " + val);
    }
}

uint64_t ConfigLoader::getUInt(const std::string& section, const std::string& key,
                               uint64_t defaultVal) const {
    if (!has(section, key)) return defaultVal;
    int64_t v = getInt(section, key, 0);
    if (v < 0) {
        throw ConfigError("[" + section + "] " + key + ": must not be negative");
    }
    return static_cast<uint64_t>(v);
}

double ConfigLoader::getDouble(const std::string& section, const std::string& key,
                               double defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t pos = 0;
        double v = std::stod(val, &pos);
        if (pos != val.size()) throw std::invalid_argument(val);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError("[" + section + "] " + key + ": not a number: " + val);
    }
}

bool ConfigLoader::getBool(const std::string& section, const std::string& key,
                           bool defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    throw ConfigError("[" + section + "] " + key + ": not a boolean: " + val);
}

std::vector<std::string> ConfigLoader::sections_with_prefix(const std::string& prefix) const {
    std::vector<std::string> out;
    const std::string p = prefix + ".";
    for (const auto& s : sections_) {
        if (s.size() > p.size() && s.compare(0, p.size(), p) == 0) {
            out.push_back(s.substr(p.size()));
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

void ConfigLoader::dump() const {
    std::cout << "[CONFIG] Loaded from: " << path_ << "\n";
    for (const auto& kv : values_) {
        // webhook urls may carry tokens
        if (kv.first.find("token") != std::string::npos ||
            kv.first.find("secret") != std::string::npos) {
            std::cout << "  " << kv.first << " = ********\n";
        } else {
            std::cout << "  " << kv.first << " = " << kv.second << "\n";
        }
    }
}

} // namespace shieldcore
