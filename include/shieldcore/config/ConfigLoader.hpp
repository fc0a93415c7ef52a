#pragma once
// =============================================================================
// ConfigLoader.hpp - INI parser for shieldcore configuration
// =============================================================================
// Format:
//   [section]            section header, may contain dots ([model.forest])
//   key = value          whitespace around key and value is trimmed
//   # or ; comment       whole-line comments only
//
// Typed getters throw ConfigError when a present value does not parse.
// Missing keys fall back to the supplied default.
// =============================================================================

#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace shieldcore {

class ConfigLoader {
public:
    ConfigLoader() = default;

    // Throws ConfigError when the file cannot be opened or is empty.
    void load(const std::string& path);
    void load_string(const std::string& text);

    bool has(const std::string& section, const std::string& key) const;

    std::string get(const std::string& section, const std::string& key,
                    const std::string& defaultVal = "") const;
    int64_t  getInt(const std::string& section, const std::string& key, int64_t defaultVal = 0) const;
    uint64_t getUInt(const std::string& section, const std::string& key, uint64_t defaultVal = 0) const;
    double   getDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    bool     getBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // Names after the prefix of every section "<prefix>.<name>", sorted.
    std::vector<std::string> sections_with_prefix(const std::string& prefix) const;

    const std::string& path() const { return path_; }

    void dump() const;

private:
    void parse(std::istream& in);

    std::map<std::string, std::string> values_;
    std::vector<std::string> sections_;
    std::string path_;
};

} // namespace shieldcore
