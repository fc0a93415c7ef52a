#pragma once

#include <fstream>
#include <string>
#include <vector>

namespace shieldcore {

// Whitespace-token reader for versioned model artifacts. Every artifact
// starts with "<magic> <version>". Read errors throw ConfigError naming the
// file, since artifacts are only loaded at startup.
class ArtifactReader {
public:
    ArtifactReader(const std::string& path, const std::string& magic, int max_version);

    int version() const { return version_; }

    void expect(const std::string& tag);
    std::string word();
    int         read_int();
    double      read_double();
    std::vector<double> read_doubles(size_t n);

    // Reads "<tag> v0 v1 ... v(n-1)".
    std::vector<double> tagged_doubles(const std::string& tag, size_t n);

    [[noreturn]] void fail(const std::string& msg) const;

private:
    std::string path_;
    std::ifstream in_;
    int version_ = 0;
};

} // namespace shieldcore
