#include "shieldcore/models/Artifact.hpp"
#include "shieldcore/core/Errors.hpp"

namespace shieldcore {

ArtifactReader::ArtifactReader(const std::string& path, const std::string& magic, int max_version)
    : path_(path), in_(path) {
    if (!in_) {
        throw ConfigError("model artifact not found: " + path);
    }
    std::string m = word();
    if (m != magic) {
        fail("bad magic '" + m + "', expected '" + magic + "'");
    }
    version_ = read_int();
    if (version_ < 1 || version_ > max_version) {
        fail("unsupported artifact version " + std::to_string(version_));
    }
}

void ArtifactReader::fail(const std::string& msg) const {
    throw ConfigError(path_ + ": " + msg);
}

std::string ArtifactReader::word() {
    std::string w;
    while (in_ >> w) {
        if (w[0] == '#') {
            std::string rest;
            std::getline(in_, rest);
            continue;
        }
        return w;
    }
    fail("unexpected end of file");
}

void ArtifactReader::expect(const std::string& tag) {
    std::string w = word();
    if (w != tag) {
        fail("expected '" + tag + "', got '" + w + "'");
    }
}

int ArtifactReader::read_int() {
    std::string w = word();
    try {
        size_t pos = 0;
        int v = std::stoi(w, &pos);
        if (pos != w.size()) fail("not an integer: " + w);
        return v;
    } catch (const std::logic_error&) {
        fail("not an integer: " + w);
    }
}

double ArtifactReader::read_double() {
    std::string w = word();
    try {
        size_t pos = 0;
        double v = std::stod(w, &pos);
        if (pos != w.size()) fail("not a number: " + w);
        return v;
    } catch (const std::logic_error&) {
        fail("not a number: " + w);
    }
}

std::vector<double> ArtifactReader::read_doubles(size_t n) {
    std::vector<double> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) out.push_back(read_double());
    return out;
}

std::vector<double> ArtifactReader::tagged_doubles(const std::string& tag, size_t n) {
    expect(tag);
    return read_doubles(n);
}

} // namespace shieldcore
