#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace shieldcore {

enum class Protocol : uint8_t {
    ANY  = 0,
    TCP  = 6,
    UDP  = 17,
    ICMP = 1,
    OTHER = 255
};

const char* to_string(Protocol p);
Protocol protocol_from_string(const std::string& s);

// Network entity mitigation decisions are scoped to. Port 0 and
// Protocol::ANY mean "not part of the key".
struct SourceId {
    std::string ip;
    uint16_t    port = 0;
    Protocol    proto = Protocol::ANY;

    SourceId() = default;
    explicit SourceId(std::string addr, uint16_t p = 0, Protocol pr = Protocol::ANY)
        : ip(std::move(addr)), port(p), proto(pr) {}

    bool empty() const { return ip.empty(); }

    // ip[:port][/proto]
    std::string str() const;

    bool operator==(const SourceId& o) const {
        return ip == o.ip && port == o.port && proto == o.proto;
    }
    bool operator!=(const SourceId& o) const { return !(*this == o); }
};

struct SourceIdHash {
    size_t operator()(const SourceId& id) const noexcept;
};

// Parses the str() form back. Throws MalformedEventError.
SourceId parse_source_id(const std::string& s);

// True if ip is a valid IPv4/IPv6 literal.
bool valid_ip(const std::string& ip);

} // namespace shieldcore

namespace std {
template<>
struct hash<shieldcore::SourceId> {
    size_t operator()(const shieldcore::SourceId& id) const noexcept {
        return shieldcore::SourceIdHash{}(id);
    }
};
}
