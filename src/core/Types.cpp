#include "shieldcore/core/Types.hpp"
#include "shieldcore/core/Errors.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

namespace shieldcore {

const char* to_string(Protocol p) {
    switch (p) {
        case Protocol::ANY:   return "any";
        case Protocol::TCP:   return "tcp";
        case Protocol::UDP:   return "udp";
        case Protocol::ICMP:  return "icmp";
        case Protocol::OTHER: return "other";
    }
    return "other";
}

Protocol protocol_from_string(const std::string& s) {
    if (s.empty() || s == "any" || s == "ANY") return Protocol::ANY;
    if (s == "tcp" || s == "TCP") return Protocol::TCP;
    if (s == "udp" || s == "UDP") return Protocol::UDP;
    if (s == "icmp" || s == "ICMP" || s == "ipv6-icmp" || s == "IPv6-ICMP")
        return Protocol::ICMP;
    return Protocol::OTHER;
}

std::string SourceId::str() const {
    std::string out = ip;
    if (port != 0) {
        out += ":";
        out += std::to_string(port);
    }
    if (proto != Protocol::ANY) {
        out += "/";
        out += to_string(proto);
    }
    return out;
}

size_t SourceIdHash::operator()(const SourceId& id) const noexcept {
    // splitmix64 finalizer over the combined key; shard selection takes the
    // low bits so they must be well mixed.
    uint64_t h = std::hash<std::string>{}(id.ip);
    h ^= (static_cast<uint64_t>(id.port) << 8) | static_cast<uint64_t>(id.proto);
    h += 0x9e3779b97f4a7c15ULL;
    h = (h ^ (h >> 30)) * 0xbf58476d1ce4e5b9ULL;
    h = (h ^ (h >> 27)) * 0x94d049bb133111ebULL;
    h = h ^ (h >> 31);
    return static_cast<size_t>(h);
}

bool valid_ip(const std::string& ip) {
    if (ip.empty()) return false;
    boost::system::error_code ec;
    boost::asio::ip::make_address(ip, ec);
    return !ec;
}

SourceId parse_source_id(const std::string& s) {
    if (s.empty()) throw MalformedEventError("empty source identity");

    std::string rest = s;
    Protocol proto = Protocol::ANY;
    auto slash = rest.rfind('/');
    if (slash != std::string::npos) {
        proto = protocol_from_string(rest.substr(slash + 1));
        rest = rest.substr(0, slash);
    }

    uint16_t port = 0;
    // IPv6 literals contain ':' themselves; a port is only split off when the
    // remainder is not already a valid address.
    if (!valid_ip(rest)) {
        auto colon = rest.rfind(':');
        if (colon == std::string::npos)
            throw MalformedEventError("invalid source identity: " + s);
        std::string port_str = rest.substr(colon + 1);
        rest = rest.substr(0, colon);
        if (!rest.empty() && rest.front() == '[' && rest.back() == ']')
            rest = rest.substr(1, rest.size() - 2);
        try {
            unsigned long p = std::stoul(port_str);
            if (p == 0 || p > 65535) throw MalformedEventError("port out of range: " + s);
            port = static_cast<uint16_t>(p);
        } catch (const std::logic_error&) {
            throw MalformedEventError("invalid port in source identity: " + s);
        }
    }

    if (!valid_ip(rest))
        throw MalformedEventError("invalid source address: " + s);

    return SourceId(rest, port, proto);
}

} // namespace shieldcore
