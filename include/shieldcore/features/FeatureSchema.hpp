#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace shieldcore::features {

// Fixed feature order shared by the aggregator, every model artifact and
// the explainer. Artifacts index features by position.
enum Index : size_t {
    PACKET_RATE = 0,
    BYTE_RATE,
    FLOW_COUNT,
    PACKET_SIZE_AVG,
    PACKET_SIZE_STD,
    INTER_ARRIVAL_AVG,
    PROTOCOL_TCP,
    PROTOCOL_UDP,
    PROTOCOL_ICMP,
    SRC_PORT_ENTROPY,
    DST_PORT_ENTROPY,
    FLAG_SYN,
    FLAG_ACK,
    FLAG_FIN,
    FLAG_RST,
    COUNT
};

inline const std::array<const char*, COUNT>& names() {
    static const std::array<const char*, COUNT> n = {
        "packet_rate",
        "byte_rate",
        "flow_count",
        "packet_size_avg",
        "packet_size_std",
        "inter_arrival_avg",
        "protocol_tcp",
        "protocol_udp",
        "protocol_icmp",
        "src_port_entropy",
        "dst_port_entropy",
        "flag_syn",
        "flag_ack",
        "flag_fin",
        "flag_rst"
    };
    return n;
}

inline std::vector<std::string> name_list() {
    return std::vector<std::string>(names().begin(), names().end());
}

} // namespace shieldcore::features
