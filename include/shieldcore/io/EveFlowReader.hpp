#pragma once

#include "shieldcore/core/Events.hpp"

#include <functional>
#include <istream>
#include <optional>
#include <string>

namespace shieldcore::io {

// Suricata eve.json flow records -> FlowEvent.
//
// Only event_type "flow" is used. The flow is attributed to src_ip; the
// counters are the to-server direction. The event timestamp is flow.end
// when present, else the record timestamp.
class EveFlowReader {
public:
    struct Stats {
        uint64_t lines = 0;
        uint64_t flows = 0;
        uint64_t skipped = 0;           // other event types, blank lines
        uint64_t malformed = 0;
    };

    using Handler = std::function<void(const FlowEvent&)>;

    // Empty for non-flow records. Throws MalformedEventError.
    static std::optional<FlowEvent> parse_line(const std::string& line);

    // Reads to EOF. Malformed lines are counted and skipped.
    static Stats read(std::istream& in, const Handler& fn);
};

// "2024-01-15T10:30:00.123456+0000" -> ns since epoch (UTC).
// Throws MalformedEventError.
uint64_t parse_eve_timestamp(const std::string& ts);

} // namespace shieldcore::io
