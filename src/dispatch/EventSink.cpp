#include "shieldcore/dispatch/EventSink.hpp"

#include <iomanip>
#include <sstream>

namespace shieldcore {

// Commas and quotes in free text would break the column layout.
static std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else if (c == '\n') out += ' ';
        else out += c;
    }
    out += '"';
    return out;
}

std::string describe(const DispatchEvent& ev) {
    if (const auto* a = std::get_if<MitigationAction>(&ev)) {
        return std::string(to_string(a->kind)) + " " + a->source.str();
    }
    const auto& al = std::get<AlertEvent>(ev);
    return std::string("alert ") + to_string(al.severity) + " " + al.source.str();
}

std::string to_csv(const MitigationAction& a) {
    std::ostringstream os;
    os << a.issued_ns << ",action,"
       << to_string(a.kind) << ","
       << a.source.str() << ","
       << a.expires_ns << ","
       << a.verdict_id << ","
       << csv_field(a.reason);
    return os.str();
}

std::string to_csv(const AlertEvent& a) {
    std::ostringstream os;
    os << a.ts_ns << ",alert,"
       << to_string(a.severity) << ","
       << a.source.str() << ","
       << std::fixed << std::setprecision(4) << a.score << ","
       << a.verdict_id << ","
       << csv_field(a.summary);
    return os.str();
}

} // namespace shieldcore
