#include "shieldcore/io/EveFlowReader.hpp"
#include "shieldcore/core/Errors.hpp"

#include <boost/json.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace json = boost::json;

namespace shieldcore::io {

uint64_t parse_eve_timestamp(const std::string& ts) {
    int year, mon, day, hour, min, sec;
    int consumed = 0;
    if (std::sscanf(ts.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
        throw MalformedEventError("bad timestamp: " + ts);
    }

    size_t pos = static_cast<size_t>(consumed);
    uint64_t frac_ns = 0;
    if (pos < ts.size() && ts[pos] == '.') {
        ++pos;
        uint64_t scale = 100000000ULL;
        while (pos < ts.size() && std::isdigit(static_cast<unsigned char>(ts[pos]))) {
            frac_ns += static_cast<uint64_t>(ts[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }

    int64_t offset_s = 0;
    if (pos < ts.size() && (ts[pos] == '+' || ts[pos] == '-')) {
        const int sign = ts[pos] == '-' ? -1 : 1;
        int oh = 0, om = 0;
        if (std::sscanf(ts.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2 &&
            std::sscanf(ts.c_str() + pos + 1, "%2d%2d", &oh, &om) != 2) {
            throw MalformedEventError("bad timezone in timestamp: " + ts);
        }
        offset_s = sign * (oh * 3600 + om * 60);
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    const int64_t epoch = static_cast<int64_t>(timegm(&tm)) - offset_s;
    if (epoch <= 0) throw MalformedEventError("timestamp before epoch: " + ts);

    return static_cast<uint64_t>(epoch) * 1000000000ULL + frac_ns;
}

static uint64_t get_uint(const json::object& o, const char* key) {
    const json::value* v = o.if_contains(key);
    if (!v) return 0;
    if (v->is_uint64()) return v->as_uint64();
    if (v->is_int64()) {
        if (v->as_int64() < 0) throw MalformedEventError(std::string("negative ") + key);
        return static_cast<uint64_t>(v->as_int64());
    }
    if (v->is_double() && v->as_double() >= 0.0) return static_cast<uint64_t>(v->as_double());
    throw MalformedEventError(std::string("non-numeric ") + key);
}

static std::string get_string(const json::object& o, const char* key) {
    const json::value* v = o.if_contains(key);
    if (!v || !v->is_string()) return {};
    return std::string(v->as_string().c_str());
}

static uint32_t flag(const json::object& tcp, const char* key) {
    const json::value* v = tcp.if_contains(key);
    if (!v) return 0;
    if (v->is_bool()) return v->as_bool() ? 1 : 0;
    if (v->is_int64()) return v->as_int64() > 0 ? 1 : 0;
    return 0;
}

std::optional<FlowEvent> EveFlowReader::parse_line(const std::string& line) {
    json::error_code ec;
    json::value root = json::parse(line, ec);
    if (ec) throw MalformedEventError("invalid json: " + ec.message());
    if (!root.is_object()) throw MalformedEventError("eve record is not an object");

    const json::object& o = root.as_object();
    if (get_string(o, "event_type") != "flow") return std::nullopt;

    const std::string ip = get_string(o, "src_ip");
    if (ip.empty()) throw MalformedEventError("flow record without src_ip");

    FlowEvent ev;
    ev.source = SourceId(ip);
    ev.src_port = static_cast<uint16_t>(get_uint(o, "src_port"));
    ev.dst_port = static_cast<uint16_t>(get_uint(o, "dest_port"));
    ev.protocol = protocol_from_string(get_string(o, "proto"));

    uint64_t start_ns = 0;
    uint64_t end_ns = 0;
    if (const json::value* fv = o.if_contains("flow")) {
        if (!fv->is_object()) throw MalformedEventError("flow field is not an object");
        const json::object& flow = fv->as_object();
        ev.packets = get_uint(flow, "pkts_toserver");
        ev.bytes = get_uint(flow, "bytes_toserver");
        const std::string start = get_string(flow, "start");
        const std::string end = get_string(flow, "end");
        if (!start.empty()) start_ns = parse_eve_timestamp(start);
        if (!end.empty()) end_ns = parse_eve_timestamp(end);
    }

    if (end_ns) {
        ev.ts_ns = end_ns;
    } else {
        const std::string ts = get_string(o, "timestamp");
        if (ts.empty()) throw MalformedEventError("flow record without timestamp");
        ev.ts_ns = parse_eve_timestamp(ts);
    }
    if (start_ns && end_ns >= start_ns) {
        ev.duration_s = static_cast<double>(end_ns - start_ns) / 1e9;
    }

    if (const json::value* tv = o.if_contains("tcp")) {
        if (tv->is_object()) {
            const json::object& tcp = tv->as_object();
            ev.syn = flag(tcp, "syn");
            ev.ack = flag(tcp, "ack");
            ev.fin = flag(tcp, "fin");
            ev.rst = flag(tcp, "rst");
        }
    }
    return ev;
}

EveFlowReader::Stats EveFlowReader::read(std::istream& in, const Handler& fn) {
    Stats st;
    std::string line;
    while (std::getline(in, line)) {
        ++st.lines;
        if (line.empty()) {
            ++st.skipped;
            continue;
        }
        try {
            auto ev = parse_line(line);
            if (!ev) {
                ++st.skipped;
                continue;
            }
            ++st.flows;
            fn(*ev);
        } catch (const MalformedEventError& e) {
            ++st.malformed;
            std::cerr << "[EVE] line " << st.lines << ": " << e.what() << "\n";
        }
    }
    return st;
}

} // namespace shieldcore::io
