#include "shieldcore/io/JsonCodec.hpp"

namespace json = boost::json;

namespace shieldcore::io {

json::array to_json(const Explanation& e) {
    json::array arr;
    for (const auto& c : e.contributions) {
        json::object o;
        o["feature"] = c.feature;
        o["contribution"] = c.weight;
        arr.push_back(std::move(o));
    }
    return arr;
}

static void put_explanation(json::object& o, const ExplanationPtr& e) {
    if (!e) return;
    if (e->available) {
        o["explanation"] = to_json(*e);
    } else {
        o["explanation_unavailable"] = e->reason;
    }
}

json::object to_json(const SourceState& s) {
    json::object o;
    o["source"] = s.source.str();
    o["state"] = to_string(s.state);
    o["block_streak"] = s.block_streak;
    o["clean_streak"] = s.clean_streak;
    o["offense_level"] = s.offense_level;
    o["generation"] = s.generation;
    o["last_transition_ns"] = s.last_transition_ns;
    o["last_seen_ns"] = s.last_seen_ns;
    o["last_score"] = s.last_score;
    if (s.block_expires_ns) o["block_expires_ns"] = s.block_expires_ns;
    if (s.probation_expires_ns) o["probation_expires_ns"] = s.probation_expires_ns;
    return o;
}

json::object to_json(const FusedVerdict& v) {
    json::object o;
    o["id"] = v.id;
    o["source"] = v.source.str();
    o["score"] = v.score;
    o["ts_ns"] = v.ts_ns;
    o["degraded"] = v.degraded;
    o["fallback"] = v.fallback;

    json::array models;
    for (const auto& s : v.scores) {
        json::object m;
        m["model"] = s.model_id;
        m["status"] = to_string(s.status);
        m["score"] = s.score;
        m["confidence"] = s.confidence;
        m["latency_us"] = s.latency_ns / 1000;
        if (!s.detail.empty()) m["detail"] = s.detail;
        models.push_back(std::move(m));
    }
    o["models"] = std::move(models);

    if (v.vector) {
        json::object f;
        for (size_t i = 0; i < v.vector->values.size() && i < v.vector->names.size(); ++i) {
            f[v.vector->names[i]] = v.vector->values[i];
        }
        o["features"] = std::move(f);
    }
    put_explanation(o, v.explanation);
    return o;
}

json::object to_json(const MitigationAction& a) {
    json::object o;
    o["type"] = "action";
    o["action"] = to_string(a.kind);
    o["source"] = a.source.str();
    o["ip"] = a.source.ip;
    o["reason"] = a.reason;
    o["verdict_id"] = a.verdict_id;
    o["issued_ns"] = a.issued_ns;
    if (a.kind == ActionKind::BLOCK) o["expires_at_ns"] = a.expires_ns;
    return o;
}

json::object to_json(const AlertEvent& a) {
    json::object o;
    o["type"] = "alert";
    o["severity"] = to_string(a.severity);
    o["source"] = a.source.str();
    o["summary"] = a.summary;
    o["verdict_id"] = a.verdict_id;
    o["score"] = a.score;
    o["ts_ns"] = a.ts_ns;
    put_explanation(o, a.explanation);
    return o;
}

json::object to_json(const UndeliveredRecord& r) {
    json::object o;
    o["sink"] = r.sink;
    o["event"] = r.event;
    o["source"] = r.source.str();
    o["attempts"] = r.attempts;
    o["error"] = r.error;
    o["ts_ns"] = r.ts_ns;
    return o;
}

} // namespace shieldcore::io
