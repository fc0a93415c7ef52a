#include "shieldcore/metrics/MetricsExporter.hpp"
#include <sstream>
#include <vector>

using namespace shieldcore;

MetricsExporter::MetricsExporter(const std::string& prefix)
    : prefix_(prefix) {}

namespace {

struct Counter {
    const char* name;
    const char* help;
    uint64_t    value;
};

std::vector<Counter> counters(const MetricsSnapshot& s) {
    return {
        {"events_accepted_total",          "Flow events accepted at ingestion", s.events_accepted},
        {"events_busy_total",              "Flow events shed because ingestion was full", s.events_busy},
        {"events_malformed_total",         "Flow events rejected as malformed", s.events_malformed},
        {"vectors_emitted_total",          "Feature vectors produced by closed windows", s.vectors_emitted},
        {"aggregator_evictions_total",     "Identities evicted from the aggregator at capacity", s.aggregator_evictions},
        {"verdicts_total",                 "Fused verdicts produced", s.verdicts},
        {"verdicts_degraded_total",        "Verdicts with at least one failed model", s.verdicts_degraded},
        {"verdicts_fallback_total",        "Verdicts with no responding model", s.verdicts_fallback},
        {"model_timeouts_total",           "Model calls that missed their deadline", s.model_timeouts},
        {"model_errors_total",             "Model calls that failed", s.model_errors},
        {"explanations_total",             "Explanations computed", s.explanations},
        {"explanations_unavailable_total", "Explanations marked unavailable", s.explanations_unavailable},
        {"transitions_total",              "Mitigation state transitions", s.transitions},
        {"blocks_total",                   "Block actions issued", s.blocks},
        {"unblocks_total",                 "Unblock actions issued", s.unblocks},
        {"idle_evictions_total",           "Source states evicted after idling", s.idle_evictions},
        {"store_evictions_total",          "Source states evicted at store capacity", s.store_evictions},
        {"stale_timers_total",             "Timers ignored because the state moved on", s.stale_timers},
        {"dispatch_delivered_total",       "Events delivered to sinks", s.dispatch_delivered},
        {"dispatch_retries_total",         "Delivery retries", s.dispatch_retries},
        {"dispatch_undelivered_total",     "Events dropped after exhausting retries", s.dispatch_undelivered},
    };
}

}

std::string MetricsExporter::to_prometheus(const MetricsSnapshot& s) const {
    std::ostringstream os;
    for (const auto& c : counters(s)) {
        os << "# HELP " << prefix_ << "_" << c.name << " " << c.help << "\n";
        os << "# TYPE " << prefix_ << "_" << c.name << " counter\n";
        os << prefix_ << "_" << c.name << " " << c.value << "\n";
    }
    return os.str();
}
