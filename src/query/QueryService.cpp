#include "shieldcore/query/QueryService.hpp"

#include <algorithm>

namespace shieldcore {

QueryService::QueryService(const StateStore& store, const VerdictHistory& history,
                           const AlertHistory& alerts, const EventDispatcher& dispatcher,
                           const MetricsRegistry& metrics)
    : store_(store), history_(history), alerts_(alerts), dispatcher_(dispatcher),
      metrics_(metrics) {}

SourceState QueryService::state(const SourceId& id) const {
    auto s = store_.find(id);
    if (s) return *s;
    SourceState fresh;
    fresh.source = id;
    return fresh;
}

bool QueryService::tracked(const SourceId& id) const {
    return store_.find(id).has_value();
}

std::vector<FusedVerdict> QueryService::verdicts(const SourceId& id, size_t limit) const {
    return history_.recent(id, limit);
}

std::vector<SourceState> QueryService::blocked() const {
    auto out = store_.snapshot_blocked();
    std::sort(out.begin(), out.end(), [](const SourceState& a, const SourceState& b) {
        if (a.block_expires_ns != b.block_expires_ns)
            return a.block_expires_ns < b.block_expires_ns;
        return a.source.str() < b.source.str();
    });
    return out;
}

std::vector<AlertEvent> QueryService::alerts(size_t limit) const {
    return alerts_.recent(limit);
}

std::vector<UndeliveredRecord> QueryService::undelivered() const {
    return dispatcher_.undelivered();
}

MetricsSnapshot QueryService::metrics() const {
    return metrics_.snapshot();
}

} // namespace shieldcore
