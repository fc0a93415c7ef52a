#pragma once

#include "shieldcore/dispatch/EventDispatcher.hpp"
#include "shieldcore/metrics/MetricsRegistry.hpp"
#include "shieldcore/query/AlertHistory.hpp"
#include "shieldcore/query/VerdictHistory.hpp"
#include "shieldcore/state/StateStore.hpp"

#include <vector>

namespace shieldcore {

// Read-only view over the running engine.
class QueryService {
public:
    QueryService(const StateStore& store, const VerdictHistory& history,
                 const AlertHistory& alerts, const EventDispatcher& dispatcher,
                 const MetricsRegistry& metrics = shieldcore::metrics());

    // Unseen sources report a default Observing state.
    SourceState state(const SourceId& id) const;
    bool tracked(const SourceId& id) const;

    std::vector<FusedVerdict> verdicts(const SourceId& id, size_t limit) const;

    // Sorted by block expiry, soonest first.
    std::vector<SourceState> blocked() const;

    // Newest first across all sources.
    std::vector<AlertEvent> alerts(size_t limit) const;

    std::vector<UndeliveredRecord> undelivered() const;
    MetricsSnapshot metrics() const;

private:
    const StateStore& store_;
    const VerdictHistory& history_;
    const AlertHistory& alerts_;
    const EventDispatcher& dispatcher_;
    const MetricsRegistry& metrics_;
};

} // namespace shieldcore
