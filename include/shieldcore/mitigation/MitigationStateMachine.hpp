#pragma once

#include "shieldcore/config/EngineConfig.hpp"
#include "shieldcore/core/Events.hpp"
#include "shieldcore/metrics/MetricsRegistry.hpp"
#include "shieldcore/mitigation/TimerService.hpp"
#include "shieldcore/state/StateStore.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shieldcore {

struct Transition {
    MitigationState from;
    MitigationState to;
    uint64_t ts_ns = 0;
};

// What one input (verdict, timer, operator call) did to a source.
// Expiry transitions applied lazily before a verdict are reported together
// with the verdict's own transition.
struct MitigationOutcome {
    SourceState state;
    std::vector<Transition> transitions;
    std::vector<MitigationAction> actions;
    std::vector<AlertEvent> alerts;
    bool stale = false;                 // timer no longer matched the entry

    bool changed() const { return !transitions.empty(); }
};

// Observing -> Suspicious -> Blocked -> Recovering -> Observing, with
// hysteresis on the way up and exponential block backoff on relapse.
// All reads and writes of a SourceState go through StateStore atomic
// operations; timers are (re)armed after the store lock is released.
class MitigationStateMachine {
public:
    MitigationStateMachine(const MitigationConfig& cfg, StateStore& store,
                           TimerService* timers = nullptr,
                           MetricsRegistry& metrics = shieldcore::metrics());

    MitigationOutcome on_verdict(const FusedVerdict& v);

    // Timer callback. A generation mismatch makes this a no-op.
    MitigationOutcome on_timer(const SourceId& id, uint64_t generation, TimerKind kind,
                               uint64_t now_ns);

    // Operator block from any state. duration_ms 0 uses block_duration_ms.
    MitigationOutcome manual_block(const SourceId& id, uint64_t duration_ms,
                                   const std::string& reason, uint64_t now_ns);

    // Blocked -> Recovering. No-op for other states.
    MitigationOutcome manual_unblock(const SourceId& id, uint64_t now_ns);

    // Drops entries not seen for idle_timeout. Returns how many went.
    size_t evict_idle(uint64_t now_ns);

    // Duration of the block issued at the given offense level.
    uint64_t block_duration_ns(uint32_t offense_level) const;

    const MitigationConfig& config() const { return cfg_; }

private:
    void transition(SourceState& s, MitigationState to, uint64_t ts_ns,
                    MitigationOutcome& out);
    void enter_blocked(SourceState& s, uint64_t duration_ns, uint64_t ts_ns,
                       const std::string& reason, uint64_t verdict_id,
                       MitigationOutcome& out);
    void enter_recovering(SourceState& s, uint64_t ts_ns, const std::string& reason,
                          MitigationOutcome& out);
    void apply_expiry(SourceState& s, uint64_t now_ns, MitigationOutcome& out);
    void apply_score(SourceState& s, const FusedVerdict& v, MitigationOutcome& out);

    AlertEvent make_alert(Severity sev, const SourceState& s, const std::string& summary,
                          uint64_t verdict_id, uint64_t ts_ns) const;

    void rearm(const MitigationOutcome& out);
    void log(const MitigationOutcome& out) const;

    MitigationConfig cfg_;
    StateStore& store_;
    TimerService* timers_;
    MetricsRegistry& metrics_;
};

} // namespace shieldcore
