#include "shieldcore/mitigation/MitigationStateMachine.hpp"
#include "shieldcore/core/Clock.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace shieldcore {

static std::string fmt_score(double s) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(3) << s;
    return os.str();
}

MitigationStateMachine::MitigationStateMachine(const MitigationConfig& cfg, StateStore& store,
                                               TimerService* timers, MetricsRegistry& metrics)
    : cfg_(cfg), store_(store), timers_(timers), metrics_(metrics) {
    if (timers_) {
        // An evicted identity comes back at generation 0; its old timer
        // must not outrank the new entry's.
        store_.set_eviction_listener([this](const SourceId& id) {
            timers_->cancel(id, StateStore::kAnyGeneration);
        });
    }
}

uint64_t MitigationStateMachine::block_duration_ns(uint32_t offense_level) const {
    const double base = static_cast<double>(cfg_.block_duration_ms);
    const double cap = static_cast<double>(cfg_.max_block_ms);
    double ms = base * std::pow(cfg_.backoff_factor, static_cast<double>(offense_level));
    if (!(ms < cap)) ms = cap;
    return infra::ms_to_ns(static_cast<uint64_t>(ms));
}

AlertEvent MitigationStateMachine::make_alert(Severity sev, const SourceState& s,
                                              const std::string& summary,
                                              uint64_t verdict_id, uint64_t ts_ns) const {
    AlertEvent a;
    a.severity = sev;
    a.source = s.source;
    a.summary = summary;
    a.verdict_id = verdict_id;
    a.score = s.last_score;
    a.ts_ns = ts_ns;
    return a;
}

void MitigationStateMachine::transition(SourceState& s, MitigationState to, uint64_t ts_ns,
                                        MitigationOutcome& out) {
    out.transitions.push_back({s.state, to, ts_ns});
    s.state = to;
    s.generation++;
    s.last_transition_ns = ts_ns;
    metrics_.inc_transition();
}

void MitigationStateMachine::enter_blocked(SourceState& s, uint64_t duration_ns, uint64_t ts_ns,
                                           const std::string& reason, uint64_t verdict_id,
                                           MitigationOutcome& out) {
    transition(s, MitigationState::BLOCKED, ts_ns, out);
    s.block_streak = 0;
    s.clean_streak = 0;
    s.offense_level++;
    s.block_expires_ns = ts_ns + duration_ns;
    s.probation_expires_ns = 0;

    MitigationAction a;
    a.source = s.source;
    a.kind = ActionKind::BLOCK;
    a.reason = reason;
    a.verdict_id = verdict_id;
    a.issued_ns = ts_ns;
    a.expires_ns = s.block_expires_ns;
    out.actions.push_back(std::move(a));
    metrics_.inc_block();
}

void MitigationStateMachine::enter_recovering(SourceState& s, uint64_t ts_ns,
                                              const std::string& reason,
                                              MitigationOutcome& out) {
    transition(s, MitigationState::RECOVERING, ts_ns, out);
    s.block_expires_ns = 0;
    s.probation_expires_ns = ts_ns + infra::ms_to_ns(cfg_.probation_ms);

    MitigationAction a;
    a.source = s.source;
    a.kind = ActionKind::UNBLOCK;
    a.reason = reason;
    a.issued_ns = ts_ns;
    out.actions.push_back(std::move(a));
    metrics_.inc_unblock();
}

void MitigationStateMachine::apply_expiry(SourceState& s, uint64_t now_ns,
                                          MitigationOutcome& out) {
    for (;;) {
        if (s.state == MitigationState::BLOCKED && s.block_expires_ns != 0 &&
            now_ns >= s.block_expires_ns) {
            enter_recovering(s, s.block_expires_ns, "block expired", out);
        } else if (s.state == MitigationState::RECOVERING && s.probation_expires_ns != 0 &&
                   now_ns >= s.probation_expires_ns) {
            const uint64_t at = s.probation_expires_ns;
            transition(s, MitigationState::OBSERVING, at, out);
            s.probation_expires_ns = 0;
            s.offense_level = 0;
            s.block_streak = 0;
            s.clean_streak = 0;
        } else {
            return;
        }
    }
}

void MitigationStateMachine::apply_score(SourceState& s, const FusedVerdict& v,
                                         MitigationOutcome& out) {
    s.last_seen_ns = std::max(s.last_seen_ns, v.ts_ns);
    s.last_score = v.score;

    const bool suspicious = v.score >= cfg_.suspicious_threshold;
    const bool blocking = v.score >= cfg_.block_threshold;

    switch (s.state) {
    case MitigationState::OBSERVING:
        if (!suspicious) break;
        transition(s, MitigationState::SUSPICIOUS, v.ts_ns, out);
        s.block_streak = blocking ? 1 : 0;
        s.clean_streak = 0;
        {
            MitigationAction a;
            a.source = s.source;
            a.kind = ActionKind::WATCH;
            a.reason = "score " + fmt_score(v.score);
            a.verdict_id = v.id;
            a.issued_ns = v.ts_ns;
            out.actions.push_back(std::move(a));

            AlertEvent al = make_alert(Severity::MEDIUM, s,
                                       "suspicious traffic, score " + fmt_score(v.score),
                                       v.id, v.ts_ns);
            al.explanation = v.explanation;
            out.alerts.push_back(std::move(al));
        }
        break;

    case MitigationState::SUSPICIOUS:
        if (blocking) {
            s.block_streak++;
            s.clean_streak = 0;
            if (s.block_streak >= cfg_.block_consecutive) {
                const uint32_t n = s.block_streak;
                enter_blocked(s, block_duration_ns(s.offense_level), v.ts_ns,
                              std::to_string(n) + " consecutive verdicts >= " +
                                  fmt_score(cfg_.block_threshold),
                              v.id, out);
                AlertEvent al = make_alert(Severity::HIGH, s,
                                           "blocked, score " + fmt_score(v.score), v.id, v.ts_ns);
                al.explanation = v.explanation;
                out.alerts.push_back(std::move(al));
            }
        } else if (suspicious) {
            s.block_streak = 0;
            s.clean_streak = 0;
        } else {
            s.block_streak = 0;
            s.clean_streak++;
            if (s.clean_streak >= cfg_.clean_consecutive) {
                transition(s, MitigationState::OBSERVING, v.ts_ns, out);
                s.clean_streak = 0;
            }
        }
        break;

    case MitigationState::BLOCKED:
        break;

    case MitigationState::RECOVERING:
        if (!suspicious) break;
        enter_blocked(s, block_duration_ns(s.offense_level), v.ts_ns,
                      "relapse during probation", v.id, out);
        {
            AlertEvent al = make_alert(Severity::CRITICAL, s,
                                       "relapse during probation, re-blocked at level " +
                                           std::to_string(s.offense_level) + ", score " +
                                           fmt_score(v.score),
                                       v.id, v.ts_ns);
            al.explanation = v.explanation;
            out.alerts.push_back(std::move(al));
        }
        break;
    }
}

MitigationOutcome MitigationStateMachine::on_verdict(const FusedVerdict& v) {
    MitigationOutcome out;
    out.state = store_.update(v.source, v.ts_ns, [&](SourceState& s) {
        apply_expiry(s, v.ts_ns, out);
        apply_score(s, v, out);
    });
    rearm(out);
    log(out);
    return out;
}

MitigationOutcome MitigationStateMachine::on_timer(const SourceId& id, uint64_t generation,
                                                   TimerKind kind, uint64_t now_ns) {
    MitigationOutcome out;
    auto st = store_.compare_and_transition(id, generation, [&](SourceState& s) {
        // The timer fired for this exact generation; treat its due time as
        // reached even if the wall clock lags it slightly.
        if (kind == TimerKind::BLOCK_EXPIRY && s.state == MitigationState::BLOCKED) {
            apply_expiry(s, std::max(now_ns, s.block_expires_ns), out);
        } else if (kind == TimerKind::PROBATION_EXPIRY &&
                   s.state == MitigationState::RECOVERING) {
            apply_expiry(s, std::max(now_ns, s.probation_expires_ns), out);
        }
    });
    if (!st) {
        out.stale = true;
        out.state.source = id;
        metrics_.inc_stale_timer();
        return out;
    }
    out.state = *st;
    rearm(out);
    log(out);
    return out;
}

MitigationOutcome MitigationStateMachine::manual_block(const SourceId& id, uint64_t duration_ms,
                                                       const std::string& reason,
                                                       uint64_t now_ns) {
    MitigationOutcome out;
    out.state = store_.update(id, now_ns, [&](SourceState& s) {
        apply_expiry(s, now_ns, out);
        s.last_seen_ns = std::max(s.last_seen_ns, now_ns);
        const uint64_t dur = duration_ms ? infra::ms_to_ns(duration_ms)
                                         : block_duration_ns(s.offense_level);
        const std::string why = reason.empty() ? "manual block" : "manual block: " + reason;
        enter_blocked(s, dur, now_ns, why, 0, out);
        out.alerts.push_back(make_alert(Severity::HIGH, s, why, 0, now_ns));
    });
    rearm(out);
    log(out);
    return out;
}

MitigationOutcome MitigationStateMachine::manual_unblock(const SourceId& id, uint64_t now_ns) {
    MitigationOutcome out;
    auto st = store_.compare_and_transition(id, StateStore::kAnyGeneration,
                                            [&](SourceState& s) {
        if (s.state == MitigationState::BLOCKED) {
            enter_recovering(s, now_ns, "manual unblock", out);
        }
    });
    if (st) {
        out.state = *st;
    } else {
        out.state.source = id;
    }
    rearm(out);
    log(out);
    return out;
}

size_t MitigationStateMachine::evict_idle(uint64_t now_ns) {
    const uint64_t idle = infra::ms_to_ns(cfg_.idle_timeout_ms);
    const uint64_t before = now_ns > idle ? now_ns - idle : 0;
    auto gone = store_.evict_idle(before);
    if (timers_) {
        for (const auto& id : gone) timers_->cancel(id, StateStore::kAnyGeneration);
    }
    if (!gone.empty()) {
        std::cout << "[MITIGATION] evicted " << gone.size() << " idle sources\n";
    }
    return gone.size();
}

void MitigationStateMachine::rearm(const MitigationOutcome& out) {
    if (!timers_ || !out.changed()) return;
    const SourceState& s = out.state;
    switch (s.state) {
    case MitigationState::BLOCKED:
        timers_->schedule(s.source, s.generation, TimerKind::BLOCK_EXPIRY, s.block_expires_ns);
        break;
    case MitigationState::RECOVERING:
        timers_->schedule(s.source, s.generation, TimerKind::PROBATION_EXPIRY,
                          s.probation_expires_ns);
        break;
    default:
        timers_->cancel(s.source, s.generation);
        break;
    }
}

void MitigationStateMachine::log(const MitigationOutcome& out) const {
    for (const auto& t : out.transitions) {
        std::cout << "[MITIGATION] " << out.state.source.str() << " "
                  << to_string(t.from) << " -> " << to_string(t.to)
                  << " score=" << fmt_score(out.state.last_score);
        if (t.to == MitigationState::BLOCKED) {
            std::cout << " level=" << out.state.offense_level;
        }
        std::cout << "\n";
    }
}

} // namespace shieldcore
