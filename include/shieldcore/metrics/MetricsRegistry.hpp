#pragma once
#include "shieldcore/metrics/MetricsTypes.hpp"
#include <atomic>

namespace shieldcore {

// Relaxed atomic counters. Hot-path stages only increment; readers take a
// snapshot.
class MetricsRegistry {
public:
    MetricsRegistry();

    void inc_event_accepted();
    void inc_event_busy();
    void inc_event_malformed();

    void inc_vector_emitted(uint64_t n = 1);
    void inc_aggregator_eviction();

    void inc_verdict(bool degraded, bool fallback);
    void inc_model_timeout();
    void inc_model_error();

    void inc_explanation(bool available);

    void inc_transition();
    void inc_block();
    void inc_unblock();
    void inc_idle_eviction(uint64_t n = 1);
    void inc_store_eviction();
    void inc_stale_timer();

    void inc_dispatch_delivered();
    void inc_dispatch_retry();
    void inc_dispatch_undelivered();

    MetricsSnapshot snapshot() const;

private:
    std::atomic<uint64_t> events_accepted_;
    std::atomic<uint64_t> events_busy_;
    std::atomic<uint64_t> events_malformed_;
    std::atomic<uint64_t> vectors_emitted_;
    std::atomic<uint64_t> aggregator_evictions_;
    std::atomic<uint64_t> verdicts_;
    std::atomic<uint64_t> verdicts_degraded_;
    std::atomic<uint64_t> verdicts_fallback_;
    std::atomic<uint64_t> model_timeouts_;
    std::atomic<uint64_t> model_errors_;
    std::atomic<uint64_t> explanations_;
    std::atomic<uint64_t> explanations_unavailable_;
    std::atomic<uint64_t> transitions_;
    std::atomic<uint64_t> blocks_;
    std::atomic<uint64_t> unblocks_;
    std::atomic<uint64_t> idle_evictions_;
    std::atomic<uint64_t> store_evictions_;
    std::atomic<uint64_t> stale_timers_;
    std::atomic<uint64_t> dispatch_delivered_;
    std::atomic<uint64_t> dispatch_retries_;
    std::atomic<uint64_t> dispatch_undelivered_;
};

// Process-wide registry used by the daemon.
MetricsRegistry& metrics();

}
