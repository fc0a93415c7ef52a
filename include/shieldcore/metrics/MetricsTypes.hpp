#pragma once
#include <cstdint>

namespace shieldcore {

struct alignas(64) MetricsSnapshot {
    uint64_t ts_ns;

    uint64_t events_accepted;
    uint64_t events_busy;
    uint64_t events_malformed;

    uint64_t vectors_emitted;
    uint64_t aggregator_evictions;

    uint64_t verdicts;
    uint64_t verdicts_degraded;
    uint64_t verdicts_fallback;
    uint64_t model_timeouts;
    uint64_t model_errors;

    uint64_t explanations;
    uint64_t explanations_unavailable;

    uint64_t transitions;
    uint64_t blocks;
    uint64_t unblocks;
    uint64_t idle_evictions;
    uint64_t store_evictions;
    uint64_t stale_timers;

    uint64_t dispatch_delivered;
    uint64_t dispatch_retries;
    uint64_t dispatch_undelivered;
};

}
