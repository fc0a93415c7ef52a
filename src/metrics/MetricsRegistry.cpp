#include "shieldcore/metrics/MetricsRegistry.hpp"
#include "shieldcore/core/Clock.hpp"

using namespace shieldcore;

static MetricsRegistry g_metrics;

MetricsRegistry::MetricsRegistry()
    : events_accepted_(0),
      events_busy_(0),
      events_malformed_(0),
      vectors_emitted_(0),
      aggregator_evictions_(0),
      verdicts_(0),
      verdicts_degraded_(0),
      verdicts_fallback_(0),
      model_timeouts_(0),
      model_errors_(0),
      explanations_(0),
      explanations_unavailable_(0),
      transitions_(0),
      blocks_(0),
      unblocks_(0),
      idle_evictions_(0),
      store_evictions_(0),
      stale_timers_(0),
      dispatch_delivered_(0),
      dispatch_retries_(0),
      dispatch_undelivered_(0) {}

MetricsRegistry& shieldcore::metrics() {
    return g_metrics;
}

void MetricsRegistry::inc_event_accepted() {
    events_accepted_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_event_busy() {
    events_busy_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_event_malformed() {
    events_malformed_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_vector_emitted(uint64_t n) {
    vectors_emitted_.fetch_add(n, std::memory_order_relaxed);
}

void MetricsRegistry::inc_aggregator_eviction() {
    aggregator_evictions_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_verdict(bool degraded, bool fallback) {
    verdicts_.fetch_add(1, std::memory_order_relaxed);
    if (degraded) verdicts_degraded_.fetch_add(1, std::memory_order_relaxed);
    if (fallback) verdicts_fallback_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_model_timeout() {
    model_timeouts_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_model_error() {
    model_errors_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_explanation(bool available) {
    if (available) {
        explanations_.fetch_add(1, std::memory_order_relaxed);
    } else {
        explanations_unavailable_.fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsRegistry::inc_transition() {
    transitions_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_block() {
    blocks_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_unblock() {
    unblocks_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_idle_eviction(uint64_t n) {
    idle_evictions_.fetch_add(n, std::memory_order_relaxed);
}

void MetricsRegistry::inc_store_eviction() {
    store_evictions_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_stale_timer() {
    stale_timers_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_dispatch_delivered() {
    dispatch_delivered_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_dispatch_retry() {
    dispatch_retries_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::inc_dispatch_undelivered() {
    dispatch_undelivered_.fetch_add(1, std::memory_order_relaxed);
}

MetricsSnapshot MetricsRegistry::snapshot() const {
    MetricsSnapshot s{};
    s.ts_ns = infra::now_ns();

    s.events_accepted          = events_accepted_.load(std::memory_order_relaxed);
    s.events_busy              = events_busy_.load(std::memory_order_relaxed);
    s.events_malformed         = events_malformed_.load(std::memory_order_relaxed);
    s.vectors_emitted          = vectors_emitted_.load(std::memory_order_relaxed);
    s.aggregator_evictions     = aggregator_evictions_.load(std::memory_order_relaxed);
    s.verdicts                 = verdicts_.load(std::memory_order_relaxed);
    s.verdicts_degraded        = verdicts_degraded_.load(std::memory_order_relaxed);
    s.verdicts_fallback        = verdicts_fallback_.load(std::memory_order_relaxed);
    s.model_timeouts           = model_timeouts_.load(std::memory_order_relaxed);
    s.model_errors             = model_errors_.load(std::memory_order_relaxed);
    s.explanations             = explanations_.load(std::memory_order_relaxed);
    s.explanations_unavailable = explanations_unavailable_.load(std::memory_order_relaxed);
    s.transitions              = transitions_.load(std::memory_order_relaxed);
    s.blocks                   = blocks_.load(std::memory_order_relaxed);
    s.unblocks                 = unblocks_.load(std::memory_order_relaxed);
    s.idle_evictions           = idle_evictions_.load(std::memory_order_relaxed);
    s.store_evictions          = store_evictions_.load(std::memory_order_relaxed);
    s.stale_timers             = stale_timers_.load(std::memory_order_relaxed);
    s.dispatch_delivered       = dispatch_delivered_.load(std::memory_order_relaxed);
    s.dispatch_retries         = dispatch_retries_.load(std::memory_order_relaxed);
    s.dispatch_undelivered     = dispatch_undelivered_.load(std::memory_order_relaxed);
    return s;
}
