#pragma once

#include "shieldcore/config/EngineConfig.hpp"
#include "shieldcore/core/Events.hpp"
#include "shieldcore/metrics/MetricsRegistry.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace shieldcore {

// Fixed-size, non-overlapping windows keyed by source identity.
//
// Windows are aligned to multiples of the window size. An event for a newer
// window than the open one closes the open window early (it is returned by
// the next flush_due). Events for a window at or before the last flush
// horizon, or older than the identity's open window, are late and rejected:
// that keeps the windows of one identity disjoint and ordered.
//
// The flush horizon follows event time, not the wall clock: callers close
// windows up to event_time_cutoff(), the newest accepted event timestamp
// minus the allowed lateness. Replayed or delayed flow logs are therefore
// aggregated exactly like live ones.
//
// Memory is bounded per shard (max_tracked_identities / shards, rounded up).
// Admitting a new identity into a full shard evicts that shard's least
// recently active identity together with its pending window.
class FeatureAggregator {
public:
    explicit FeatureAggregator(const AggregatorConfig& cfg,
                               MetricsRegistry& metrics = shieldcore::metrics());

    FeatureAggregator(const FeatureAggregator&) = delete;
    FeatureAggregator& operator=(const FeatureAggregator&) = delete;

    // Throws MalformedEventError.
    static void validate(const FlowEvent& ev);

    // Throws MalformedEventError for invalid or late events.
    void ingest(const FlowEvent& ev);

    // Closes every window whose end <= now and returns its vector.
    std::vector<FeatureVector> flush_due(uint64_t now_ns);

    // Newest accepted event timestamp minus the allowed lateness; 0 before
    // enough event time has passed.
    uint64_t event_time_cutoff() const;
    uint64_t watermark() const { return watermark_.load(std::memory_order_acquire); }

    size_t tracked() const;
    uint64_t window_ns() const { return window_ns_; }
    uint64_t capacity_evictions() const { return evictions_.load(std::memory_order_relaxed); }

private:
    struct Bucket {
        uint64_t window_start = 0;
        uint64_t last_event = 0;
        uint64_t first_flow_ts = 0;
        uint64_t last_flow_ts = 0;

        uint64_t flows = 0;
        uint64_t packets = 0;
        uint64_t bytes = 0;

        // per-flow mean packet size moments
        double size_sum = 0.0;
        double size_sumsq = 0.0;
        uint64_t size_samples = 0;

        uint64_t tcp = 0;
        uint64_t udp = 0;
        uint64_t icmp = 0;

        uint64_t syn = 0;
        uint64_t ack = 0;
        uint64_t fin = 0;
        uint64_t rst = 0;

        std::unordered_map<uint16_t, uint32_t> src_ports;
        std::unordered_map<uint16_t, uint32_t> dst_ports;

        std::list<SourceId>::iterator lru;
    };

    struct Shard {
        std::mutex mtx;
        std::unordered_map<SourceId, Bucket> buckets;
        std::list<SourceId> lru;                // front = most recently active
        std::vector<FeatureVector> ready;       // closed early, awaiting flush
    };

    Shard& shard_for(const SourceId& id);
    void accumulate(Bucket& b, const FlowEvent& ev);
    FeatureVector build(const SourceId& id, const Bucket& b) const;

    const uint64_t window_ns_;
    const uint64_t lateness_ns_;
    const size_t per_shard_capacity_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> horizon_{0};          // windows ending at or before this are closed
    std::atomic<uint64_t> watermark_{0};        // newest accepted event timestamp
    std::atomic<uint64_t> evictions_{0};
    MetricsRegistry& metrics_;
};

// Shannon entropy in bits of a count histogram.
double shannon_entropy(const std::unordered_map<uint16_t, uint32_t>& hist);

} // namespace shieldcore
