#include "shieldcore/features/FeatureAggregator.hpp"
#include "shieldcore/features/FeatureSchema.hpp"
#include "shieldcore/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace shieldcore {

double shannon_entropy(const std::unordered_map<uint16_t, uint32_t>& hist) {
    uint64_t total = 0;
    for (const auto& kv : hist) total += kv.second;
    if (total == 0) return 0.0;

    double h = 0.0;
    for (const auto& kv : hist) {
        if (kv.second == 0) continue;
        double p = static_cast<double>(kv.second) / static_cast<double>(total);
        h -= p * std::log2(p);
    }
    return h;
}

FeatureAggregator::FeatureAggregator(const AggregatorConfig& cfg, MetricsRegistry& metrics)
    : window_ns_(cfg.window_ms * 1000000ULL),
      lateness_ns_(cfg.allowed_lateness_ms * 1000000ULL),
      per_shard_capacity_((cfg.max_tracked_identities + cfg.shards - 1) / std::max<size_t>(cfg.shards, 1)),
      metrics_(metrics) {
    const size_t n = std::max<size_t>(cfg.shards, 1);
    shards_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

FeatureAggregator::Shard& FeatureAggregator::shard_for(const SourceId& id) {
    return *shards_[SourceIdHash{}(id) % shards_.size()];
}

void FeatureAggregator::validate(const FlowEvent& ev) {
    if (ev.source.empty()) {
        throw MalformedEventError("flow event without source identity");
    }
    if (!valid_ip(ev.source.ip)) {
        throw MalformedEventError("invalid source address: " + ev.source.ip);
    }
    if (ev.ts_ns == 0) {
        throw MalformedEventError("flow event without timestamp from " + ev.source.str());
    }
    if (ev.bytes > 0 && ev.packets == 0) {
        throw MalformedEventError("bytes without packets from " + ev.source.str());
    }
    if (!(ev.duration_s >= 0.0) || !std::isfinite(ev.duration_s)) {
        throw MalformedEventError("invalid flow duration from " + ev.source.str());
    }
}

void FeatureAggregator::ingest(const FlowEvent& ev) {
    validate(ev);

    const uint64_t start = (ev.ts_ns / window_ns_) * window_ns_;
    Shard& sh = shard_for(ev.source);
    std::lock_guard<std::mutex> lk(sh.mtx);

    if (start + window_ns_ <= horizon_.load(std::memory_order_acquire)) {
        throw MalformedEventError("late flow event for closed window from " + ev.source.str());
    }

    auto it = sh.buckets.find(ev.source);
    if (it == sh.buckets.end()) {
        if (sh.buckets.size() >= per_shard_capacity_ && !sh.lru.empty()) {
            const SourceId victim = sh.lru.back();
            sh.lru.pop_back();
            sh.buckets.erase(victim);
            evictions_.fetch_add(1, std::memory_order_relaxed);
            metrics_.inc_aggregator_eviction();
            std::cerr << "[AGG] capacity exceeded, evicted " << victim.str() << "\n";
        }
        sh.lru.push_front(ev.source);
        Bucket b;
        b.window_start = start;
        b.lru = sh.lru.begin();
        it = sh.buckets.emplace(ev.source, std::move(b)).first;
    } else {
        Bucket& b = it->second;
        if (start < b.window_start) {
            throw MalformedEventError("out-of-order flow event from " + ev.source.str());
        }
        if (start > b.window_start) {
            // Newer window: close the open one now so ordering is preserved.
            sh.ready.push_back(build(ev.source, b));
            auto lru = b.lru;
            b = Bucket();
            b.window_start = start;
            b.lru = lru;
        }
        sh.lru.splice(sh.lru.begin(), sh.lru, it->second.lru);
    }

    accumulate(it->second, ev);

    uint64_t seen = watermark_.load(std::memory_order_relaxed);
    while (ev.ts_ns > seen &&
           !watermark_.compare_exchange_weak(seen, ev.ts_ns, std::memory_order_acq_rel)) {
    }
}

uint64_t FeatureAggregator::event_time_cutoff() const {
    const uint64_t w = watermark_.load(std::memory_order_acquire);
    return w > lateness_ns_ ? w - lateness_ns_ : 0;
}

void FeatureAggregator::accumulate(Bucket& b, const FlowEvent& ev) {
    b.last_event = ev.ts_ns;
    if (b.flows == 0 || ev.ts_ns < b.first_flow_ts) b.first_flow_ts = ev.ts_ns;
    if (ev.ts_ns > b.last_flow_ts) b.last_flow_ts = ev.ts_ns;

    b.flows += 1;
    b.packets += ev.packets;
    b.bytes += ev.bytes;

    if (ev.packets > 0) {
        double mean = static_cast<double>(ev.bytes) / static_cast<double>(ev.packets);
        b.size_sum += mean;
        b.size_sumsq += mean * mean;
        b.size_samples += 1;
    }

    switch (ev.protocol) {
        case Protocol::TCP:  b.tcp++; break;
        case Protocol::UDP:  b.udp++; break;
        case Protocol::ICMP: b.icmp++; break;
        default: break;
    }

    b.syn += ev.syn;
    b.ack += ev.ack;
    b.fin += ev.fin;
    b.rst += ev.rst;

    b.src_ports[ev.src_port != 0 ? ev.src_port : ev.source.port] += 1;
    b.dst_ports[ev.dst_port] += 1;
}

FeatureVector FeatureAggregator::build(const SourceId& id, const Bucket& b) const {
    using namespace features;

    FeatureVector v;
    v.source = id;
    v.window_start_ns = b.window_start;
    v.window_end_ns = b.window_start + window_ns_;
    v.names = name_list();
    v.values.assign(COUNT, 0.0);

    const double window_s = static_cast<double>(window_ns_) / 1e9;
    const double flows = static_cast<double>(b.flows);
    const double packets = static_cast<double>(b.packets);

    v.values[PACKET_RATE] = packets / window_s;
    v.values[BYTE_RATE] = static_cast<double>(b.bytes) / window_s;
    v.values[FLOW_COUNT] = flows;

    if (b.packets > 0) {
        v.values[PACKET_SIZE_AVG] = static_cast<double>(b.bytes) / packets;
    }
    if (b.size_samples > 0) {
        double n = static_cast<double>(b.size_samples);
        double mean = b.size_sum / n;
        v.values[PACKET_SIZE_STD] = std::sqrt(std::max(0.0, b.size_sumsq / n - mean * mean));
    }

    v.values[INTER_ARRIVAL_AVG] = b.flows > 1
        ? static_cast<double>(b.last_flow_ts - b.first_flow_ts) / 1e9 / (flows - 1.0)
        : window_s;

    if (b.flows > 0) {
        v.values[PROTOCOL_TCP] = static_cast<double>(b.tcp) / flows;
        v.values[PROTOCOL_UDP] = static_cast<double>(b.udp) / flows;
        v.values[PROTOCOL_ICMP] = static_cast<double>(b.icmp) / flows;
    }

    v.values[SRC_PORT_ENTROPY] = shannon_entropy(b.src_ports);
    v.values[DST_PORT_ENTROPY] = shannon_entropy(b.dst_ports);

    if (b.packets > 0) {
        v.values[FLAG_SYN] = std::min(1.0, static_cast<double>(b.syn) / packets);
        v.values[FLAG_ACK] = std::min(1.0, static_cast<double>(b.ack) / packets);
        v.values[FLAG_FIN] = std::min(1.0, static_cast<double>(b.fin) / packets);
        v.values[FLAG_RST] = std::min(1.0, static_cast<double>(b.rst) / packets);
    }

    return v;
}

std::vector<FeatureVector> FeatureAggregator::flush_due(uint64_t now_ns) {
    uint64_t prev = horizon_.load(std::memory_order_relaxed);
    while (now_ns > prev &&
           !horizon_.compare_exchange_weak(prev, now_ns, std::memory_order_acq_rel)) {
    }

    std::vector<FeatureVector> out;
    for (auto& shp : shards_) {
        Shard& sh = *shp;
        std::lock_guard<std::mutex> lk(sh.mtx);

        for (auto& v : sh.ready) out.push_back(std::move(v));
        sh.ready.clear();

        for (auto it = sh.buckets.begin(); it != sh.buckets.end(); ) {
            if (it->second.window_start + window_ns_ <= now_ns) {
                out.push_back(build(it->first, it->second));
                sh.lru.erase(it->second.lru);
                it = sh.buckets.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::stable_sort(out.begin(), out.end(),
        [](const FeatureVector& a, const FeatureVector& b) {
            return a.window_end_ns < b.window_end_ns;
        });

    if (!out.empty()) metrics_.inc_vector_emitted(out.size());
    return out;
}

size_t FeatureAggregator::tracked() const {
    size_t n = 0;
    for (const auto& shp : shards_) {
        std::lock_guard<std::mutex> lk(shp->mtx);
        n += shp->buckets.size();
    }
    return n;
}

} // namespace shieldcore
