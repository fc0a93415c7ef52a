#include "shieldcore/state/StateStore.hpp"

#include <iostream>

namespace shieldcore {

static size_t round_pow2(size_t n) {
    size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

StateStore::StateStore(size_t max_tracked, size_t shards, MetricsRegistry& metrics)
    : metrics_(metrics) {
    const size_t n = round_pow2(shards == 0 ? 1 : shards);
    mask_ = n - 1;
    per_shard_cap_ = (max_tracked + n - 1) / n;
    if (per_shard_cap_ == 0) per_shard_cap_ = 1;
    shards_.reserve(n);
    for (size_t i = 0; i < n; ++i) shards_.push_back(std::make_unique<Shard>());
}

StateStore::Shard& StateStore::shard_for(const SourceId& id) {
    return *shards_[SourceIdHash{}(id) & mask_];
}

const StateStore::Shard& StateStore::shard_for(const SourceId& id) const {
    return *shards_[SourceIdHash{}(id) & mask_];
}

std::optional<SourceId> StateStore::evict_one(Shard& s) {
    for (auto it = s.lru.rbegin(); it != s.lru.rend(); ++it) {
        auto e = s.map.find(*it);
        if (e->second.state.state == MitigationState::BLOCKED) continue;
        SourceId victim = *it;
        std::cerr << "[STATE] capacity exceeded, evicted " << victim.str()
                  << " (" << to_string(e->second.state.state) << ")\n";
        s.lru.erase(std::next(it).base());
        s.map.erase(e);
        metrics_.inc_store_eviction();
        return victim;
    }
    // Every entry is blocked; grow past the bound rather than drop a block.
    std::cerr << "[STATE] capacity exceeded, all " << s.map.size()
              << " entries in shard are blocked\n";
    return std::nullopt;
}

void StateStore::notify_evicted(const std::optional<SourceId>& id) const {
    if (id && on_evict_) on_evict_(*id);
}

StateStore::Entry& StateStore::locate_or_insert(Shard& s, const SourceId& id, uint64_t now_ns,
                                                std::optional<SourceId>& evicted) {
    auto it = s.map.find(id);
    if (it != s.map.end()) {
        s.lru.splice(s.lru.begin(), s.lru, it->second.lru);
        return it->second;
    }
    if (s.map.size() >= per_shard_cap_) evicted = evict_one(s);

    s.lru.push_front(id);
    Entry e;
    e.state.source = id;
    e.state.last_seen_ns = now_ns;
    e.state.last_transition_ns = now_ns;
    e.lru = s.lru.begin();
    return s.map.emplace(id, std::move(e)).first->second;
}

SourceState StateStore::get_or_init(const SourceId& id, uint64_t now_ns) {
    Shard& s = shard_for(id);
    std::optional<SourceId> evicted;
    SourceState out;
    {
        std::lock_guard<std::mutex> lk(s.mtx);
        out = locate_or_insert(s, id, now_ns, evicted).state;
    }
    notify_evicted(evicted);
    return out;
}

SourceState StateStore::update(const SourceId& id, uint64_t now_ns, const Mutator& fn) {
    Shard& s = shard_for(id);
    std::optional<SourceId> evicted;
    SourceState out;
    {
        std::lock_guard<std::mutex> lk(s.mtx);
        Entry& e = locate_or_insert(s, id, now_ns, evicted);
        fn(e.state);
        out = e.state;
    }
    notify_evicted(evicted);
    return out;
}

std::optional<SourceState> StateStore::compare_and_transition(const SourceId& id,
                                                              uint64_t expected_generation,
                                                              const Mutator& fn) {
    Shard& s = shard_for(id);
    std::lock_guard<std::mutex> lk(s.mtx);
    auto it = s.map.find(id);
    if (it == s.map.end()) return std::nullopt;
    if (expected_generation != kAnyGeneration &&
        it->second.state.generation != expected_generation) {
        return std::nullopt;
    }
    fn(it->second.state);
    return it->second.state;
}

std::optional<SourceState> StateStore::find(const SourceId& id) const {
    const Shard& s = shard_for(id);
    std::lock_guard<std::mutex> lk(s.mtx);
    auto it = s.map.find(id);
    if (it == s.map.end()) return std::nullopt;
    return it->second.state;
}

std::vector<SourceId> StateStore::evict_idle(uint64_t before_ns) {
    std::vector<SourceId> evicted;
    for (auto& sp : shards_) {
        Shard& s = *sp;
        std::lock_guard<std::mutex> lk(s.mtx);
        for (auto it = s.map.begin(); it != s.map.end();) {
            const SourceState& st = it->second.state;
            if (st.state != MitigationState::BLOCKED && st.last_seen_ns < before_ns) {
                evicted.push_back(it->first);
                s.lru.erase(it->second.lru);
                it = s.map.erase(it);
            } else {
                ++it;
            }
        }
    }
    if (!evicted.empty()) metrics_.inc_idle_eviction(evicted.size());
    return evicted;
}

size_t StateStore::size() const {
    size_t n = 0;
    for (const auto& sp : shards_) {
        std::lock_guard<std::mutex> lk(sp->mtx);
        n += sp->map.size();
    }
    return n;
}

std::vector<SourceState> StateStore::snapshot_blocked() const {
    std::vector<SourceState> out;
    for (const auto& sp : shards_) {
        std::lock_guard<std::mutex> lk(sp->mtx);
        for (const auto& kv : sp->map) {
            if (kv.second.state.state == MitigationState::BLOCKED) {
                out.push_back(kv.second.state);
            }
        }
    }
    return out;
}

} // namespace shieldcore
