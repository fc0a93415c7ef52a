#pragma once

#include "shieldcore/core/Events.hpp"
#include "shieldcore/metrics/MetricsRegistry.hpp"

#include <functional>
#include <limits>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace shieldcore {

// Sharded SourceId -> SourceState map. Every mutation happens under the
// owning shard's mutex, so updates to one identity are serialized while
// different identities rarely contend.
class StateStore {
public:
    static constexpr uint64_t kAnyGeneration = std::numeric_limits<uint64_t>::max();

    using Mutator = std::function<void(SourceState&)>;
    using EvictionListener = std::function<void(const SourceId&)>;

    StateStore(size_t max_tracked, size_t shards,
               MetricsRegistry& metrics = shieldcore::metrics());

    // Called with each identity dropped to make room for a new one, after
    // the shard lock is released. Set before the store is shared.
    void set_eviction_listener(EvictionListener fn) { on_evict_ = std::move(fn); }

    // Returns the current state, inserting an Observing entry if unseen.
    SourceState get_or_init(const SourceId& id, uint64_t now_ns);

    // get_or_init followed by fn, atomically. Returns the state after fn.
    SourceState update(const SourceId& id, uint64_t now_ns, const Mutator& fn);

    // Applies fn only when the entry exists and its generation matches
    // (kAnyGeneration matches any). Returns the state after fn, or empty.
    std::optional<SourceState> compare_and_transition(const SourceId& id,
                                                      uint64_t expected_generation,
                                                      const Mutator& fn);

    std::optional<SourceState> find(const SourceId& id) const;

    // Removes entries last seen before `before_ns`. Blocked entries stay.
    std::vector<SourceId> evict_idle(uint64_t before_ns);

    size_t size() const;
    std::vector<SourceState> snapshot_blocked() const;

    size_t shard_count() const { return shards_.size(); }
    size_t shard_capacity() const { return per_shard_cap_; }

private:
    struct Entry {
        SourceState state;
        std::list<SourceId>::iterator lru;
    };

    struct Shard {
        mutable std::mutex mtx;
        std::unordered_map<SourceId, Entry> map;
        std::list<SourceId> lru;    // front = most recently touched
    };

    Shard& shard_for(const SourceId& id);
    const Shard& shard_for(const SourceId& id) const;

    // Caller holds s.mtx.
    Entry& locate_or_insert(Shard& s, const SourceId& id, uint64_t now_ns,
                            std::optional<SourceId>& evicted);
    std::optional<SourceId> evict_one(Shard& s);
    void notify_evicted(const std::optional<SourceId>& id) const;

    std::vector<std::unique_ptr<Shard>> shards_;
    size_t mask_;
    size_t per_shard_cap_;
    EvictionListener on_evict_;
    MetricsRegistry& metrics_;
};

} // namespace shieldcore
