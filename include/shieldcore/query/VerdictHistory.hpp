#pragma once

#include "shieldcore/core/Events.hpp"

#include <deque>
#include <list>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace shieldcore {

// Most recent verdicts per source. Bounded in depth per source and in the
// number of sources (least recently updated source goes first).
class VerdictHistory {
public:
    VerdictHistory(size_t per_source, size_t max_sources);

    void record(const FusedVerdict& v);

    // Newest first, at most `limit` (0 = all retained).
    std::vector<FusedVerdict> recent(const SourceId& id, size_t limit = 0) const;

    size_t sources() const;

private:
    struct Slot {
        std::deque<FusedVerdict> verdicts;      // back = newest
        std::list<SourceId>::iterator lru;
    };

    const size_t per_source_;
    const size_t max_sources_;
    mutable std::mutex mtx_;
    std::list<SourceId> lru_;
    std::unordered_map<SourceId, Slot> slots_;
};

} // namespace shieldcore
