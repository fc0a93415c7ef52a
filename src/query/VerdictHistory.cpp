#include "shieldcore/query/VerdictHistory.hpp"

namespace shieldcore {

VerdictHistory::VerdictHistory(size_t per_source, size_t max_sources)
    : per_source_(per_source ? per_source : 1), max_sources_(max_sources ? max_sources : 1) {}

void VerdictHistory::record(const FusedVerdict& v) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = slots_.find(v.source);
    if (it == slots_.end()) {
        if (slots_.size() >= max_sources_) {
            slots_.erase(lru_.back());
            lru_.pop_back();
        }
        lru_.push_front(v.source);
        Slot s;
        s.lru = lru_.begin();
        it = slots_.emplace(v.source, std::move(s)).first;
    } else {
        lru_.splice(lru_.begin(), lru_, it->second.lru);
    }

    auto& q = it->second.verdicts;
    q.push_back(v);
    while (q.size() > per_source_) q.pop_front();
}

std::vector<FusedVerdict> VerdictHistory::recent(const SourceId& id, size_t limit) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<FusedVerdict> out;
    auto it = slots_.find(id);
    if (it == slots_.end()) return out;
    const auto& q = it->second.verdicts;
    for (auto r = q.rbegin(); r != q.rend(); ++r) {
        if (limit && out.size() >= limit) break;
        out.push_back(*r);
    }
    return out;
}

size_t VerdictHistory::sources() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return slots_.size();
}

} // namespace shieldcore
