#include "shieldcore/query/AlertHistory.hpp"

namespace shieldcore {

AlertHistory::AlertHistory(size_t capacity) : capacity_(capacity ? capacity : 1) {}

void AlertHistory::record(const AlertEvent& a) {
    std::lock_guard<std::mutex> lk(mtx_);
    alerts_.push_back(a);
    while (alerts_.size() > capacity_) alerts_.pop_front();
}

std::vector<AlertEvent> AlertHistory::recent(size_t limit) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<AlertEvent> out;
    for (auto r = alerts_.rbegin(); r != alerts_.rend(); ++r) {
        if (limit && out.size() >= limit) break;
        out.push_back(*r);
    }
    return out;
}

size_t AlertHistory::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return alerts_.size();
}

} // namespace shieldcore
