#pragma once

#include "shieldcore/core/Events.hpp"

#include <deque>
#include <mutex>
#include <vector>

namespace shieldcore {

// The most recent alerts across all sources, oldest dropped first.
class AlertHistory {
public:
    explicit AlertHistory(size_t capacity);

    void record(const AlertEvent& a);

    // Newest first, at most `limit` (0 = all retained).
    std::vector<AlertEvent> recent(size_t limit = 0) const;

    size_t size() const;

private:
    const size_t capacity_;
    mutable std::mutex mtx_;
    std::deque<AlertEvent> alerts_;     // back = newest
};

} // namespace shieldcore
