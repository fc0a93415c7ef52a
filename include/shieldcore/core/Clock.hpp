#pragma once

#include <chrono>
#include <cstdint>

namespace shieldcore::infra {

using MonoClock = std::chrono::steady_clock;
using MonoTime  = MonoClock::time_point;

// All pipeline timestamps are nanoseconds. Flow events carry their own
// capture time; timers and housekeeping use the wall clock below so both
// live on the same axis.
inline uint64_t now_ns() noexcept {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

inline uint64_t mono_ns() noexcept {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            MonoClock::now().time_since_epoch()
        ).count()
    );
}

constexpr uint64_t ms_to_ns(uint64_t ms) noexcept { return ms * 1000000ULL; }
constexpr uint64_t ns_to_ms(uint64_t ns) noexcept { return ns / 1000000ULL; }
constexpr uint64_t sec_to_ns(uint64_t s) noexcept { return s * 1000000000ULL; }

} // namespace shieldcore::infra
