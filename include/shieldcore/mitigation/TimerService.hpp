#pragma once

#include "shieldcore/core/Types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace shieldcore {

enum class TimerKind : uint8_t {
    BLOCK_EXPIRY     = 0,
    PROBATION_EXPIRY = 1
};

const char* to_string(TimerKind k);

// At most one pending timer per SourceId. A timer carries the state
// generation it was armed for; older generations never replace or cancel
// newer ones.
class TimerService {
public:
    using Handler = std::function<void(const SourceId& id, uint64_t generation,
                                       TimerKind kind, uint64_t now_ns)>;

    virtual ~TimerService() = default;

    virtual void set_handler(Handler h) = 0;

    // due_ns is on the infra::now_ns() axis.
    virtual void schedule(const SourceId& id, uint64_t generation, TimerKind kind,
                          uint64_t due_ns) = 0;

    // Idempotent. Cancels the pending timer if it was armed at or before
    // `generation`.
    virtual void cancel(const SourceId& id, uint64_t generation) = 0;

    virtual size_t pending() const = 0;
};

// steady_timer per SourceId on a caller-owned io_context.
class AsioTimerService : public TimerService {
public:
    explicit AsioTimerService(boost::asio::io_context& io);
    ~AsioTimerService() override;

    void set_handler(Handler h) override;
    void schedule(const SourceId& id, uint64_t generation, TimerKind kind,
                  uint64_t due_ns) override;
    void cancel(const SourceId& id, uint64_t generation) override;
    size_t pending() const override;

    void cancel_all();

private:
    struct Armed {
        uint64_t generation;
        TimerKind kind;
        std::shared_ptr<boost::asio::steady_timer> timer;
    };

    void fire(const SourceId& id, uint64_t generation, TimerKind kind);

    boost::asio::io_context& io_;
    mutable std::mutex mtx_;
    std::unordered_map<SourceId, Armed> armed_;
    Handler handler_;
};

} // namespace shieldcore
