#include "shieldcore/mitigation/TimerService.hpp"
#include "shieldcore/core/Clock.hpp"

#include <chrono>

namespace shieldcore {

const char* to_string(TimerKind k) {
    switch (k) {
        case TimerKind::BLOCK_EXPIRY:     return "block_expiry";
        case TimerKind::PROBATION_EXPIRY: return "probation_expiry";
    }
    return "unknown";
}

AsioTimerService::AsioTimerService(boost::asio::io_context& io) : io_(io) {}

AsioTimerService::~AsioTimerService() {
    cancel_all();
}

void AsioTimerService::set_handler(Handler h) {
    std::lock_guard<std::mutex> lk(mtx_);
    handler_ = std::move(h);
}

void AsioTimerService::schedule(const SourceId& id, uint64_t generation, TimerKind kind,
                                uint64_t due_ns) {
    const uint64_t now = infra::now_ns();
    const auto delay = std::chrono::nanoseconds(due_ns > now ? due_ns - now : 0);

    auto timer = std::make_shared<boost::asio::steady_timer>(io_);
    timer->expires_after(delay);

    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = armed_.find(id);
        if (it != armed_.end()) {
            if (it->second.generation > generation) return;
            it->second.timer->cancel();
            armed_.erase(it);
        }
        armed_.emplace(id, Armed{generation, kind, timer});
    }

    timer->async_wait([this, id, generation, kind](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        fire(id, generation, kind);
    });
}

void AsioTimerService::fire(const SourceId& id, uint64_t generation, TimerKind kind) {
    Handler h;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = armed_.find(id);
        if (it != armed_.end() && it->second.generation == generation) {
            armed_.erase(it);
        }
        h = handler_;
    }
    if (h) h(id, generation, kind, infra::now_ns());
}

void AsioTimerService::cancel(const SourceId& id, uint64_t generation) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = armed_.find(id);
    if (it == armed_.end() || it->second.generation > generation) return;
    it->second.timer->cancel();
    armed_.erase(it);
}

void AsioTimerService::cancel_all() {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& kv : armed_) kv.second.timer->cancel();
    armed_.clear();
}

size_t AsioTimerService::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return armed_.size();
}

} // namespace shieldcore
