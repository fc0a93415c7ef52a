#pragma once

#include "shieldcore/models/ModelRegistry.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace shieldcore {

// Runs model calls on a thread pool with at most one call in flight per
// registered model. A model that is still busy with an earlier call is
// refused rather than queued, so a hung model occupies one pool thread and
// never starves the others. The pool has at least one thread per model.
//
// On destruction, calls that are still running are left to finish on a
// detached reaper; nothing they touch is owned by the executor.
class ModelExecutor {
public:
    ModelExecutor(const ModelRegistry& models, size_t threads);
    ~ModelExecutor();

    ModelExecutor(const ModelExecutor&) = delete;
    ModelExecutor& operator=(const ModelExecutor&) = delete;

    // Posts fn(model) for the model at `index` in the registry. Empty when
    // that model still has a call in flight. Exceptions thrown by fn are
    // delivered through the future.
    template<typename Fn>
    auto submit(size_t index, Fn fn) const
        -> std::optional<std::future<decltype(fn(std::declval<const ScoringModel&>()))>>;

    bool busy(size_t index) const { return lanes_[index]->busy.load(std::memory_order_acquire); }
    size_t in_flight() const;

private:
    struct Lane {
        std::shared_ptr<const ScoringModel> model;
        std::atomic<bool> busy{false};
    };

    // Clears the lane before the task's result becomes visible, so the
    // next submit after a ready future never sees a stale busy flag.
    struct Release {
        explicit Release(std::shared_ptr<Lane> l) : lane(std::move(l)) {}
        ~Release() { lane->busy.store(false, std::memory_order_release); }
        std::shared_ptr<Lane> lane;
    };

    std::vector<std::shared_ptr<Lane>> lanes_;
    std::shared_ptr<boost::asio::thread_pool> pool_;
};

template<typename Fn>
auto ModelExecutor::submit(size_t index, Fn fn) const
    -> std::optional<std::future<decltype(fn(std::declval<const ScoringModel&>()))>> {
    using Result = decltype(fn(std::declval<const ScoringModel&>()));

    std::shared_ptr<Lane> lane = lanes_[index];
    bool idle = false;
    if (!lane->busy.compare_exchange_strong(idle, true, std::memory_order_acq_rel)) {
        return std::nullopt;
    }

    auto task = std::make_shared<std::packaged_task<Result()>>(
        [lane, fn = std::move(fn)]() mutable -> Result {
            Release release(lane);
            return fn(*lane->model);
        });
    std::future<Result> fut = task->get_future();
    boost::asio::post(*pool_, [task]() { (*task)(); });
    return fut;
}

} // namespace shieldcore
