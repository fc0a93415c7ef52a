#pragma once

#include "shieldcore/config/EngineConfig.hpp"
#include "shieldcore/core/BoundedQueue.hpp"
#include "shieldcore/dispatch/EventSink.hpp"
#include "shieldcore/metrics/MetricsRegistry.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace shieldcore {

struct UndeliveredRecord {
    std::string sink;
    std::string event;                  // describe() form
    SourceId    source;
    uint32_t    attempts = 0;
    std::string error;
    uint64_t    ts_ns = 0;
};

// Fans actions and alerts out to sinks. Actions reach every sink
// subscribed to actions; alerts reach every sink subscribed to alerts whose
// min_severity the alert meets. A failing sink is retried with exponential
// backoff, then recorded as undelivered.
//
// Every sink has its own bounded queue and worker, so a slow or dead sink
// only ever delays itself and each sink sees events in dispatch order.
// Actions wait for room in a full sink queue; alerts do not, they are
// recorded as undelivered instead.
class EventDispatcher {
public:
    EventDispatcher(const DispatchConfig& cfg, size_t queue_capacity,
                    MetricsRegistry& metrics = shieldcore::metrics());
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // Sinks must be added before start().
    void add_sink(std::shared_ptr<EventSink> sink, SinkStream stream = SinkStream::BOTH,
                  Severity min_severity = Severity::LOW);

    void start();
    // Drains every sink queue, then joins the workers.
    void stop();

    // Enqueues for each interested sink. Blocks while an action's sink
    // queue is full. Returns false once stopped.
    bool dispatch(DispatchEvent ev);

    // Delivers on the calling thread, retries included.
    void deliver(const DispatchEvent& ev);

    std::vector<UndeliveredRecord> undelivered() const;
    size_t queued() const;
    size_t sink_count() const { return routes_.size(); }

private:
    struct Route {
        std::shared_ptr<EventSink> sink;
        SinkStream stream;
        Severity min_severity;
        std::unique_ptr<BoundedQueue<DispatchEvent>> queue;
        std::thread worker;
    };

    bool wants(const Route& r, const DispatchEvent& ev) const;
    void deliver_to(const Route& r, const DispatchEvent& ev);
    void mark_undelivered(const Route& r, const DispatchEvent& ev, uint32_t attempts,
                          const std::string& error);
    void record_undelivered(UndeliveredRecord rec);
    void run(Route& r);

    DispatchConfig cfg_;
    size_t queue_capacity_;
    std::vector<Route> routes_;
    std::atomic<bool> stopped_{false};

    mutable std::mutex und_mtx_;
    std::deque<UndeliveredRecord> undelivered_;

    std::atomic<bool> running_{false};
    MetricsRegistry& metrics_;
};

} // namespace shieldcore
