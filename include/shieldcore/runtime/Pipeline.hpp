#pragma once

#include "shieldcore/config/EngineConfig.hpp"
#include "shieldcore/core/BoundedQueue.hpp"
#include "shieldcore/dispatch/EventDispatcher.hpp"
#include "shieldcore/explain/Explainer.hpp"
#include "shieldcore/features/FeatureAggregator.hpp"
#include "shieldcore/metrics/MetricsRegistry.hpp"
#include "shieldcore/mitigation/MitigationStateMachine.hpp"
#include "shieldcore/mitigation/TimerService.hpp"
#include "shieldcore/models/ModelRegistry.hpp"
#include "shieldcore/query/QueryService.hpp"
#include "shieldcore/query/VerdictHistory.hpp"
#include "shieldcore/scoring/EnsembleScorer.hpp"
#include "shieldcore/state/StateStore.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <optional>
#include <thread>

namespace shieldcore {

enum class IngestResult : uint8_t {
    ACCEPTED  = 0,
    BUSY      = 1,
    MALFORMED = 2
};

const char* to_string(IngestResult r);

// ingest -> aggregate -> score (+explain) -> decide -> dispatch
//
// One thread per stage, bounded queues in between. submit() never blocks:
// a full ingest queue sheds the event as BUSY. Later stages apply
// backpressure. Block/probation timers and idle eviction run on an
// io_context thread.
class Pipeline {
public:
    Pipeline(const EngineConfig& cfg, ModelRegistry models,
             MetricsRegistry& metrics = shieldcore::metrics());
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Register sinks here before start().
    EventDispatcher& dispatcher() { return dispatcher_; }

    void start();

    // Closes every open window, drains all stages, joins the threads.
    void stop();

    bool running() const { return running_.load(); }

    IngestResult submit(const FlowEvent& ev);

    // Closes windows ending at or before now_ns and queues them for
    // scoring. Returns how many were queued.
    size_t flush(uint64_t now_ns);

    MitigationOutcome manual_block(const SourceId& id, uint64_t duration_ms,
                                   const std::string& reason);
    MitigationOutcome manual_unblock(const SourceId& id);

    const QueryService& query() const { return query_; }
    const EngineConfig& config() const { return cfg_; }

private:
    void aggregate_loop();
    void score_loop();
    void decide_loop();
    void arm_housekeeping();
    void emit(const MitigationOutcome& out);

    EngineConfig cfg_;
    MetricsRegistry& metrics_;
    ModelRegistry models_;

    FeatureAggregator aggregator_;
    EnsembleScorer scorer_;
    Explainer explainer_;
    StateStore store_;

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    boost::asio::steady_timer housekeeping_;
    AsioTimerService timers_;

    MitigationStateMachine machine_;
    EventDispatcher dispatcher_;
    VerdictHistory history_;
    AlertHistory alerts_;
    QueryService query_;

    BoundedQueue<FlowEvent> ingest_q_;
    BoundedQueue<FeatureVectorPtr> vector_q_;
    BoundedQueue<FusedVerdict> verdict_q_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::thread io_thread_;
    std::thread aggregate_thread_;
    std::thread score_thread_;
    std::thread decide_thread_;
};

} // namespace shieldcore
