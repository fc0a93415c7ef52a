#include "shieldcore/runtime/Pipeline.hpp"
#include "shieldcore/core/Clock.hpp"
#include "shieldcore/core/Errors.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>

namespace shieldcore {

const char* to_string(IngestResult r) {
    switch (r) {
        case IngestResult::ACCEPTED:  return "accepted";
        case IngestResult::BUSY:      return "busy";
        case IngestResult::MALFORMED: return "malformed";
    }
    return "unknown";
}

Pipeline::Pipeline(const EngineConfig& cfg, ModelRegistry models, MetricsRegistry& metrics)
    : cfg_(cfg),
      metrics_(metrics),
      models_(std::move(models)),
      aggregator_(cfg_.aggregator, metrics_),
      scorer_(models_, cfg_.scoring, metrics_),
      explainer_(models_, cfg_.explain, cfg_.mitigation.suspicious_threshold, metrics_),
      store_(cfg_.mitigation.max_tracked_identities, cfg_.mitigation.shards, metrics_),
      housekeeping_(io_),
      timers_(io_),
      machine_(cfg_.mitigation, store_, &timers_, metrics_),
      dispatcher_(cfg_.dispatch, cfg_.pipeline.dispatch_queue, metrics_),
      history_(cfg_.pipeline.history_per_source, cfg_.pipeline.history_sources),
      alerts_(cfg_.pipeline.alert_history),
      query_(store_, history_, alerts_, dispatcher_, metrics_),
      ingest_q_(cfg_.pipeline.ingest_queue),
      vector_q_(cfg_.pipeline.vector_queue),
      verdict_q_(cfg_.pipeline.verdict_queue) {
    if (models_.empty()) throw ConfigError("pipeline needs at least one model");

    timers_.set_handler([this](const SourceId& id, uint64_t gen, TimerKind kind, uint64_t now) {
        emit(machine_.on_timer(id, gen, kind, now));
    });
}

Pipeline::~Pipeline() {
    stop();
}

void Pipeline::start() {
    if (running_.exchange(true)) return;

    dispatcher_.start();

    work_.emplace(boost::asio::make_work_guard(io_));
    arm_housekeeping();
    io_thread_ = std::thread([this] { io_.run(); });

    decide_thread_ = std::thread(&Pipeline::decide_loop, this);
    score_thread_ = std::thread(&Pipeline::score_loop, this);
    aggregate_thread_ = std::thread(&Pipeline::aggregate_loop, this);

    std::cout << "[PIPELINE] started: " << models_.size() << " models, window "
              << cfg_.aggregator.window_ms << "ms, block >= "
              << cfg_.mitigation.block_threshold << " x" << cfg_.mitigation.block_consecutive
              << "\n";
}

void Pipeline::stop() {
    if (!running_.load() || stopped_.exchange(true)) return;

    ingest_q_.close();
    if (aggregate_thread_.joinable()) aggregate_thread_.join();

    flush(std::numeric_limits<uint64_t>::max());
    vector_q_.close();
    if (score_thread_.joinable()) score_thread_.join();

    verdict_q_.close();
    if (decide_thread_.joinable()) decide_thread_.join();

    housekeeping_.cancel();
    timers_.cancel_all();
    work_.reset();
    io_.stop();
    if (io_thread_.joinable()) io_thread_.join();

    dispatcher_.stop();
    running_ = false;

    const auto m = metrics_.snapshot();
    std::cout << "[PIPELINE] stopped: accepted=" << m.events_accepted
              << " busy=" << m.events_busy << " malformed=" << m.events_malformed
              << " verdicts=" << m.verdicts << " blocks=" << m.blocks << "\n";
}

IngestResult Pipeline::submit(const FlowEvent& ev) {
    try {
        FeatureAggregator::validate(ev);
    } catch (const MalformedEventError&) {
        metrics_.inc_event_malformed();
        return IngestResult::MALFORMED;
    }
    if (!ingest_q_.try_push(ev)) {
        metrics_.inc_event_busy();
        return IngestResult::BUSY;
    }
    metrics_.inc_event_accepted();
    return IngestResult::ACCEPTED;
}

size_t Pipeline::flush(uint64_t now_ns) {
    auto vectors = aggregator_.flush_due(now_ns);
    size_t n = 0;
    for (auto& v : vectors) {
        if (vector_q_.push(std::make_shared<const FeatureVector>(std::move(v)))) ++n;
    }
    return n;
}

void Pipeline::aggregate_loop() {
    const auto interval = std::chrono::milliseconds(cfg_.pipeline.housekeeping_ms);
    // A feed that has gone quiet for this long closes all of its open windows.
    const auto quiet = std::chrono::milliseconds(
        std::max(cfg_.aggregator.allowed_lateness_ms, cfg_.aggregator.window_ms));
    auto last_flush = std::chrono::steady_clock::now();
    auto last_event = last_flush;
    FlowEvent ev;

    for (;;) {
        if (ingest_q_.pop_for(ev, interval)) {
            try {
                aggregator_.ingest(ev);
            } catch (const MalformedEventError& e) {
                metrics_.inc_event_malformed();
                std::cerr << "[AGG] dropped event: " << e.what() << "\n";
            }
            last_event = std::chrono::steady_clock::now();
        } else if (ingest_q_.closed()) {
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now - last_flush >= interval) {
            uint64_t cutoff = aggregator_.event_time_cutoff();
            const uint64_t newest = aggregator_.watermark();
            if (newest != 0 && now - last_event >= quiet) {
                cutoff = newest + aggregator_.window_ns();
            }
            if (cutoff != 0) flush(cutoff);
            last_flush = now;
        }
    }
}

void Pipeline::score_loop() {
    FeatureVectorPtr v;
    while (vector_q_.pop(v)) {
        FusedVerdict verdict = scorer_.score(v);
        if (cfg_.explain.enabled && verdict.score >= cfg_.mitigation.suspicious_threshold) {
            verdict.explanation = std::make_shared<const Explanation>(explainer_.explain(verdict));
        }
        verdict_q_.push(std::move(verdict));
    }
}

void Pipeline::decide_loop() {
    FusedVerdict v;
    while (verdict_q_.pop(v)) {
        history_.record(v);
        emit(machine_.on_verdict(v));
    }
}

void Pipeline::arm_housekeeping() {
    housekeeping_.expires_after(std::chrono::milliseconds(cfg_.pipeline.housekeeping_ms));
    housekeeping_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) return;
        // last_seen is on the event-time axis, so idle age is measured there too
        const uint64_t newest = aggregator_.watermark();
        if (newest != 0) machine_.evict_idle(newest);
        arm_housekeeping();
    });
}

void Pipeline::emit(const MitigationOutcome& out) {
    auto send = [this](DispatchEvent ev) {
        const std::string what = describe(ev);
        if (!dispatcher_.dispatch(std::move(ev))) {
            std::cerr << "[PIPELINE] dispatcher stopped, dropped " << what << "\n";
        }
    };
    for (const auto& a : out.actions) send(a);
    for (const auto& a : out.alerts) {
        alerts_.record(a);
        send(a);
    }
}

MitigationOutcome Pipeline::manual_block(const SourceId& id, uint64_t duration_ms,
                                         const std::string& reason) {
    auto out = machine_.manual_block(id, duration_ms, reason, infra::now_ns());
    emit(out);
    return out;
}

MitigationOutcome Pipeline::manual_unblock(const SourceId& id) {
    auto out = machine_.manual_unblock(id, infra::now_ns());
    emit(out);
    return out;
}

} // namespace shieldcore
