#include "shieldcore/dispatch/EventDispatcher.hpp"
#include "shieldcore/core/Clock.hpp"
#include "shieldcore/core/Errors.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>

namespace shieldcore {

EventDispatcher::EventDispatcher(const DispatchConfig& cfg, size_t queue_capacity,
                                 MetricsRegistry& metrics)
    : cfg_(cfg), queue_capacity_(queue_capacity), metrics_(metrics) {}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::add_sink(std::shared_ptr<EventSink> sink, SinkStream stream,
                               Severity min_severity) {
    if (!sink) throw ConfigError("null sink");
    if (running_.load()) throw ConfigError("sink " + sink->id() + " added after start");
    std::cout << "[DISPATCH] sink " << sink->id() << " stream="
              << (stream == SinkStream::ACTIONS ? "actions"
                  : stream == SinkStream::ALERTS ? "alerts" : "both")
              << " min_severity=" << to_string(min_severity) << "\n";
    Route r;
    r.sink = std::move(sink);
    r.stream = stream;
    r.min_severity = min_severity;
    r.queue = std::make_unique<BoundedQueue<DispatchEvent>>(queue_capacity_);
    routes_.push_back(std::move(r));
}

void EventDispatcher::start() {
    if (running_.exchange(true)) return;
    for (auto& r : routes_) {
        r.worker = std::thread(&EventDispatcher::run, this, std::ref(r));
    }
}

void EventDispatcher::stop() {
    stopped_ = true;
    for (auto& r : routes_) r.queue->close();
    for (auto& r : routes_) {
        if (r.worker.joinable()) r.worker.join();
    }
    running_ = false;
}

bool EventDispatcher::dispatch(DispatchEvent ev) {
    if (stopped_.load()) return false;
    const bool is_action = std::holds_alternative<MitigationAction>(ev);
    for (auto& r : routes_) {
        if (!wants(r, ev)) continue;
        if (is_action) {
            if (!r.queue->push(ev)) return false;
        } else if (!r.queue->try_push(ev)) {
            if (r.queue->closed()) return false;
            std::cerr << "[DISPATCH] " << r.sink->id() << " queue full, dropped "
                      << describe(ev) << "\n";
            mark_undelivered(r, ev, 0, "sink queue full");
        }
    }
    return true;
}

size_t EventDispatcher::queued() const {
    size_t n = 0;
    for (const auto& r : routes_) n += r.queue->size();
    return n;
}

void EventDispatcher::run(Route& r) {
    DispatchEvent ev;
    while (r.queue->pop(ev)) {
        deliver_to(r, ev);
    }
}

bool EventDispatcher::wants(const Route& r, const DispatchEvent& ev) const {
    if (std::holds_alternative<MitigationAction>(ev)) {
        return r.stream != SinkStream::ALERTS;
    }
    if (r.stream == SinkStream::ACTIONS) return false;
    const auto& al = std::get<AlertEvent>(ev);
    return static_cast<uint8_t>(al.severity) >= static_cast<uint8_t>(r.min_severity);
}

void EventDispatcher::deliver(const DispatchEvent& ev) {
    for (const auto& r : routes_) {
        if (wants(r, ev)) deliver_to(r, ev);
    }
}

void EventDispatcher::deliver_to(const Route& r, const DispatchEvent& ev) {
    uint64_t backoff_ms = cfg_.backoff_initial_ms;
    std::string last_error;

    for (uint32_t attempt = 1; attempt <= cfg_.max_attempts; ++attempt) {
        try {
            std::visit([&](const auto& e) { r.sink->deliver(e); }, ev);
            metrics_.inc_dispatch_delivered();
            return;
        } catch (const std::exception& e) {
            last_error = e.what();
        }

        if (attempt == cfg_.max_attempts) break;

        metrics_.inc_dispatch_retry();
        std::cerr << "[DISPATCH] " << r.sink->id() << " failed " << describe(ev)
                  << " (attempt " << attempt << "/" << cfg_.max_attempts << "): "
                  << last_error << ", retry in " << backoff_ms << "ms\n";
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        backoff_ms = std::min(backoff_ms * 2, cfg_.backoff_max_ms);
    }

    std::cerr << "[DISPATCH] UNDELIVERED " << describe(ev) << " to " << r.sink->id()
              << " after " << cfg_.max_attempts << " attempts: " << last_error << "\n";
    mark_undelivered(r, ev, cfg_.max_attempts, last_error);
}

void EventDispatcher::mark_undelivered(const Route& r, const DispatchEvent& ev, uint32_t attempts,
                                       const std::string& error) {
    metrics_.inc_dispatch_undelivered();

    UndeliveredRecord rec;
    rec.sink = r.sink->id();
    rec.event = describe(ev);
    rec.source = std::visit([](const auto& e) { return e.source; }, ev);
    rec.attempts = attempts;
    rec.error = error;
    rec.ts_ns = infra::now_ns();
    record_undelivered(std::move(rec));
}

void EventDispatcher::record_undelivered(UndeliveredRecord rec) {
    std::lock_guard<std::mutex> lk(und_mtx_);
    if (undelivered_.size() >= cfg_.undelivered_capacity) undelivered_.pop_front();
    undelivered_.push_back(std::move(rec));
}

std::vector<UndeliveredRecord> EventDispatcher::undelivered() const {
    std::lock_guard<std::mutex> lk(und_mtx_);
    return std::vector<UndeliveredRecord>(undelivered_.begin(), undelivered_.end());
}

} // namespace shieldcore
