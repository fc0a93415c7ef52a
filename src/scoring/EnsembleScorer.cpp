#include "shieldcore/scoring/EnsembleScorer.hpp"

#include <future>
#include <iostream>

namespace shieldcore {

static constexpr double kNeutral = 0.5;

EnsembleScorer::EnsembleScorer(const ModelRegistry& models, const ScoringConfig& cfg,
                               MetricsRegistry& metrics)
    : models_(models),
      fallback_decay_(cfg.fallback_decay),
      last_known_capacity_(cfg.last_known_capacity),
      executor_(models, cfg.pool_threads),
      metrics_(metrics) {}

EnsembleScorer::~EnsembleScorer() = default;

FusedVerdict EnsembleScorer::score(const FeatureVector& v) {
    return score(std::make_shared<const FeatureVector>(v));
}

FusedVerdict EnsembleScorer::score(FeatureVectorPtr v) {
    const auto& regs = models_.models();
    const auto start = std::chrono::steady_clock::now();

    std::vector<std::optional<std::future<ModelScore>>> futures;
    futures.reserve(regs.size());

    for (size_t i = 0; i < regs.size(); ++i) {
        const Deadline deadline = start + regs[i].timeout;
        futures.push_back(executor_.submit(i, [v, deadline](const ScoringModel& model) {
            return model.score(*v, deadline);
        }));
    }

    FusedVerdict out;
    out.id = next_id_.fetch_add(1, std::memory_order_relaxed);
    out.source = v->source;
    out.ts_ns = v->window_end_ns;
    out.vector = v;
    out.scores.reserve(regs.size());

    for (size_t i = 0; i < regs.size(); ++i) {
        const Deadline deadline = start + regs[i].timeout;
        ModelScore s;
        if (!futures[i]) {
            s.model_id = regs[i].model->id();
            s.status = ModelStatus::TIMEOUT;
            s.detail = "previous call still running";
        } else if (futures[i]->wait_until(deadline) == std::future_status::ready) {
            s = futures[i]->get();
        } else {
            s.model_id = regs[i].model->id();
            s.status = ModelStatus::TIMEOUT;
            s.detail = "no response within " + std::to_string(regs[i].timeout.count()) + "ms";
            s.latency_ns = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(regs[i].timeout).count());
        }

        if (s.status == ModelStatus::TIMEOUT) {
            metrics_.inc_model_timeout();
        } else if (s.status == ModelStatus::ERROR) {
            metrics_.inc_model_error();
            std::cerr << "[SCORER] model " << s.model_id << " failed for "
                      << v->source.str() << ": " << s.detail << "\n";
        }
        if (s.failed()) out.degraded = true;
        out.scores.push_back(std::move(s));
    }

    auto fused = fuse(out.scores, regs);
    if (fused) {
        out.score = *fused;
        remember(v->source, out.score);
    } else {
        out.fallback = true;
        out.score = fallback_for(v->source);
        std::cerr << "[SCORER] no model responded for " << v->source.str()
                  << ", fallback score " << out.score << "\n";
    }

    metrics_.inc_verdict(out.degraded, out.fallback);
    return out;
}

std::optional<double> EnsembleScorer::fuse(const std::vector<ModelScore>& scores,
                                           const std::vector<RegisteredModel>& models) {
    double num = 0.0;
    double den = 0.0;
    for (const auto& s : scores) {
        if (s.failed()) continue;
        for (const auto& r : models) {
            if (r.model->id() == s.model_id) {
                num += r.weight * s.score;
                den += r.weight;
                break;
            }
        }
    }
    if (den <= 0.0) return std::nullopt;
    double f = num / den;
    if (f < 0.0) f = 0.0;
    if (f > 1.0) f = 1.0;
    return f;
}

double EnsembleScorer::fallback_for(const SourceId& id) {
    double next = kNeutral;
    {
        std::lock_guard<std::mutex> lk(lk_mtx_);
        auto it = last_known_.find(id);
        if (it != last_known_.end()) {
            next = kNeutral + (it->second.score - kNeutral) * fallback_decay_;
        }
    }
    remember(id, next);
    return next;
}

void EnsembleScorer::remember(const SourceId& id, double score) {
    std::lock_guard<std::mutex> lk(lk_mtx_);
    auto it = last_known_.find(id);
    if (it != last_known_.end()) {
        it->second.score = score;
        lk_lru_.splice(lk_lru_.begin(), lk_lru_, it->second.lru);
        return;
    }
    if (last_known_.size() >= last_known_capacity_ && !lk_lru_.empty()) {
        last_known_.erase(lk_lru_.back());
        lk_lru_.pop_back();
    }
    lk_lru_.push_front(id);
    last_known_.emplace(id, LastKnown{score, lk_lru_.begin()});
}

std::optional<double> EnsembleScorer::last_known(const SourceId& id) const {
    std::lock_guard<std::mutex> lk(lk_mtx_);
    auto it = last_known_.find(id);
    if (it == last_known_.end()) return std::nullopt;
    return it->second.score;
}

} // namespace shieldcore
