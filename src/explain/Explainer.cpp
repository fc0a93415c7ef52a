#include "shieldcore/explain/Explainer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iostream>
#include <optional>

namespace shieldcore {

namespace {

struct Participant {
    size_t index;               // position in the registry
    const ScoringModel* model;
    double weight;
    double score;               // score on the unmodified vector
};

} // namespace

Explainer::Explainer(const ModelRegistry& models, const ExplainConfig& cfg,
                     double suspicious_threshold, MetricsRegistry& metrics)
    : models_(models), executor_(models, models.size()), cfg_(cfg),
      threshold_(suspicious_threshold), metrics_(metrics) {}

Explanation Explainer::unavailable(const char* reason, uint32_t evaluations) const {
    Explanation e;
    e.available = false;
    e.reason = reason;
    e.evaluations = evaluations;
    metrics_.inc_explanation(false);
    return e;
}

Explanation Explainer::explain(const FusedVerdict& verdict) const {
    if (!cfg_.enabled) return unavailable(kDisabled);
    if (verdict.score < threshold_) return unavailable(kBelowThreshold);
    if (verdict.fallback || !verdict.vector) return unavailable(kNoResponders);

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(cfg_.deadline_ms);

    std::vector<Participant> parts;
    for (const auto& s : verdict.scores) {
        if (s.failed()) continue;
        const auto& regs = models_.models();
        for (size_t k = 0; k < regs.size(); ++k) {
            const auto& r = regs[k];
            if (r.model->id() != s.model_id) continue;
            if (r.weight > 0.0 && r.model->supports_attribution()) {
                parts.push_back({k, r.model.get(), r.weight, s.score});
            }
            break;
        }
    }
    if (parts.empty()) return unavailable(kNoAttribution);

    const std::vector<double>& x = verdict.vector->values;
    const size_t nf = x.size();

    // Every substituted feature costs one evaluation per participant.
    const uint64_t cost = static_cast<uint64_t>(nf) * parts.size();
    if (cost > cfg_.sample_budget) return unavailable(kBudget);

    double wsum = 0.0;
    double base = 0.0;
    for (const auto& p : parts) {
        base += p.weight * p.score;
        wsum += p.weight;
    }
    base /= wsum;

    // Features each model has to re-score: those that differ from its baseline.
    std::vector<std::vector<size_t>> substituted(parts.size());
    uint32_t evals = 0;
    for (size_t k = 0; k < parts.size(); ++k) {
        const auto& bl = parts[k].model->baseline();
        for (size_t i = 0; i < nf; ++i) {
            if (i < bl.size() && bl[i] != x[i]) substituted[k].push_back(i);
        }
        evals += static_cast<uint32_t>(substituted[k].size());
    }

    std::vector<std::optional<std::future<std::vector<double>>>> futures;
    futures.reserve(parts.size());
    for (size_t k = 0; k < parts.size(); ++k) {
        futures.push_back(executor_.submit(parts[k].index,
            [x, idx = substituted[k]](const ScoringModel& model) {
                std::vector<double> xs(x);
                std::vector<double> out;
                out.reserve(idx.size());
                const auto& bl = model.baseline();
                for (size_t i : idx) {
                    xs[i] = bl[i];
                    out.push_back(std::clamp(model.predict(xs), 0.0, 1.0));
                    xs[i] = x[i];
                }
                return out;
            }));
    }

    // substituted score per (feature, participant); unchanged features keep
    // the participant's original score
    std::vector<std::vector<double>> scored(nf);
    for (size_t i = 0; i < nf; ++i) {
        scored[i].reserve(parts.size());
        for (const auto& p : parts) scored[i].push_back(p.score);
    }

    for (size_t k = 0; k < parts.size(); ++k) {
        if (!futures[k] || futures[k]->wait_until(deadline) != std::future_status::ready) {
            std::cerr << "[EXPLAIN] " << parts[k].model->id() << " missed the "
                      << cfg_.deadline_ms << "ms deadline for " << verdict.source.str() << "\n";
            return unavailable(kDeadline, evals);
        }
        std::vector<double> got;
        try {
            got = futures[k]->get();
        } catch (const std::exception& e) {
            std::cerr << "[EXPLAIN] " << parts[k].model->id() << " failed on "
                      << verdict.source.str() << ": " << e.what() << "\n";
            return unavailable(kModelError, evals);
        }
        for (size_t j = 0; j < got.size(); ++j) scored[substituted[k][j]][k] = got[j];
    }

    std::vector<double> contrib(nf, 0.0);
    for (size_t i = 0; i < nf; ++i) {
        double sub = 0.0;
        for (size_t k = 0; k < parts.size(); ++k) sub += parts[k].weight * scored[i][k];
        contrib[i] = base - sub / wsum;
    }

    std::vector<size_t> order(nf);
    for (size_t i = 0; i < nf; ++i) order[i] = i;
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        double ca = std::fabs(contrib[a]);
        double cb = std::fabs(contrib[b]);
        if (ca != cb) return ca > cb;
        return a < b;
    });

    Explanation out;
    out.available = true;
    out.evaluations = evals;
    out.contributions.reserve(nf);
    for (size_t i : order) {
        Contribution c;
        c.feature = i < verdict.vector->names.size() ? verdict.vector->names[i]
                                                     : "f" + std::to_string(i);
        c.weight = contrib[i];
        out.contributions.push_back(std::move(c));
    }
    metrics_.inc_explanation(true);
    return out;
}

} // namespace shieldcore
