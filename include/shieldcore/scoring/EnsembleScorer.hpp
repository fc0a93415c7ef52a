#pragma once

#include "shieldcore/config/EngineConfig.hpp"
#include "shieldcore/core/Events.hpp"
#include "shieldcore/metrics/MetricsRegistry.hpp"
#include "shieldcore/models/ModelRegistry.hpp"
#include "shieldcore/scoring/ModelExecutor.hpp"

#include <atomic>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace shieldcore {

// Runs every registered model against a feature vector in parallel and
// fuses the successful results.
//
// Fusion: weighted mean over models that responded, with weights
// renormalized over the responders. When no weight responds the verdict
// falls back to the last-known score for the source, decayed toward 0.5,
// so a model outage never reads as "clean".
//
// A model whose previous call has not returned yet is not called again: it
// is reported as TIMEOUT for this verdict and the others are fused.
class EnsembleScorer {
public:
    EnsembleScorer(const ModelRegistry& models, const ScoringConfig& cfg,
                   MetricsRegistry& metrics = shieldcore::metrics());
    ~EnsembleScorer();

    EnsembleScorer(const EnsembleScorer&) = delete;
    EnsembleScorer& operator=(const EnsembleScorer&) = delete;

    FusedVerdict score(const FeatureVector& v);
    FusedVerdict score(FeatureVectorPtr v);

    // Renormalized weighted mean of the OK scores. Empty when the responding
    // weight is zero.
    static std::optional<double> fuse(const std::vector<ModelScore>& scores,
                                      const std::vector<RegisteredModel>& models);

    std::optional<double> last_known(const SourceId& id) const;

    const ModelRegistry& registry() const { return models_; }

private:
    double fallback_for(const SourceId& id);
    void remember(const SourceId& id, double score);

    const ModelRegistry& models_;
    const double fallback_decay_;
    const size_t last_known_capacity_;

    ModelExecutor executor_;
    std::atomic<uint64_t> next_id_{1};

    mutable std::mutex lk_mtx_;
    std::list<SourceId> lk_lru_;
    struct LastKnown {
        double score;
        std::list<SourceId>::iterator lru;
    };
    std::unordered_map<SourceId, LastKnown> last_known_;

    MetricsRegistry& metrics_;
};

} // namespace shieldcore
