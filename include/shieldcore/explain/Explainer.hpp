#pragma once

#include "shieldcore/config/EngineConfig.hpp"
#include "shieldcore/core/Events.hpp"
#include "shieldcore/metrics/MetricsRegistry.hpp"
#include "shieldcore/models/ModelRegistry.hpp"
#include "shieldcore/scoring/ModelExecutor.hpp"

namespace shieldcore {

// Per-feature attribution by baseline substitution.
//
// For feature i every responding model re-scores the vector with x[i]
// replaced by that model's baseline value; the contribution is
// fused(x) - fused(x with i substituted), fused with the ensemble weights
// renormalized over the same responders. Results are ordered by
// descending |contribution|, ties by schema index.
//
// Each model's substitutions run as one call on a per-model executor lane
// and are joined against the explanation deadline. A model that stalls
// makes the explanation unavailable; the caller is never held past the
// deadline.
class Explainer {
public:
    // Reasons reported on unavailable explanations.
    static constexpr const char* kBelowThreshold = "below_threshold";
    static constexpr const char* kDisabled       = "disabled";
    static constexpr const char* kNoResponders   = "no_responders";
    static constexpr const char* kNoAttribution  = "no_attribution_support";
    static constexpr const char* kBudget         = "budget_exceeded";
    static constexpr const char* kDeadline       = "deadline_exceeded";
    static constexpr const char* kModelError     = "model_error";

    Explainer(const ModelRegistry& models, const ExplainConfig& cfg,
              double suspicious_threshold,
              MetricsRegistry& metrics = shieldcore::metrics());

    Explanation explain(const FusedVerdict& verdict) const;

private:
    Explanation unavailable(const char* reason, uint32_t evaluations = 0) const;

    const ModelRegistry& models_;
    ModelExecutor executor_;
    ExplainConfig cfg_;
    double threshold_;
    MetricsRegistry& metrics_;
};

} // namespace shieldcore
