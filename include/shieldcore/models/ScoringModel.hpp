#pragma once

#include "shieldcore/core/Events.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace shieldcore {

using Deadline = std::chrono::steady_clock::time_point;

// Fixed scorer capability set. Concrete models are registered at startup
// from configuration and are immutable afterwards, so predict() may be
// called concurrently.
class ScoringModel {
public:
    virtual ~ScoringModel() = default;

    virtual const std::string& id() const = 0;
    virtual const char* kind() const = 0;

    // Attack likelihood in [0,1]. May throw; callers convert to ModelScore.
    virtual double predict(const std::vector<double>& x) const = 0;

    // Reference input used for attribution by baseline substitution.
    virtual const std::vector<double>& baseline() const = 0;

    virtual bool supports_attribution() const { return true; }

    // Runs predict() and packages the outcome. Never throws: failures and
    // results past the deadline come back as failed ModelScores.
    ModelScore score(const FeatureVector& v, Deadline deadline) const;
};

} // namespace shieldcore
