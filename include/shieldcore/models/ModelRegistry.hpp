#pragma once

#include "shieldcore/config/EngineConfig.hpp"
#include "shieldcore/models/ScoringModel.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace shieldcore {

struct RegisteredModel {
    std::shared_ptr<const ScoringModel> model;
    double weight = 1.0;
    std::chrono::milliseconds timeout{50};
};

// Startup-time registry of scoring models. Immutable once the pipeline runs.
class ModelRegistry {
public:
    ModelRegistry() = default;

    // Loads every enabled model of the config. Throws ConfigError.
    static ModelRegistry from_config(const ScoringConfig& cfg);

    // Throws ConfigError on duplicate id or negative weight.
    void add(std::shared_ptr<const ScoringModel> model, double weight,
             std::chrono::milliseconds timeout);

    const std::vector<RegisteredModel>& models() const { return models_; }
    size_t size() const { return models_.size(); }
    bool empty() const { return models_.empty(); }

    std::chrono::milliseconds max_timeout() const;

private:
    std::vector<RegisteredModel> models_;
};

} // namespace shieldcore
