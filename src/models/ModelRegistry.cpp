#include "shieldcore/models/ModelRegistry.hpp"
#include "shieldcore/models/ForestModel.hpp"
#include "shieldcore/models/IsolationModel.hpp"
#include "shieldcore/models/LogisticModel.hpp"
#include "shieldcore/features/FeatureSchema.hpp"
#include "shieldcore/core/Errors.hpp"

#include <iostream>

namespace shieldcore {

static std::shared_ptr<const ScoringModel> load_model(const ModelConfig& m) {
    if (m.path.empty()) {
        throw ConfigError("[model." + m.id + "] path must be set");
    }
    if (m.kind == "forest")    return ForestModel::load(m.id, m.path);
    if (m.kind == "isolation") return IsolationModel::load(m.id, m.path);
    if (m.kind == "logistic")  return LogisticModel::load(m.id, m.path);
    throw ConfigError("[model." + m.id + "] unknown kind: " + m.kind);
}

ModelRegistry ModelRegistry::from_config(const ScoringConfig& cfg) {
    ModelRegistry reg;
    for (const auto& m : cfg.models) {
        if (!m.enabled) {
            std::cout << "[MODELS] " << m.id << " disabled, skipping\n";
            continue;
        }
        auto model = load_model(m);
        if (model->baseline().size() != features::COUNT) {
            throw ConfigError("[model." + m.id + "] artifact has " +
                              std::to_string(model->baseline().size()) + " features, expected " +
                              std::to_string(features::COUNT));
        }
        reg.add(model, m.weight, std::chrono::milliseconds(m.timeout_ms));
        std::cout << "[MODELS] loaded " << m.id << " kind=" << m.kind
                  << " weight=" << m.weight << " timeout_ms=" << m.timeout_ms << "\n";
    }
    if (reg.empty()) {
        throw ConfigError("no enabled models configured");
    }
    return reg;
}

void ModelRegistry::add(std::shared_ptr<const ScoringModel> model, double weight,
                        std::chrono::milliseconds timeout) {
    if (!model) throw ConfigError("null model");
    if (weight < 0.0) throw ConfigError("model " + model->id() + ": negative weight");
    if (timeout.count() <= 0) throw ConfigError("model " + model->id() + ": timeout must be > 0");
    for (const auto& r : models_) {
        if (r.model->id() == model->id()) {
            throw ConfigError("duplicate model id: " + model->id());
        }
    }
    RegisteredModel r;
    r.model = std::move(model);
    r.weight = weight;
    r.timeout = timeout;
    models_.push_back(std::move(r));
}

std::chrono::milliseconds ModelRegistry::max_timeout() const {
    std::chrono::milliseconds m{0};
    for (const auto& r : models_) {
        if (r.timeout > m) m = r.timeout;
    }
    return m;
}

} // namespace shieldcore
