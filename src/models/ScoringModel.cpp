#include "shieldcore/models/ScoringModel.hpp"
#include "shieldcore/core/Errors.hpp"

#include <algorithm>
#include <cmath>

namespace shieldcore {

ModelScore ScoringModel::score(const FeatureVector& v, Deadline deadline) const {
    ModelScore s;
    s.model_id = id();

    const auto t0 = std::chrono::steady_clock::now();
    try {
        double p = predict(v.values);
        if (!std::isfinite(p)) {
            throw ModelUnavailableError("non-finite score");
        }
        s.score = std::clamp(p, 0.0, 1.0);
        s.confidence = std::abs(2.0 * s.score - 1.0);
        s.status = ModelStatus::OK;
    } catch (const ModelTimeoutError& e) {
        s.status = ModelStatus::TIMEOUT;
        s.detail = e.what();
    } catch (const std::exception& e) {
        s.status = ModelStatus::ERROR;
        s.detail = e.what();
    }
    const auto t1 = std::chrono::steady_clock::now();
    s.latency_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());

    if (s.status == ModelStatus::OK && t1 > deadline) {
        s.status = ModelStatus::TIMEOUT;
        s.detail = "finished after deadline";
    }
    if (s.failed()) {
        s.score = 0.0;
        s.confidence = 0.0;
    }
    return s;
}

} // namespace shieldcore
