#include "shieldcore/models/LogisticModel.hpp"
#include "shieldcore/models/Artifact.hpp"
#include "shieldcore/core/Errors.hpp"

#include <cmath>

namespace shieldcore {

LogisticModel::LogisticModel(std::string id, double bias, std::vector<double> mean,
                             std::vector<double> scale, std::vector<double> weights)
    : id_(std::move(id)),
      bias_(bias),
      mean_(std::move(mean)),
      scale_(std::move(scale)),
      weights_(std::move(weights)) {}

double LogisticModel::predict(const std::vector<double>& x) const {
    if (x.size() < weights_.size()) {
        throw ModelUnavailableError(id_ + ": expected " + std::to_string(weights_.size()) +
                                    " features, got " + std::to_string(x.size()));
    }
    double z = bias_;
    for (size_t i = 0; i < weights_.size(); ++i) {
        double s = scale_[i] != 0.0 ? scale_[i] : 1.0;
        z += weights_[i] * (x[i] - mean_[i]) / s;
    }
    return 1.0 / (1.0 + std::exp(-z));
}

std::unique_ptr<LogisticModel> LogisticModel::load(const std::string& id, const std::string& path) {
    ArtifactReader in(path, "shieldcore-logistic", 1);

    in.expect("features");
    int nf = in.read_int();
    if (nf <= 0) in.fail("feature count must be > 0");
    const size_t n = static_cast<size_t>(nf);

    in.expect("bias");
    double bias = in.read_double();
    std::vector<double> mean = in.tagged_doubles("mean", n);
    std::vector<double> scale = in.tagged_doubles("scale", n);
    std::vector<double> weights = in.tagged_doubles("weights", n);

    return std::make_unique<LogisticModel>(id, bias, std::move(mean), std::move(scale),
                                           std::move(weights));
}

} // namespace shieldcore
