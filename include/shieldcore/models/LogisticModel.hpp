#pragma once

#include "shieldcore/models/ScoringModel.hpp"

#include <memory>
#include <string>
#include <vector>

namespace shieldcore {

// Linear logistic model over standardized features:
//   p = sigmoid(bias + sum_i w_i * (x_i - mean_i) / scale_i)
//
// Artifact:
//   shieldcore-logistic 1
//   features <n>
//   bias <double>
//   mean <n doubles>
//   scale <n doubles>
//   weights <n doubles>
// The attribution baseline is the training mean.
class LogisticModel : public ScoringModel {
public:
    LogisticModel(std::string id, double bias, std::vector<double> mean,
                  std::vector<double> scale, std::vector<double> weights);

    static std::unique_ptr<LogisticModel> load(const std::string& id, const std::string& path);

    const std::string& id() const override { return id_; }
    const char* kind() const override { return "logistic"; }
    double predict(const std::vector<double>& x) const override;
    const std::vector<double>& baseline() const override { return mean_; }

private:
    std::string id_;
    double bias_;
    std::vector<double> mean_;
    std::vector<double> scale_;
    std::vector<double> weights_;
};

} // namespace shieldcore
