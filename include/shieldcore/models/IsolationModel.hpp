#pragma once

#include "shieldcore/models/ScoringModel.hpp"

#include <memory>
#include <string>
#include <vector>

namespace shieldcore {

// Isolation forest anomaly detector, trained offline on clean traffic only.
// score(x) = 2^(-E[h(x)] / c(n)) where h is the path length to the leaf
// plus c(leaf size), and n is the training subsample size.
//
// Artifact:
//   shieldcore-isolation 1
//   samples <n>
//   features <f>
//   baseline <f doubles>
//   trees <T>
//   tree <N>        then N lines: idx feature threshold left right size
class IsolationModel : public ScoringModel {
public:
    struct Node {
        int    feature = -1;
        double threshold = 0.0;
        int    left = -1;
        int    right = -1;
        double size = 1.0;
        bool leaf() const { return left < 0 && right < 0; }
    };
    using Tree = std::vector<Node>;

    IsolationModel(std::string id, double samples, std::vector<Tree> trees,
                   std::vector<double> baseline);

    static std::unique_ptr<IsolationModel> load(const std::string& id, const std::string& path);

    const std::string& id() const override { return id_; }
    const char* kind() const override { return "isolation"; }
    double predict(const std::vector<double>& x) const override;
    const std::vector<double>& baseline() const override { return baseline_; }

    // Average path length of an unsuccessful BST search over n points.
    static double c(double n);

private:
    double path_length(const Tree& t, const std::vector<double>& x) const;

    std::string id_;
    double samples_;
    std::vector<Tree> trees_;
    std::vector<double> baseline_;
};

} // namespace shieldcore
