#pragma once

#include "shieldcore/models/ScoringModel.hpp"

#include <memory>
#include <string>
#include <vector>

namespace shieldcore {

// Decision-tree ensemble classifier.
//   average : random forest, mean of leaf attack probabilities
//   boosted : gradient boosting, sigmoid(base_score + sum of leaf margins)
//
// Artifact:
//   shieldcore-forest 1
//   mode average|boosted
//   base_score <double>
//   features <n>
//   baseline <n doubles>
//   trees <T>
//   tree <N>        then N lines: idx feature threshold left right value
// A node with left < 0 and right < 0 is a leaf. Inner nodes go left when
// x[feature] <= threshold.
class ForestModel : public ScoringModel {
public:
    enum class Mode { AVERAGE, BOOSTED };

    struct Node {
        int    feature = -1;
        double threshold = 0.0;
        int    left = -1;
        int    right = -1;
        double value = 0.0;
        bool leaf() const { return left < 0 && right < 0; }
    };
    using Tree = std::vector<Node>;

    ForestModel(std::string id, Mode mode, double base_score,
                std::vector<Tree> trees, std::vector<double> baseline);

    static std::unique_ptr<ForestModel> load(const std::string& id, const std::string& path);

    const std::string& id() const override { return id_; }
    const char* kind() const override { return "forest"; }
    double predict(const std::vector<double>& x) const override;
    const std::vector<double>& baseline() const override { return baseline_; }

    size_t tree_count() const { return trees_.size(); }
    Mode mode() const { return mode_; }

private:
    double leaf_value(const Tree& t, const std::vector<double>& x) const;

    std::string id_;
    Mode mode_;
    double base_score_;
    std::vector<Tree> trees_;
    std::vector<double> baseline_;
};

} // namespace shieldcore
