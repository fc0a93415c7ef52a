#include "shieldcore/models/ForestModel.hpp"
#include "shieldcore/models/Artifact.hpp"
#include "shieldcore/core/Errors.hpp"

#include <cmath>
#include <memory>

namespace shieldcore {

static double sig(double z) { return 1.0 / (1.0 + std::exp(-z)); }

ForestModel::ForestModel(std::string id, Mode mode, double base_score,
                         std::vector<Tree> trees, std::vector<double> baseline)
    : id_(std::move(id)),
      mode_(mode),
      base_score_(base_score),
      trees_(std::move(trees)),
      baseline_(std::move(baseline)) {}

double ForestModel::leaf_value(const Tree& t, const std::vector<double>& x) const {
    int i = 0;
    // Bounded walk: a malformed tree cannot loop forever.
    for (size_t steps = 0; steps <= t.size(); ++steps) {
        const Node& nd = t[static_cast<size_t>(i)];
        if (nd.leaf()) return nd.value;
        if (static_cast<size_t>(nd.feature) >= x.size()) {
            throw ModelUnavailableError(id_ + ": feature index " +
                                        std::to_string(nd.feature) + " out of range");
        }
        i = (x[static_cast<size_t>(nd.feature)] <= nd.threshold) ? nd.left : nd.right;
    }
    throw ModelUnavailableError(id_ + ": tree walk did not terminate");
}

double ForestModel::predict(const std::vector<double>& x) const {
    if (trees_.empty()) throw ModelUnavailableError(id_ + ": no trees loaded");

    double acc = 0.0;
    for (const auto& t : trees_) {
        acc += leaf_value(t, x);
    }

    if (mode_ == Mode::AVERAGE) {
        return acc / static_cast<double>(trees_.size());
    }
    return sig(base_score_ + acc);
}

std::unique_ptr<ForestModel> ForestModel::load(const std::string& id, const std::string& path) {
    ArtifactReader in(path, "shieldcore-forest", 1);

    in.expect("mode");
    std::string m = in.word();
    Mode mode;
    if (m == "average") mode = Mode::AVERAGE;
    else if (m == "boosted") mode = Mode::BOOSTED;
    else in.fail("unknown forest mode: " + m);

    in.expect("base_score");
    double base = in.read_double();

    in.expect("features");
    int nf = in.read_int();
    if (nf <= 0) in.fail("feature count must be > 0");
    std::vector<double> baseline = in.tagged_doubles("baseline", static_cast<size_t>(nf));

    in.expect("trees");
    int T = in.read_int();
    if (T <= 0) in.fail("tree count must be > 0");

    std::vector<Tree> trees;
    trees.reserve(static_cast<size_t>(T));
    for (int t = 0; t < T; ++t) {
        in.expect("tree");
        int N = in.read_int();
        if (N <= 0) in.fail("empty tree " + std::to_string(t));

        Tree tr(static_cast<size_t>(N));
        for (int i = 0; i < N; ++i) {
            int idx = in.read_int();
            if (idx < 0 || idx >= N) in.fail("node index out of range in tree " + std::to_string(t));
            Node& nd = tr[static_cast<size_t>(idx)];
            nd.feature = in.read_int();
            nd.threshold = in.read_double();
            nd.left = in.read_int();
            nd.right = in.read_int();
            nd.value = in.read_double();
            if (!nd.leaf()) {
                if (nd.feature < 0 || nd.feature >= nf) in.fail("bad feature index in tree " + std::to_string(t));
                if (nd.left < 0 || nd.left >= N || nd.right < 0 || nd.right >= N)
                    in.fail("bad child index in tree " + std::to_string(t));
            }
        }
        trees.push_back(std::move(tr));
    }

    return std::make_unique<ForestModel>(id, mode, base, std::move(trees), std::move(baseline));
}

} // namespace shieldcore
