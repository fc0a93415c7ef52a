#include "shieldcore/models/IsolationModel.hpp"
#include "shieldcore/models/Artifact.hpp"
#include "shieldcore/core/Errors.hpp"

#include <cmath>

namespace shieldcore {

static constexpr double kEulerGamma = 0.5772156649015329;

IsolationModel::IsolationModel(std::string id, double samples, std::vector<Tree> trees,
                               std::vector<double> baseline)
    : id_(std::move(id)),
      samples_(samples),
      trees_(std::move(trees)),
      baseline_(std::move(baseline)) {}

double IsolationModel::c(double n) {
    if (n <= 1.0) return 0.0;
    if (n <= 2.0) return 1.0;
    double h = std::log(n - 1.0) + kEulerGamma;
    return 2.0 * h - 2.0 * (n - 1.0) / n;
}

double IsolationModel::path_length(const Tree& t, const std::vector<double>& x) const {
    int i = 0;
    double depth = 0.0;
    for (size_t steps = 0; steps <= t.size(); ++steps) {
        const Node& nd = t[static_cast<size_t>(i)];
        if (nd.leaf()) return depth + c(nd.size);
        if (static_cast<size_t>(nd.feature) >= x.size()) {
            throw ModelUnavailableError(id_ + ": feature index out of range");
        }
        i = (x[static_cast<size_t>(nd.feature)] <= nd.threshold) ? nd.left : nd.right;
        depth += 1.0;
    }
    throw ModelUnavailableError(id_ + ": tree walk did not terminate");
}

double IsolationModel::predict(const std::vector<double>& x) const {
    if (trees_.empty()) throw ModelUnavailableError(id_ + ": no trees loaded");

    double sum = 0.0;
    for (const auto& t : trees_) sum += path_length(t, x);
    const double mean = sum / static_cast<double>(trees_.size());

    const double cn = c(samples_);
    if (cn <= 0.0) return 0.5;
    return std::pow(2.0, -mean / cn);
}

std::unique_ptr<IsolationModel> IsolationModel::load(const std::string& id, const std::string& path) {
    ArtifactReader in(path, "shieldcore-isolation", 1);

    in.expect("samples");
    double samples = in.read_double();
    if (samples < 2.0) in.fail("samples must be >= 2");

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
            nd.size = in.read_double();
            if (!nd.leaf()) {
                if (nd.feature < 0 || nd.feature >= nf) in.fail("bad feature index in tree " + std::to_string(t));
                if (nd.left < 0 || nd.left >= N || nd.right < 0 || nd.right >= N)
                    in.fail("bad child index in tree " + std::to_string(t));
            }
        }
        trees.push_back(std::move(tr));
    }

    return std::make_unique<IsolationModel>(id, samples, std::move(trees), std::move(baseline));
}

} // namespace shieldcore
