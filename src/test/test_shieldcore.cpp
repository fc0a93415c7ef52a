#include "test/test_shieldcore.h"
#include "shieldcore/core/Errors.hpp"
#include "shieldcore/features/FeatureSchema.hpp"

#include <algorithm>
#include <fstream>
#include <random>
#include <thread>

namespace shieldcore::test {

TempDir::TempDir() {
    std::random_device rd;
    path = std::filesystem::temp_directory_path() /
           ("shieldcore_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

std::string TempDir::file(const std::string& name) const {
    return (path / name).string();
}

std::string TempDir::write(const std::string& name, const std::string& content) const {
    const std::string p = file(name);
    std::ofstream f(p);
    f << content;
    return p;
}

FixedModel::FixedModel(std::string id, double score, Behaviour b, std::chrono::milliseconds hang)
    : id_(std::move(id)),
      score_(score),
      behaviour_(b),
      hang_(hang),
      baseline_(features::COUNT, 0.0) {}

double FixedModel::predict(const std::vector<double>&) const {
    calls_.fetch_add(1);
    switch (behaviour_.load()) {
    case Behaviour::THROW:
        throw ModelUnavailableError(id_ + ": scripted failure");
    case Behaviour::HANG:
        std::this_thread::sleep_for(hang_);
        break;
    case Behaviour::SCORE:
        break;
    }
    return score_.load();
}

LinearModel::LinearModel(std::string id, double bias, std::vector<double> weights)
    : id_(std::move(id)),
      bias_(bias),
      weights_(std::move(weights)),
      baseline_(features::COUNT, 0.0) {}

double LinearModel::predict(const std::vector<double>& x) const {
    double z = bias_;
    for (size_t i = 0; i < weights_.size() && i < x.size(); ++i) z += weights_[i] * x[i];
    return std::clamp(z, 0.0, 1.0);
}

void RecordingTimers::schedule(const SourceId& id, uint64_t generation, TimerKind kind,
                               uint64_t due_ns) {
    std::lock_guard<std::mutex> lk(mtx_);
    armed_.erase(std::remove_if(armed_.begin(), armed_.end(),
                                [&](const Armed& a) { return a.id == id; }),
                 armed_.end());
    armed_.push_back({id, generation, kind, due_ns});
}

void RecordingTimers::cancel(const SourceId& id, uint64_t generation) {
    std::lock_guard<std::mutex> lk(mtx_);
    ++cancels_;
    armed_.erase(std::remove_if(armed_.begin(), armed_.end(),
                                [&](const Armed& a) {
                                    return a.id == id && a.generation <= generation;
                                }),
                 armed_.end());
}

size_t RecordingTimers::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return armed_.size();
}

std::vector<RecordingTimers::Armed> RecordingTimers::armed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return armed_;
}

size_t RecordingTimers::cancels() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cancels_;
}

FeatureVector make_vector(const SourceId& src, uint64_t window_end_ns, std::vector<double> values) {
    FeatureVector v;
    v.source = src;
    v.window_end_ns = window_end_ns;
    v.window_start_ns = window_end_ns > 10 * kSec ? window_end_ns - 10 * kSec : 0;
    v.names = features::name_list();
    values.resize(features::COUNT, 0.0);
    v.values = std::move(values);
    return v;
}

FusedVerdict make_verdict(const SourceId& src, double score, uint64_t ts_ns, uint64_t id) {
    FusedVerdict v;
    v.id = id;
    v.source = src;
    v.score = score;
    v.ts_ns = ts_ns;
    return v;
}

FlowEvent make_flow(const std::string& ip, uint64_t ts_ns, uint16_t src_port, uint16_t dst_port,
                    Protocol proto, uint64_t packets, uint64_t bytes) {
    FlowEvent ev;
    ev.source = SourceId(ip);
    ev.ts_ns = ts_ns;
    ev.src_port = src_port;
    ev.dst_port = dst_port;
    ev.protocol = proto;
    ev.packets = packets;
    ev.bytes = bytes;
    ev.duration_s = 0.5;
    return ev;
}

MitigationConfig mitigation_config(double suspicious, double block, uint32_t n, uint32_t m,
                                   uint64_t block_ms) {
    MitigationConfig c;
    c.suspicious_threshold = suspicious;
    c.block_threshold = block;
    c.block_consecutive = n;
    c.clean_consecutive = m;
    c.block_duration_ms = block_ms;
    c.backoff_factor = 2.0;
    c.max_block_ms = block_ms * 16;
    c.probation_ms = 30000;
    c.idle_timeout_ms = 600000;
    c.max_tracked_identities = 1024;
    c.shards = 4;
    return c;
}

static const char* kBaseline =
    "baseline 50 40000 20 600 200 0.5 0.8 0.15 0.05 3.0 1.5 0.2 0.8 0.2 0.02\n";

std::string forest_artifact(const std::string& mode) {
    return std::string("shieldcore-forest 1\n") +
           "mode " + mode + "\n"
           "base_score 0\n"
           "features 15\n" + kBaseline +
           "trees 2\n"
           "# packet_rate split\n"
           "tree 3\n"
           "0 0 1000 1 2 0\n"
           "1 -1 0 -1 -1 0.1\n"
           "2 -1 0 -1 -1 0.9\n"
           "tree 3\n"
           "0 11 0.6 1 2 0\n"
           "1 -1 0 -1 -1 0.2\n"
           "2 -1 0 -1 -1 0.8\n";
}

std::string isolation_artifact() {
    return std::string("shieldcore-isolation 1\n"
                       "samples 256\n"
                       "features 15\n") + kBaseline +
           "trees 1\n"
           "tree 3\n"
           "0 0 2000 1 2 0\n"
           "1 -1 0 -1 -1 250\n"
           "2 -1 0 -1 -1 1\n";
}

std::string logistic_artifact() {
    return "shieldcore-logistic 1\n"
           "features 15\n"
           "bias 0\n"
           "mean  0 0 0 0 0 0 0 0 0 0 0 0 0 0 0\n"
           "scale 1 1 1 1 1 1 1 1 1 1 1 1 1 1 1\n"
           "weights 0.01 0 0 0 0 0 0 0 0 0 0 0 0 0 0\n";
}

std::string engine_ini(const TempDir& dir) {
    const std::string forest = dir.write("forest.model", forest_artifact());
    const std::string iso = dir.write("isolation.model", isolation_artifact());
    return "[aggregator]\n"
           "window_ms = 1000\n"
           "max_tracked_identities = 64\n"
           "shards = 4\n"
           "\n"
           "[scoring]\n"
           "fallback_decay = 0.5\n"
           "pool_threads = 4\n"
           "\n"
           "[model.rf]\n"
           "kind = forest\n"
           "path = " + forest + "\n"
           "weight = 0.8\n"
           "timeout_ms = 200\n"
           "\n"
           "[model.iso]\n"
           "kind = isolation\n"
           "path = " + iso + "\n"
           "weight = 0.2\n"
           "timeout_ms = 200\n"
           "\n"
           "[mitigation]\n"
           "suspicious_threshold = 0.5\n"
           "block_threshold = 0.8\n"
           "block_consecutive = 1\n"
           "clean_consecutive = 2\n"
           "block_duration_ms = 60000\n"
           "\n"
           "[dispatch]\n"
           "max_attempts = 2\n"
           "backoff_initial_ms = 1\n"
           "backoff_max_ms = 2\n"
           "\n"
           "[pipeline]\n"
           "housekeeping_ms = 60000\n";
}

} // namespace shieldcore::test
