#pragma once

#include "shieldcore/core/Types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shieldcore {

// ---------------------------------------------------------------------------
// Flow input
// ---------------------------------------------------------------------------
struct FlowEvent {
    SourceId source;
    uint64_t ts_ns = 0;
    uint16_t src_port = 0;
    uint16_t dst_port = 0;
    Protocol protocol = Protocol::OTHER;
    uint64_t bytes = 0;
    uint64_t packets = 0;
    double   duration_s = 0.0;

    // TCP flag counts observed in the flow
    uint32_t syn = 0;
    uint32_t ack = 0;
    uint32_t fin = 0;
    uint32_t rst = 0;
};

// ---------------------------------------------------------------------------
// Aggregated window
// ---------------------------------------------------------------------------
struct FeatureVector {
    SourceId source;
    uint64_t window_start_ns = 0;
    uint64_t window_end_ns = 0;
    std::vector<std::string> names;
    std::vector<double>      values;

    size_t size() const { return values.size(); }
    double get(const std::string& name, double fallback = 0.0) const;
};

using FeatureVectorPtr = std::shared_ptr<const FeatureVector>;

// ---------------------------------------------------------------------------
// Scoring
// ---------------------------------------------------------------------------
enum class ModelStatus : uint8_t {
    OK      = 0,
    TIMEOUT = 1,
    ERROR   = 2
};

const char* to_string(ModelStatus s);

struct ModelScore {
    std::string model_id;
    double      score = 0.0;
    double      confidence = 0.0;
    uint64_t    latency_ns = 0;
    ModelStatus status = ModelStatus::OK;
    std::string detail;

    bool failed() const { return status != ModelStatus::OK; }
};

struct Contribution {
    std::string feature;
    double      weight = 0.0;
};

struct Explanation {
    bool available = false;
    std::string reason;                 // set when unavailable
    std::vector<Contribution> contributions;
    uint32_t evaluations = 0;
};

using ExplanationPtr = std::shared_ptr<const Explanation>;

struct FusedVerdict {
    uint64_t id = 0;
    SourceId source;
    double   score = 0.5;
    uint64_t ts_ns = 0;
    bool     degraded = false;          // at least one model failed
    bool     fallback = false;          // no model responded
    std::vector<ModelScore> scores;
    FeatureVectorPtr vector;
    ExplanationPtr explanation;
};

// ---------------------------------------------------------------------------
// Mitigation state
// ---------------------------------------------------------------------------
enum class MitigationState : uint8_t {
    OBSERVING  = 0,
    SUSPICIOUS = 1,
    BLOCKED    = 2,
    RECOVERING = 3
};

const char* to_string(MitigationState s);

struct SourceState {
    SourceId        source;
    MitigationState state = MitigationState::OBSERVING;
    uint32_t block_streak = 0;          // consecutive verdicts >= block threshold
    uint32_t clean_streak = 0;          // consecutive verdicts < suspicious threshold
    uint32_t offense_level = 0;         // backoff exponent for relapse blocks
    uint64_t generation = 0;            // bumped on every transition
    uint64_t last_transition_ns = 0;
    uint64_t last_seen_ns = 0;
    uint64_t block_expires_ns = 0;      // 0 when not blocked
    uint64_t probation_expires_ns = 0;  // 0 when not recovering
    double   last_score = 0.0;
};

enum class ActionKind : uint8_t {
    BLOCK   = 0,
    UNBLOCK = 1,
    WATCH   = 2
};

const char* to_string(ActionKind k);

struct MitigationAction {
    SourceId   source;
    ActionKind kind = ActionKind::WATCH;
    std::string reason;
    uint64_t   verdict_id = 0;
    uint64_t   issued_ns = 0;
    uint64_t   expires_ns = 0;          // blocks only
};

enum class Severity : uint8_t {
    LOW      = 0,
    MEDIUM   = 1,
    HIGH     = 2,
    CRITICAL = 3
};

const char* to_string(Severity s);
Severity severity_from_string(const std::string& s);

struct AlertEvent {
    Severity severity = Severity::LOW;
    SourceId source;
    std::string summary;
    uint64_t verdict_id = 0;
    double   score = 0.0;
    uint64_t ts_ns = 0;
    ExplanationPtr explanation;
};

} // namespace shieldcore
