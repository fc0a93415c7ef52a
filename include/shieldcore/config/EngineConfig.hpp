#pragma once

#include "shieldcore/core/Events.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace shieldcore {

class ConfigLoader;

struct AggregatorConfig {
    uint64_t window_ms = 10000;
    uint64_t allowed_lateness_ms = 60000;   // event-time slack behind the newest event
    size_t   max_tracked_identities = 100000;
    size_t   shards = 16;
};

struct ModelConfig {
    std::string id;
    std::string kind;                   // forest | isolation | logistic
    std::string path;                   // artifact file
    double      weight = 1.0;
    uint64_t    timeout_ms = 50;
    bool        enabled = true;
};

struct ScoringConfig {
    double   fallback_decay = 0.5;      // fraction of (last - 0.5) kept per outage
    size_t   pool_threads = 4;
    size_t   last_known_capacity = 100000;
    std::vector<ModelConfig> models;
};

struct MitigationConfig {
    double   suspicious_threshold = 0.5;
    double   block_threshold = 0.8;
    uint32_t block_consecutive = 3;     // N
    uint32_t clean_consecutive = 3;     // M
    uint64_t block_duration_ms = 60000;
    double   backoff_factor = 2.0;
    uint64_t max_block_ms = 3600000;
    uint64_t probation_ms = 300000;
    uint64_t idle_timeout_ms = 600000;
    size_t   max_tracked_identities = 100000;
    size_t   shards = 16;
};

struct ExplainConfig {
    bool     enabled = true;
    uint32_t sample_budget = 256;       // max model evaluations per explanation
    uint64_t deadline_ms = 20;
};

enum class SinkStream : uint8_t {
    ACTIONS = 1,
    ALERTS  = 2,
    BOTH    = 3
};

struct SinkConfig {
    std::string id;
    std::string type;                   // logfile | webhook | command
    std::string target;                 // path, url, or block command line
    std::string unblock;                // command sinks: unblock command line
    SinkStream  stream = SinkStream::BOTH;
    Severity    min_severity = Severity::LOW;
    uint64_t    timeout_ms = 2000;
};

struct DispatchConfig {
    uint32_t max_attempts = 5;
    uint64_t backoff_initial_ms = 50;
    uint64_t backoff_max_ms = 2000;
    size_t   undelivered_capacity = 1024;
    std::vector<SinkConfig> sinks;
};

struct PipelineConfig {
    size_t   ingest_queue = 65536;
    size_t   vector_queue = 8192;
    size_t   verdict_queue = 8192;
    size_t   dispatch_queue = 8192;
    uint64_t housekeeping_ms = 1000;
    size_t   history_per_source = 32;
    size_t   history_sources = 10000;
    size_t   alert_history = 1000;
};

struct QueryConfig {
    std::string bind = "127.0.0.1";
    int port = 0;                       // 0 disables the HTTP query server
};

struct EngineConfig {
    AggregatorConfig aggregator;
    ScoringConfig    scoring;
    MitigationConfig mitigation;
    ExplainConfig    explain;
    DispatchConfig   dispatch;
    PipelineConfig   pipeline;
    QueryConfig      query;

    // Throws ConfigError on the first violated constraint.
    void validate() const;
};

// Builds and validates an EngineConfig. Throws ConfigError.
EngineConfig load_engine_config(const ConfigLoader& cfg);
EngineConfig load_engine_config_file(const std::string& path);

} // namespace shieldcore
