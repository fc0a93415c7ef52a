#include "shieldcore/config/EngineConfig.hpp"
#include "shieldcore/config/ConfigLoader.hpp"
#include "shieldcore/core/Errors.hpp"

namespace shieldcore {

static void require(bool cond, const std::string& msg) {
    if (!cond) throw ConfigError(msg);
}

static bool in_unit(double v) { return v >= 0.0 && v <= 1.0; }

void EngineConfig::validate() const {
    require(aggregator.window_ms > 0, "[aggregator] window_ms must be > 0");
    require(aggregator.max_tracked_identities > 0, "[aggregator] max_tracked_identities must be > 0");
    require(aggregator.shards > 0, "[aggregator] shards must be > 0");

    require(scoring.fallback_decay >= 0.0 && scoring.fallback_decay <= 1.0,
            "[scoring] fallback_decay must be in [0,1]");
    require(scoring.pool_threads > 0, "[scoring] pool_threads must be > 0");
    require(scoring.last_known_capacity > 0, "[scoring] last_known_capacity must be > 0");

    size_t enabled = 0;
    for (const auto& m : scoring.models) {
        require(!m.id.empty(), "model without id");
        require(m.kind == "forest" || m.kind == "isolation" || m.kind == "logistic",
                "[model." + m.id + "] unknown kind: " + m.kind);
        require(in_unit(m.weight), "[model." + m.id + "] weight must be in [0,1]");
        require(m.timeout_ms > 0, "[model." + m.id + "] timeout_ms must be > 0");
        if (m.enabled) ++enabled;
    }
    require(enabled > 0, "no enabled models configured");

    const auto& mc = mitigation;
    require(in_unit(mc.suspicious_threshold), "[mitigation] suspicious_threshold must be in [0,1]");
    require(in_unit(mc.block_threshold), "[mitigation] block_threshold must be in [0,1]");
    require(mc.suspicious_threshold < mc.block_threshold,
            "[mitigation] suspicious_threshold must be < block_threshold");
    require(mc.block_consecutive >= 1, "[mitigation] block_consecutive must be >= 1");
    require(mc.clean_consecutive >= 1, "[mitigation] clean_consecutive must be >= 1");
    require(mc.block_duration_ms > 0, "[mitigation] block_duration_ms must be > 0");
    require(mc.backoff_factor >= 1.0, "[mitigation] backoff_factor must be >= 1");
    require(mc.max_block_ms >= mc.block_duration_ms, "[mitigation] max_block_ms must be >= block_duration_ms");
    require(mc.probation_ms > 0, "[mitigation] probation_ms must be > 0");
    require(mc.idle_timeout_ms > 0, "[mitigation] idle_timeout_ms must be > 0");
    require(mc.max_tracked_identities > 0, "[mitigation] max_tracked_identities must be > 0");
    require(mc.shards > 0, "[mitigation] shards must be > 0");

    require(explain.sample_budget > 0, "[explain] sample_budget must be > 0");
    require(explain.deadline_ms > 0, "[explain] deadline_ms must be > 0");

    require(dispatch.max_attempts >= 1, "[dispatch] max_attempts must be >= 1");
    require(dispatch.backoff_max_ms >= dispatch.backoff_initial_ms,
            "[dispatch] backoff_max_ms must be >= backoff_initial_ms");
    require(dispatch.undelivered_capacity > 0, "[dispatch] undelivered_capacity must be > 0");
    for (const auto& s : dispatch.sinks) {
        require(s.type == "logfile" || s.type == "webhook" || s.type == "command",
                "[sink." + s.id + "] unknown type: " + s.type);
        require(!s.target.empty(), "[sink." + s.id + "] target must be set");
        if (s.type == "command") {
            require(!s.unblock.empty(), "[sink." + s.id + "] unblock must be set");
            require(s.stream == SinkStream::ACTIONS,
                    "[sink." + s.id + "] command sinks take the actions stream only");
        }
    }

    require(pipeline.ingest_queue > 0 && pipeline.vector_queue > 0 &&
            pipeline.verdict_queue > 0 && pipeline.dispatch_queue > 0,
            "[pipeline] queue capacities must be > 0");
    require(pipeline.housekeeping_ms > 0, "[pipeline] housekeeping_ms must be > 0");
    require(pipeline.history_per_source > 0, "[pipeline] history_per_source must be > 0");
    require(pipeline.history_sources > 0, "[pipeline] history_sources must be > 0");
    require(pipeline.alert_history > 0, "[pipeline] alert_history must be > 0");

    require(query.port >= 0 && query.port <= 65535, "[query] port out of range");
}

static SinkStream parse_stream(const std::string& id, const std::string& s) {
    if (s.empty() || s == "both") return SinkStream::BOTH;
    if (s == "actions") return SinkStream::ACTIONS;
    if (s == "alerts") return SinkStream::ALERTS;
    throw ConfigError("[sink." + id + "] unknown stream: " + s);
}

EngineConfig load_engine_config(const ConfigLoader& cfg) {
    EngineConfig c;

    c.aggregator.window_ms = cfg.getUInt("aggregator", "window_ms", c.aggregator.window_ms);
    c.aggregator.allowed_lateness_ms =
        cfg.getUInt("aggregator", "allowed_lateness_ms", c.aggregator.allowed_lateness_ms);
    c.aggregator.max_tracked_identities =
        cfg.getUInt("aggregator", "max_tracked_identities", c.aggregator.max_tracked_identities);
    c.aggregator.shards = cfg.getUInt("aggregator", "shards", c.aggregator.shards);

    c.scoring.fallback_decay = cfg.getDouble("scoring", "fallback_decay", c.scoring.fallback_decay);
    c.scoring.pool_threads = cfg.getUInt("scoring", "pool_threads", c.scoring.pool_threads);
    c.scoring.last_known_capacity =
        cfg.getUInt("scoring", "last_known_capacity", c.scoring.last_known_capacity);

    for (const auto& id : cfg.sections_with_prefix("model")) {
        const std::string sec = "model." + id;
        ModelConfig m;
        m.id = id;
        m.kind = cfg.get(sec, "kind");
        m.path = cfg.get(sec, "path");
        m.weight = cfg.getDouble(sec, "weight", m.weight);
        m.timeout_ms = cfg.getUInt(sec, "timeout_ms", m.timeout_ms);
        m.enabled = cfg.getBool(sec, "enabled", m.enabled);
        c.scoring.models.push_back(m);
    }

    auto& mc = c.mitigation;
    mc.suspicious_threshold = cfg.getDouble("mitigation", "suspicious_threshold", mc.suspicious_threshold);
    mc.block_threshold = cfg.getDouble("mitigation", "block_threshold", mc.block_threshold);
    mc.block_consecutive = static_cast<uint32_t>(
        cfg.getUInt("mitigation", "block_consecutive", mc.block_consecutive));
    mc.clean_consecutive = static_cast<uint32_t>(
        cfg.getUInt("mitigation", "clean_consecutive", mc.clean_consecutive));
    mc.block_duration_ms = cfg.getUInt("mitigation", "block_duration_ms", mc.block_duration_ms);
    mc.backoff_factor = cfg.getDouble("mitigation", "backoff_factor", mc.backoff_factor);
    mc.max_block_ms = cfg.getUInt("mitigation", "max_block_ms", mc.max_block_ms);
    mc.probation_ms = cfg.getUInt("mitigation", "probation_ms", mc.probation_ms);
    mc.idle_timeout_ms = cfg.getUInt("mitigation", "idle_timeout_ms", mc.idle_timeout_ms);
    mc.max_tracked_identities =
        cfg.getUInt("mitigation", "max_tracked_identities", mc.max_tracked_identities);
    mc.shards = cfg.getUInt("mitigation", "shards", mc.shards);

    c.explain.enabled = cfg.getBool("explain", "enabled", c.explain.enabled);
    c.explain.sample_budget = static_cast<uint32_t>(
        cfg.getUInt("explain", "sample_budget", c.explain.sample_budget));
    c.explain.deadline_ms = cfg.getUInt("explain", "deadline_ms", c.explain.deadline_ms);

    c.dispatch.max_attempts = static_cast<uint32_t>(
        cfg.getUInt("dispatch", "max_attempts", c.dispatch.max_attempts));
    c.dispatch.backoff_initial_ms = cfg.getUInt("dispatch", "backoff_initial_ms", c.dispatch.backoff_initial_ms);
    c.dispatch.backoff_max_ms = cfg.getUInt("dispatch", "backoff_max_ms", c.dispatch.backoff_max_ms);
    c.dispatch.undelivered_capacity =
        cfg.getUInt("dispatch", "undelivered_capacity", c.dispatch.undelivered_capacity);

    for (const auto& id : cfg.sections_with_prefix("sink")) {
        const std::string sec = "sink." + id;
        SinkConfig s;
        s.id = id;
        s.type = cfg.get(sec, "type");
        s.target = cfg.get(sec, "target");
        s.unblock = cfg.get(sec, "unblock");
        const std::string stream = cfg.get(sec, "stream");
        s.stream = stream.empty() && s.type == "command" ? SinkStream::ACTIONS
                                                          : parse_stream(id, stream);
        s.min_severity = severity_from_string(cfg.get(sec, "min_severity", "low"));
        s.timeout_ms = cfg.getUInt(sec, "timeout_ms", s.timeout_ms);
        c.dispatch.sinks.push_back(s);
    }

    auto& pc = c.pipeline;
    pc.ingest_queue = cfg.getUInt("pipeline", "ingest_queue", pc.ingest_queue);
    pc.vector_queue = cfg.getUInt("pipeline", "vector_queue", pc.vector_queue);
    pc.verdict_queue = cfg.getUInt("pipeline", "verdict_queue", pc.verdict_queue);
    pc.dispatch_queue = cfg.getUInt("pipeline", "dispatch_queue", pc.dispatch_queue);
    pc.housekeeping_ms = cfg.getUInt("pipeline", "housekeeping_ms", pc.housekeeping_ms);
    pc.history_per_source = cfg.getUInt("pipeline", "history_per_source", pc.history_per_source);
    pc.history_sources = cfg.getUInt("pipeline", "history_sources", pc.history_sources);
    pc.alert_history = cfg.getUInt("pipeline", "alert_history", pc.alert_history);

    c.query.bind = cfg.get("query", "bind", c.query.bind);
    c.query.port = static_cast<int>(cfg.getInt("query", "port", c.query.port));

    c.validate();
    return c;
}

EngineConfig load_engine_config_file(const std::string& path) {
    ConfigLoader loader;
    loader.load(path);
    return load_engine_config(loader);
}

} // namespace shieldcore
