#include "shieldcore/io/SinkFactory.hpp"
#include "shieldcore/io/WebhookSink.hpp"
#include "shieldcore/dispatch/CommandSink.hpp"
#include "shieldcore/dispatch/Sinks.hpp"
#include "shieldcore/core/Errors.hpp"

namespace shieldcore::io {

std::shared_ptr<EventSink> make_sink(const SinkConfig& cfg) {
    if (cfg.type == "logfile") {
        return std::make_shared<LogFileSink>(cfg.id, cfg.target);
    }
    if (cfg.type == "webhook") {
        return std::make_shared<WebhookSink>(cfg.id, cfg.target,
                                             static_cast<long>(cfg.timeout_ms));
    }
    if (cfg.type == "command") {
        return std::make_shared<CommandSink>(cfg.id, cfg.target, cfg.unblock, cfg.timeout_ms);
    }
    throw ConfigError("[sink." + cfg.id + "] unknown type: " + cfg.type);
}

void register_sinks(const DispatchConfig& cfg, EventDispatcher& dispatcher) {
    for (const auto& s : cfg.sinks) {
        dispatcher.add_sink(make_sink(s), s.stream, s.min_severity);
    }
}

} // namespace shieldcore::io
