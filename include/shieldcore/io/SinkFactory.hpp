#pragma once

#include "shieldcore/config/EngineConfig.hpp"
#include "shieldcore/dispatch/EventDispatcher.hpp"
#include "shieldcore/dispatch/EventSink.hpp"

#include <memory>

namespace shieldcore::io {

// logfile -> LogFileSink, webhook -> WebhookSink. Throws ConfigError.
std::shared_ptr<EventSink> make_sink(const SinkConfig& cfg);

// Builds every configured sink and registers it with its routing.
void register_sinks(const DispatchConfig& cfg, EventDispatcher& dispatcher);

} // namespace shieldcore::io
