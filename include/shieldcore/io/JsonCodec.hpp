#pragma once

#include "shieldcore/core/Events.hpp"
#include "shieldcore/dispatch/EventDispatcher.hpp"

#include <boost/json.hpp>

#include <vector>

namespace shieldcore::io {

boost::json::object to_json(const SourceState& s);
boost::json::object to_json(const FusedVerdict& v);
boost::json::object to_json(const MitigationAction& a);
boost::json::object to_json(const AlertEvent& a);
boost::json::object to_json(const UndeliveredRecord& r);
boost::json::array  to_json(const Explanation& e);

} // namespace shieldcore::io
