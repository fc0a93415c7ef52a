#pragma once

#include "shieldcore/core/Events.hpp"

#include <string>
#include <variant>

namespace shieldcore {

using DispatchEvent = std::variant<MitigationAction, AlertEvent>;

// Outbound collaborator: an enforcement point, an alert channel or both.
// deliver() throws DispatchFailure (or any std::exception) when the event
// did not get through; the dispatcher retries.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual const std::string& id() const = 0;

    virtual void deliver(const MitigationAction& a) = 0;
    virtual void deliver(const AlertEvent& a) = 0;
};

// "block 10.0.0.7" / "alert high 10.0.0.7"
std::string describe(const DispatchEvent& ev);

// One CSV record, no trailing newline:
//   action: ts_ns,action,<kind>,<source>,<expires_ns>,<verdict_id>,<reason>
//   alert:  ts_ns,alert,<severity>,<source>,<score>,<verdict_id>,<summary>
std::string to_csv(const MitigationAction& a);
std::string to_csv(const AlertEvent& a);

} // namespace shieldcore
