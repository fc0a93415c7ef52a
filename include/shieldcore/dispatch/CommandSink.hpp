#pragma once

#include "shieldcore/dispatch/EventSink.hpp"

#include <string>
#include <vector>

namespace shieldcore {

// Enforces blocks by running a firewall command per action, e.g.
//   iptables -I INPUT -s {ip} -j DROP
// The command line is split on whitespace into argv and executed directly,
// never through a shell. Every "{ip}" is replaced with the source address
// (the ip alone, without port or protocol). A nonzero exit, a signal or
// running past the timeout is a DispatchFailure, so the dispatcher retries.
// Watch actions and alerts are not enforced.
class CommandSink : public EventSink {
public:
    CommandSink(std::string id, const std::string& block_cmd, const std::string& unblock_cmd,
                uint64_t timeout_ms = 2000);

    const std::string& id() const override { return id_; }

    void deliver(const MitigationAction& a) override;
    void deliver(const AlertEvent&) override {}

    // argv for `kind` against `ip`. Empty for WATCH.
    std::vector<std::string> argv_for(ActionKind kind, const std::string& ip) const;

private:
    void run(const std::vector<std::string>& argv) const;

    std::string id_;
    std::vector<std::string> block_;
    std::vector<std::string> unblock_;
    uint64_t timeout_ms_;
};

} // namespace shieldcore
