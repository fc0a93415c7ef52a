#pragma once

#include "shieldcore/dispatch/EventSink.hpp"

#include <string>

namespace shieldcore::io {

// POSTs one JSON document per event. Transport errors and HTTP status
// >= 400 raise DispatchFailure.
class WebhookSink : public EventSink {
public:
    WebhookSink(std::string id, std::string url, long timeout_ms);

    const std::string& id() const override { return id_; }

    void deliver(const MitigationAction& a) override;
    void deliver(const AlertEvent& a) override;

private:
    void post(const std::string& body);

    std::string id_;
    std::string url_;
    long timeout_ms_;
};

} // namespace shieldcore::io
