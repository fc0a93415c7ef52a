#pragma once
#include "shieldcore/metrics/MetricsTypes.hpp"
#include <string>

namespace shieldcore {

class MetricsExporter {
public:
    explicit MetricsExporter(const std::string& prefix);

    // Prometheus text exposition format, one counter per line.
    std::string to_prometheus(const MetricsSnapshot& s) const;

private:
    std::string prefix_;
};

}
