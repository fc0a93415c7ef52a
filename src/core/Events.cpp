#include "shieldcore/core/Events.hpp"

namespace shieldcore {

double FeatureVector::get(const std::string& name, double fallback) const {
    for (size_t i = 0; i < names.size() && i < values.size(); ++i) {
        if (names[i] == name) return values[i];
    }
    return fallback;
}

const char* to_string(ModelStatus s) {
    switch (s) {
        case ModelStatus::OK:      return "ok";
        case ModelStatus::TIMEOUT: return "timeout";
        case ModelStatus::ERROR:   return "error";
    }
    return "error";
}

const char* to_string(MitigationState s) {
    switch (s) {
        case MitigationState::OBSERVING:  return "Observing";
        case MitigationState::SUSPICIOUS: return "Suspicious";
        case MitigationState::BLOCKED:    return "Blocked";
        case MitigationState::RECOVERING: return "Recovering";
    }
    return "Observing";
}

const char* to_string(ActionKind k) {
    switch (k) {
        case ActionKind::BLOCK:   return "block";
        case ActionKind::UNBLOCK: return "unblock";
        case ActionKind::WATCH:   return "watch";
    }
    return "watch";
}

const char* to_string(Severity s) {
    switch (s) {
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
    }
    return "low";
}

Severity severity_from_string(const std::string& s) {
    if (s == "critical" || s == "CRITICAL") return Severity::CRITICAL;
    if (s == "high" || s == "HIGH") return Severity::HIGH;
    if (s == "medium" || s == "MEDIUM") return Severity::MEDIUM;
    return Severity::LOW;
}

} // namespace shieldcore
