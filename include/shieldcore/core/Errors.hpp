#pragma once

#include <stdexcept>
#include <string>

namespace shieldcore {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Bad input event. Dropped and counted, never fatal.
class MalformedEventError : public Error {
public:
    explicit MalformedEventError(const std::string& what) : Error(what) {}
};

// Per-model failures. Tolerated by partial fusion.
class ModelTimeoutError : public Error {
public:
    explicit ModelTimeoutError(const std::string& what) : Error(what) {}
};

class ModelUnavailableError : public Error {
public:
    explicit ModelUnavailableError(const std::string& what) : Error(what) {}
};

// Identity-cardinality limit hit. Triggers eviction, not failure.
class CapacityExceeded : public Error {
public:
    explicit CapacityExceeded(const std::string& what) : Error(what) {}
};

// A sink could not deliver. Retried with backoff by the dispatcher.
class DispatchFailure : public Error {
public:
    explicit DispatchFailure(const std::string& what) : Error(what) {}
};

// Startup-only. The only fatal error class.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace shieldcore
