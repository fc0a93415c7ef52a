#pragma once

#include "shieldcore/dispatch/EventSink.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace shieldcore {

// Appends one CSV line per event.
class LogFileSink : public EventSink {
public:
    LogFileSink(std::string id, std::string path);

    const std::string& id() const override { return id_; }
    const std::string& path() const { return path_; }

    void deliver(const MitigationAction& a) override;
    void deliver(const AlertEvent& a) override;

private:
    void append(const std::string& line);

    std::string id_;
    std::string path_;
    std::mutex mtx_;
};

// Keeps everything it receives. For embedding and tests.
class MemorySink : public EventSink {
public:
    explicit MemorySink(std::string id = "memory");

    const std::string& id() const override { return id_; }

    void deliver(const MitigationAction& a) override;
    void deliver(const AlertEvent& a) override;

    std::vector<MitigationAction> actions() const;
    std::vector<AlertEvent> alerts() const;
    void clear();

private:
    std::string id_;
    mutable std::mutex mtx_;
    std::vector<MitigationAction> actions_;
    std::vector<AlertEvent> alerts_;
};

} // namespace shieldcore
