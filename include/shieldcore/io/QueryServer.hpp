#pragma once

#include "shieldcore/config/EngineConfig.hpp"
#include "shieldcore/metrics/MetricsExporter.hpp"

#include <atomic>
#include <map>
#include <string>
#include <thread>

namespace shieldcore {
class Pipeline;
}

namespace shieldcore::io {

// HTTP/1.1 read API plus the operator block endpoints.
//
//   GET  /state?source=<id>
//   GET  /verdicts?source=<id>&limit=<n>
//   GET  /blocks
//   GET  /alerts?limit=<n>                         (newest first, default 50)
//   GET  /undelivered
//   GET  /metrics                                  (Prometheus text)
//   POST /block?source=<id>&minutes=<n>&reason=<s>  (n <= max_block_ms in minutes)
//   POST /unblock?source=<id>
class QueryServer {
public:
    struct Response {
        unsigned status = 200;
        std::string content_type = "application/json";
        std::string body;
    };

    QueryServer(const QueryConfig& cfg, Pipeline& pipeline);
    ~QueryServer();

    QueryServer(const QueryServer&) = delete;
    QueryServer& operator=(const QueryServer&) = delete;

    void start();
    void stop();

    // Routing without the socket layer.
    Response handle(const std::string& method, const std::string& target);

private:
    void run();

    QueryConfig cfg_;
    Pipeline& pipeline_;
    MetricsExporter exporter_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

// Splits "a=1&b=x%20y" into decoded pairs.
std::map<std::string, std::string> parse_query(const std::string& qs);

} // namespace shieldcore::io
