#include "shieldcore/io/QueryServer.hpp"
#include "shieldcore/io/JsonCodec.hpp"
#include "shieldcore/runtime/Pipeline.hpp"
#include "shieldcore/core/Errors.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
namespace json  = boost::json;
using tcp = asio::ip::tcp;

namespace shieldcore::io {

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size() &&
                   hex_val(s[i + 1]) >= 0 && hex_val(s[i + 2]) >= 0) {
            out += static_cast<char>(hex_val(s[i + 1]) * 16 + hex_val(s[i + 2]));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query(const std::string& qs) {
    std::map<std::string, std::string> out;
    size_t pos = 0;
    while (pos <= qs.size()) {
        size_t amp = qs.find('&', pos);
        if (amp == std::string::npos) amp = qs.size();
        std::string pair = qs.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                out[url_decode(pair)] = "";
            } else {
                out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        pos = amp + 1;
    }
    return out;
}

static QueryServer::Response json_response(unsigned status, const json::value& v) {
    QueryServer::Response r;
    r.status = status;
    r.body = json::serialize(v);
    return r;
}

static QueryServer::Response error_response(unsigned status, const std::string& msg) {
    json::object o;
    o["error"] = msg;
    return json_response(status, o);
}

QueryServer::QueryServer(const QueryConfig& cfg, Pipeline& pipeline)
    : cfg_(cfg), pipeline_(pipeline), exporter_("shieldcore") {}

QueryServer::~QueryServer() {
    stop();
}

void QueryServer::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&QueryServer::run, this);
}

void QueryServer::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
}

QueryServer::Response QueryServer::handle(const std::string& method, const std::string& target) {
    const size_t q = target.find('?');
    const std::string path = target.substr(0, q);
    const auto params = parse_query(q == std::string::npos ? "" : target.substr(q + 1));

    auto param = [&](const char* key) -> std::string {
        auto it = params.find(key);
        return it == params.end() ? std::string() : it->second;
    };

    try {
        const auto& query = pipeline_.query();

        if (method == "GET" && path == "/metrics") {
            Response r;
            r.content_type = "text/plain; version=0.0.4";
            r.body = exporter_.to_prometheus(query.metrics());
            return r;
        }

        if (method == "GET" && path == "/state") {
            const std::string src = param("source");
            if (src.empty()) return error_response(400, "source is required");
            json::object o = to_json(query.state(parse_source_id(src)));
            o["tracked"] = query.tracked(parse_source_id(src));
            return json_response(200, o);
        }

        if (method == "GET" && path == "/verdicts") {
            const std::string src = param("source");
            if (src.empty()) return error_response(400, "source is required");
            size_t limit = 10;
            const std::string l = param("limit");
            if (!l.empty()) {
                char* end = nullptr;
                unsigned long v = std::strtoul(l.c_str(), &end, 10);
                if (end == l.c_str() || *end != '\0') return error_response(400, "bad limit");
                limit = static_cast<size_t>(v);
            }
            json::array arr;
            for (const auto& v : query.verdicts(parse_source_id(src), limit)) {
                arr.push_back(to_json(v));
            }
            return json_response(200, arr);
        }

        if (method == "GET" && path == "/blocks") {
            json::array arr;
            for (const auto& s : query.blocked()) arr.push_back(to_json(s));
            return json_response(200, arr);
        }

        if (method == "GET" && path == "/alerts") {
            size_t limit = 50;
            const std::string l = param("limit");
            if (!l.empty()) {
                char* end = nullptr;
                unsigned long v = std::strtoul(l.c_str(), &end, 10);
                if (end == l.c_str() || *end != '\0') return error_response(400, "bad limit");
                limit = static_cast<size_t>(v);
            }
            json::array arr;
            for (const auto& a : query.alerts(limit)) arr.push_back(to_json(a));
            return json_response(200, arr);
        }

        if (method == "GET" && path == "/undelivered") {
            json::array arr;
            for (const auto& r : query.undelivered()) arr.push_back(to_json(r));
            return json_response(200, arr);
        }

        if (method == "POST" && path == "/block") {
            const std::string src = param("source");
            if (src.empty()) return error_response(400, "source is required");
            uint64_t minutes = 60;
            const std::string m = param("minutes");
            if (!m.empty()) {
                char* end = nullptr;
                minutes = std::strtoull(m.c_str(), &end, 10);
                if (end == m.c_str() || *end != '\0' || minutes == 0) {
                    return error_response(400, "bad minutes");
                }
            }
            const uint64_t max_minutes =
                std::max<uint64_t>(1, pipeline_.config().mitigation.max_block_ms / 60000);
            if (minutes > max_minutes) {
                return error_response(400, "minutes exceeds " + std::to_string(max_minutes));
            }
            auto out = pipeline_.manual_block(parse_source_id(src), minutes * 60000ULL,
                                              param("reason"));
            return json_response(200, to_json(out.state));
        }

        if (method == "POST" && path == "/unblock") {
            const std::string src = param("source");
            if (src.empty()) return error_response(400, "source is required");
            auto out = pipeline_.manual_unblock(parse_source_id(src));
            json::object o = to_json(out.state);
            o["changed"] = out.changed();
            return json_response(200, o);
        }
    } catch (const MalformedEventError& e) {
        return error_response(400, e.what());
    }

    return error_response(404, "no route for " + method + " " + path);
}

void QueryServer::run() {
    try {
        asio::io_context ioc;
        tcp::acceptor acceptor(ioc);
        tcp::endpoint ep(asio::ip::make_address(cfg_.bind), static_cast<uint16_t>(cfg_.port));
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        acceptor.non_blocking(true);

        std::cout << "[QUERY] Listening on " << cfg_.bind << ":" << cfg_.port << "\n";

        while (running_.load()) {
            tcp::socket socket(ioc);
            beast::error_code ec;
            acceptor.accept(socket, ec);

            if (ec == asio::error::would_block) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            if (ec) continue;

            try {
                beast::flat_buffer buffer;
                http::request<http::string_body> req;
                http::read(socket, buffer, req);

                Response r = handle(std::string(req.method_string()),
                                    std::string(req.target()));

                http::response<http::string_body> res;
                res.version(req.version());
                res.result(static_cast<http::status>(r.status));
                res.set(http::field::server, "shieldcore");
                res.set(http::field::content_type, r.content_type);
                res.body() = std::move(r.body);
                res.prepare_payload();
                http::write(socket, res);
            } catch (const std::exception& e) {
                std::cerr << "[QUERY] request failed: " << e.what() << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[QUERY] " << e.what() << "\n";
    }
}

} // namespace shieldcore::io
