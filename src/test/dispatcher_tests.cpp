#include "test/test_shieldcore.h"

#include "shieldcore/core/Errors.hpp"
#include "shieldcore/dispatch/CommandSink.hpp"
#include "shieldcore/dispatch/EventDispatcher.hpp"
#include "shieldcore/dispatch/Sinks.hpp"

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace shieldcore;
using namespace shieldcore::test;

namespace {

// Fails the first `failures` deliveries, then behaves like a MemorySink.
class FlakySink : public MemorySink {
public:
    FlakySink(std::string id, int failures) : MemorySink(std::move(id)), left_(failures) {}

    void deliver(const MitigationAction& a) override {
        attempts_++;
        if (left_-- > 0) throw DispatchFailure(id() + ": firewall unreachable");
        MemorySink::deliver(a);
    }
    void deliver(const AlertEvent& a) override {
        attempts_++;
        if (left_-- > 0) throw DispatchFailure(id() + ": pager unreachable");
        MemorySink::deliver(a);
    }

    int attempts() const { return attempts_.load(); }

private:
    std::atomic<int> left_;
    std::atomic<int> attempts_{0};
};

DispatchConfig dispatch_config(uint32_t attempts = 3) {
    DispatchConfig c;
    c.max_attempts = attempts;
    c.backoff_initial_ms = 1;
    c.backoff_max_ms = 4;
    c.undelivered_capacity = 2;
    return c;
}

MitigationAction block_action(const std::string& ip) {
    MitigationAction a;
    a.source = SourceId(ip);
    a.kind = ActionKind::BLOCK;
    a.reason = "3 consecutive verdicts >= 0.800";
    a.verdict_id = 7;
    a.issued_ns = 100;
    a.expires_ns = 200;
    return a;
}

AlertEvent alert(const std::string& ip, Severity sev) {
    AlertEvent a;
    a.source = SourceId(ip);
    a.severity = sev;
    a.summary = "blocked, score 0.950";
    a.score = 0.95;
    a.verdict_id = 7;
    a.ts_ns = 100;
    return a;
}

} // namespace

BOOST_AUTO_TEST_SUITE(dispatcher_tests)

BOOST_AUTO_TEST_CASE(routes_by_stream_and_severity)
{
    MetricsRegistry m;
    EventDispatcher d(dispatch_config(), 16, m);
    auto firewall = std::make_shared<MemorySink>("firewall");
    auto pager = std::make_shared<MemorySink>("pager");
    auto audit = std::make_shared<MemorySink>("audit");
    d.add_sink(firewall, SinkStream::ACTIONS);
    d.add_sink(pager, SinkStream::ALERTS, Severity::HIGH);
    d.add_sink(audit);
    BOOST_CHECK_EQUAL(d.sink_count(), 3u);

    d.deliver(block_action("10.0.0.1"));
    d.deliver(alert("10.0.0.1", Severity::MEDIUM));
    d.deliver(alert("10.0.0.1", Severity::CRITICAL));

    BOOST_CHECK_EQUAL(firewall->actions().size(), 1u);
    BOOST_CHECK_EQUAL(firewall->alerts().size(), 0u);
    BOOST_CHECK_EQUAL(pager->actions().size(), 0u);
    BOOST_REQUIRE_EQUAL(pager->alerts().size(), 1u);
    BOOST_CHECK(pager->alerts()[0].severity == Severity::CRITICAL);
    BOOST_CHECK_EQUAL(audit->actions().size(), 1u);
    BOOST_CHECK_EQUAL(audit->alerts().size(), 2u);
    BOOST_CHECK_EQUAL(m.snapshot().dispatch_delivered, 5u);
}

BOOST_AUTO_TEST_CASE(transient_failure_is_retried)
{
    MetricsRegistry m;
    EventDispatcher d(dispatch_config(3), 16, m);
    auto flaky = std::make_shared<FlakySink>("firewall", 2);
    d.add_sink(flaky);

    d.deliver(block_action("10.0.0.2"));
    BOOST_CHECK_EQUAL(flaky->attempts(), 3);
    BOOST_CHECK_EQUAL(flaky->actions().size(), 1u);
    BOOST_CHECK(d.undelivered().empty());
    BOOST_CHECK_EQUAL(m.snapshot().dispatch_retries, 2u);
}

BOOST_AUTO_TEST_CASE(exhausted_retries_are_recorded_not_dropped)
{
    MetricsRegistry m;
    EventDispatcher d(dispatch_config(2), 16, m);
    auto dead = std::make_shared<FlakySink>("firewall", 1000);
    auto ok = std::make_shared<MemorySink>("audit");
    d.add_sink(dead);
    d.add_sink(ok);

    d.deliver(block_action("10.0.0.3"));
    BOOST_CHECK_EQUAL(dead->attempts(), 2);
    // one broken sink does not keep the event from the others
    BOOST_CHECK_EQUAL(ok->actions().size(), 1u);

    auto und = d.undelivered();
    BOOST_REQUIRE_EQUAL(und.size(), 1u);
    BOOST_CHECK_EQUAL(und[0].sink, "firewall");
    BOOST_CHECK_EQUAL(und[0].event, "block 10.0.0.3");
    BOOST_CHECK(und[0].source == SourceId("10.0.0.3"));
    BOOST_CHECK_EQUAL(und[0].attempts, 2u);
    BOOST_CHECK(und[0].error.find("unreachable") != std::string::npos);
    BOOST_CHECK_EQUAL(m.snapshot().dispatch_undelivered, 1u);

    // bounded: oldest records go first
    d.deliver(block_action("10.0.0.4"));
    d.deliver(block_action("10.0.0.5"));
    und = d.undelivered();
    BOOST_REQUIRE_EQUAL(und.size(), 2u);
    BOOST_CHECK(und[0].source == SourceId("10.0.0.4"));
    BOOST_CHECK(und[1].source == SourceId("10.0.0.5"));
}

BOOST_AUTO_TEST_CASE(worker_drains_queue_on_stop)
{
    EventDispatcher d(dispatch_config(), 4);
    auto sink = std::make_shared<MemorySink>();
    d.add_sink(sink);
    d.start();
    BOOST_CHECK_THROW(d.add_sink(std::make_shared<MemorySink>("late")), ConfigError);

    for (int i = 0; i < 20; ++i) {
        BOOST_CHECK(d.dispatch(block_action("10.0.1." + std::to_string(i))));
    }
    d.stop();
    BOOST_CHECK_EQUAL(sink->actions().size(), 20u);

    auto actions = sink->actions();
    for (int i = 0; i < 20; ++i) {
        BOOST_CHECK(actions[static_cast<size_t>(i)].source == SourceId("10.0.1." + std::to_string(i)));
    }
    BOOST_CHECK(!d.dispatch(block_action("10.0.2.1")));
}

BOOST_AUTO_TEST_CASE(dead_alert_sink_does_not_hold_back_actions)
{
    DispatchConfig c = dispatch_config(4);
    c.backoff_initial_ms = 20;
    c.backoff_max_ms = 40;
    c.undelivered_capacity = 16;
    EventDispatcher d(c, 16);
    auto pager = std::make_shared<FlakySink>("pager", 1000);
    auto firewall = std::make_shared<MemorySink>("firewall");
    d.add_sink(pager, SinkStream::ALERTS);
    d.add_sink(firewall, SinkStream::ACTIONS);
    d.start();

    for (int i = 0; i < 3; ++i) {
        BOOST_CHECK(d.dispatch(alert("10.0.3." + std::to_string(i), Severity::HIGH)));
    }
    const auto t0 = std::chrono::steady_clock::now();
    BOOST_CHECK(d.dispatch(block_action("10.0.3.9")));

    // each dead alert costs 100ms of backoff; the block must not wait behind them
    bool delivered = false;
    while (std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(250)) {
        if (firewall->actions().size() == 1) {
            delivered = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    BOOST_CHECK(delivered);
    BOOST_CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(90));
    BOOST_CHECK_LT(pager->attempts(), 12);

    d.stop();
    BOOST_CHECK_EQUAL(pager->attempts(), 12);
    BOOST_CHECK_EQUAL(d.undelivered().size(), 3u);
}

BOOST_AUTO_TEST_CASE(full_alert_queue_sheds_instead_of_blocking)
{
    DispatchConfig c = dispatch_config(3);
    c.backoff_initial_ms = 50;
    c.backoff_max_ms = 50;
    c.undelivered_capacity = 16;
    MetricsRegistry m;
    EventDispatcher d(c, 1, m);
    auto pager = std::make_shared<FlakySink>("pager", 1000);
    d.add_sink(pager, SinkStream::ALERTS);
    d.start();

    const auto t0 = std::chrono::steady_clock::now();
    for (int i = 0; i < 5; ++i) {
        BOOST_CHECK(d.dispatch(alert("10.0.4." + std::to_string(i), Severity::HIGH)));
    }
    BOOST_CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(50));

    size_t shed = 0;
    for (const auto& u : d.undelivered()) {
        if (u.error == "sink queue full") {
            BOOST_CHECK_EQUAL(u.attempts, 0u);
            ++shed;
        }
    }
    BOOST_CHECK_GE(shed, 3u);

    d.stop();
    BOOST_CHECK_EQUAL(d.undelivered().size(), 5u);
    BOOST_CHECK_EQUAL(m.snapshot().dispatch_undelivered, 5u);
}

BOOST_AUTO_TEST_CASE(null_sink_rejected)
{
    EventDispatcher d(dispatch_config(), 4);
    BOOST_CHECK_THROW(d.add_sink(nullptr), ConfigError);
}

BOOST_AUTO_TEST_CASE(describe_and_csv)
{
    BOOST_CHECK_EQUAL(describe(block_action("10.0.0.1")), "block 10.0.0.1");
    BOOST_CHECK_EQUAL(describe(alert("10.0.0.1", Severity::HIGH)), "alert high 10.0.0.1");

    BOOST_CHECK_EQUAL(to_csv(block_action("10.0.0.1")),
                      "100,action,block,10.0.0.1,200,7,3 consecutive verdicts >= 0.800");

    AlertEvent a = alert("10.0.0.1", Severity::CRITICAL);
    a.summary = "relapse, re-blocked \"hard\"";
    BOOST_CHECK_EQUAL(to_csv(a),
                      "100,alert,critical,10.0.0.1,0.9500,7,\"relapse, re-blocked \"\"hard\"\"\"");
}

BOOST_AUTO_TEST_CASE(log_file_sink_appends_lines)
{
    TempDir dir;
    const std::string path = dir.file("nested/actions.csv");
    LogFileSink sink("actions_log", path);
    sink.deliver(block_action("10.0.0.1"));
    sink.deliver(alert("10.0.0.2", Severity::LOW));

    std::ifstream in(path);
    std::string l1, l2, l3;
    BOOST_REQUIRE(std::getline(in, l1));
    BOOST_REQUIRE(std::getline(in, l2));
    BOOST_CHECK(!std::getline(in, l3));
    BOOST_CHECK(l1.find(",action,block,10.0.0.1,") != std::string::npos);
    BOOST_CHECK(l2.find(",alert,low,10.0.0.2,") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(log_file_sink_failure_throws)
{
    TempDir dir;
    // a directory cannot be opened for append
    LogFileSink sink("broken", dir.path.string());
    BOOST_CHECK_THROW(sink.deliver(block_action("10.0.0.1")), DispatchFailure);
}

BOOST_AUTO_TEST_CASE(command_sink_runs_block_and_unblock_without_a_shell)
{
    TempDir dir;
    const std::string blocked = dir.file("blocked");
    const std::string released = dir.file("released");
    std::filesystem::create_directories(blocked);
    std::filesystem::create_directories(released);

    CommandSink fw("firewall", "touch " + blocked + "/{ip}", "touch " + released + "/{ip}");

    auto argv = fw.argv_for(ActionKind::BLOCK, "10.0.5.1");
    BOOST_REQUIRE_EQUAL(argv.size(), 2u);
    BOOST_CHECK_EQUAL(argv[0], "touch");
    BOOST_CHECK_EQUAL(argv[1], blocked + "/10.0.5.1");
    BOOST_CHECK(fw.argv_for(ActionKind::WATCH, "10.0.5.1").empty());

    MitigationAction a = block_action("10.0.5.1");
    a.source.port = 443;
    fw.deliver(a);
    BOOST_CHECK(std::filesystem::exists(blocked + "/10.0.5.1"));
    BOOST_CHECK(!std::filesystem::exists(released + "/10.0.5.1"));

    a.kind = ActionKind::UNBLOCK;
    fw.deliver(a);
    BOOST_CHECK(std::filesystem::exists(released + "/10.0.5.1"));

    a.kind = ActionKind::WATCH;
    fw.deliver(a);
    fw.deliver(alert("10.0.5.1", Severity::CRITICAL));
    BOOST_CHECK_EQUAL(std::distance(std::filesystem::directory_iterator(blocked),
                                    std::filesystem::directory_iterator()), 1);

    // metacharacters reach the program as plain argv, nothing interprets them
    CommandSink literal("firewall", "touch " + blocked + "/{ip};x", "true");
    literal.deliver(block_action("10.0.5.2"));
    BOOST_CHECK(std::filesystem::exists(blocked + "/10.0.5.2;x"));
}

BOOST_AUTO_TEST_CASE(command_sink_failures_are_retried_then_recorded)
{
    CommandSink failing("firewall", "false {ip}", "true");
    BOOST_CHECK_THROW(failing.deliver(block_action("10.0.6.1")), DispatchFailure);

    CommandSink missing("firewall", "/nonexistent/shieldcore-fw {ip}", "true");
    BOOST_CHECK_THROW(missing.deliver(block_action("10.0.6.1")), DispatchFailure);

    CommandSink slow("firewall", "sleep 5", "true", 50);
    const auto t0 = std::chrono::steady_clock::now();
    BOOST_CHECK_THROW(slow.deliver(block_action("10.0.6.1")), DispatchFailure);
    BOOST_CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(2));

    BOOST_CHECK_THROW(CommandSink("firewall", "  ", "true"), ConfigError);

    EventDispatcher d(dispatch_config(2), 4);
    d.add_sink(std::make_shared<CommandSink>("firewall", "false {ip}", "true"),
               SinkStream::ACTIONS);
    d.deliver(block_action("10.0.6.2"));
    auto und = d.undelivered();
    BOOST_REQUIRE_EQUAL(und.size(), 1u);
    BOOST_CHECK_EQUAL(und[0].attempts, 2u);
    BOOST_CHECK(und[0].error.find("exited with 1") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
