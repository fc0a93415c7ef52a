#include "test/test_shieldcore.h"

#include "shieldcore/core/Clock.hpp"
#include "shieldcore/core/Errors.hpp"
#include "shieldcore/dispatch/Sinks.hpp"
#include "shieldcore/runtime/Pipeline.hpp"

#include <boost/test/unit_test.hpp>

#include <thread>

using namespace shieldcore;
using namespace shieldcore::test;

namespace {

struct PipelineFixture {
    PipelineFixture() : cfg(load_engine_config_file(dir.write("engine.ini", engine_ini(dir)))) {}

    std::unique_ptr<Pipeline> make(MetricsRegistry& m) {
        auto p = std::make_unique<Pipeline>(cfg, ModelRegistry::from_config(cfg.scoring), m);
        p->dispatcher().add_sink(sink);
        return p;
    }

    // One second of SYN flood: 3000 packets, every one with SYN set.
    static FlowEvent flood(const std::string& ip, uint64_t ts) {
        FlowEvent ev = make_flow(ip, ts, 40000, 80, Protocol::TCP, 3000, 180000);
        ev.syn = 3000;
        return ev;
    }

    template<typename Pred>
    static bool wait_for(Pred pred, std::chrono::milliseconds limit) {
        const auto until = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < until) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    TempDir dir;
    EngineConfig cfg;
    std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>("memory");
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(pipeline_tests, PipelineFixture)

BOOST_AUTO_TEST_CASE(sustained_flood_is_blocked_end_to_end)
{
    MetricsRegistry m;
    auto p = make(m);
    p->start();
    BOOST_CHECK(p->running());

    const SourceId attacker("203.0.113.66");
    const uint64_t base = (infra::now_ns() / kSec - 10) * kSec;
    BOOST_CHECK(p->submit(flood(attacker.ip, base + kSec / 2)) == IngestResult::ACCEPTED);
    BOOST_CHECK(p->submit(flood(attacker.ip, base + 3 * kSec / 2)) == IngestResult::ACCEPTED);

    // background traffic from another host stays Observing
    BOOST_CHECK(p->submit(make_flow("198.51.100.20", base + kSec / 2)) == IngestResult::ACCEPTED);

    p->stop();
    BOOST_CHECK(!p->running());

    size_t blocks = 0, watches = 0;
    for (const auto& a : sink->actions()) {
        BOOST_CHECK(a.source == attacker);
        if (a.kind == ActionKind::BLOCK) ++blocks;
        if (a.kind == ActionKind::WATCH) ++watches;
    }
    BOOST_CHECK_EQUAL(watches, 1u);
    BOOST_CHECK_EQUAL(blocks, 1u);

    auto alerts = sink->alerts();
    BOOST_REQUIRE_EQUAL(alerts.size(), 2u);
    BOOST_CHECK(alerts[0].severity == Severity::MEDIUM);
    BOOST_CHECK(alerts[1].severity == Severity::HIGH);
    BOOST_REQUIRE(alerts[1].explanation);
    BOOST_CHECK(alerts[1].explanation->available);

    const auto& q = p->query();
    BOOST_CHECK(q.state(attacker).state == MitigationState::BLOCKED);
    BOOST_CHECK(q.state(SourceId("198.51.100.20")).state == MitigationState::OBSERVING);
    BOOST_REQUIRE_EQUAL(q.blocked().size(), 1u);

    auto recent_alerts = q.alerts(10);
    BOOST_REQUIRE_EQUAL(recent_alerts.size(), 2u);
    BOOST_CHECK(recent_alerts[0].severity == Severity::HIGH);
    BOOST_CHECK(recent_alerts[1].severity == Severity::MEDIUM);
    BOOST_CHECK_EQUAL(q.alerts(1).size(), 1u);

    auto verdicts = q.verdicts(attacker, 10);
    BOOST_REQUIRE_EQUAL(verdicts.size(), 2u);
    BOOST_CHECK_GE(verdicts[0].score, 0.8);
    BOOST_CHECK_GT(verdicts[0].ts_ns, verdicts[1].ts_ns);

    const auto snap = m.snapshot();
    BOOST_CHECK_EQUAL(snap.events_accepted, 3u);
    BOOST_CHECK_EQUAL(snap.vectors_emitted, 3u);
    BOOST_CHECK_EQUAL(snap.verdicts, 3u);
    BOOST_CHECK_EQUAL(snap.blocks, 1u);
}

BOOST_AUTO_TEST_CASE(replayed_flow_log_from_an_hour_ago_is_aggregated)
{
    cfg.pipeline.housekeeping_ms = 100;
    MetricsRegistry m;
    auto p = make(m);
    p->start();

    const std::string ip = "198.51.100.30";
    const uint64_t base = (infra::now_ns() / kSec - 3600) * kSec;
    for (uint64_t i = 0; i < 5; ++i) {
        BOOST_CHECK(p->submit(make_flow(ip, base + i * kSec / 10)) == IngestResult::ACCEPTED);
    }
    // several housekeeping ticks pass between the two batches
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    for (uint64_t i = 1; i <= 55; ++i) {
        BOOST_CHECK(p->submit(make_flow(ip, base + i * kSec)) == IngestResult::ACCEPTED);
    }
    p->stop();

    const auto snap = m.snapshot();
    BOOST_CHECK_EQUAL(snap.events_accepted, 60u);
    BOOST_CHECK_EQUAL(snap.events_malformed, 0u);
    BOOST_CHECK_EQUAL(snap.vectors_emitted, 56u);
}

BOOST_AUTO_TEST_CASE(windows_close_on_event_time)
{
    cfg.pipeline.housekeeping_ms = 50;
    cfg.aggregator.allowed_lateness_ms = 2000;
    MetricsRegistry m;
    auto p = make(m);
    p->start();

    const std::string ip = "198.51.100.31";
    const uint64_t base = (infra::now_ns() / kSec - 3600) * kSec;
    for (uint64_t i = 0; i < 10; ++i) {
        p->submit(make_flow(ip, base + i * kSec + kSec / 2));
    }

    // windows 0-8 were closed by their successors; window 9 stays open
    BOOST_CHECK(wait_for([&] { return m.snapshot().vectors_emitted == 9; },
                         std::chrono::milliseconds(1500)));

    // newest event at base+9.5s minus 2s of lateness puts the horizon at
    // base+7.5s: [base+3s, base+4s) is closed, [base+8s, base+9s) is not
    const std::string other = "198.51.100.32";
    p->submit(make_flow(other, base + 3 * kSec + kSec / 2));
    p->submit(make_flow(other, base + 8 * kSec + kSec / 4));
    p->stop();

    const auto snap = m.snapshot();
    BOOST_CHECK_EQUAL(snap.events_malformed, 1u);
    BOOST_CHECK_EQUAL(snap.vectors_emitted, 11u);
}

BOOST_AUTO_TEST_CASE(malformed_events_are_rejected_at_submit)
{
    MetricsRegistry m;
    auto p = make(m);
    p->start();
    BOOST_CHECK(p->submit(make_flow("not-an-ip", infra::now_ns())) == IngestResult::MALFORMED);
    BOOST_CHECK(p->submit(make_flow("10.0.0.1", 0)) == IngestResult::MALFORMED);
    p->stop();
    BOOST_CHECK_EQUAL(m.snapshot().events_malformed, 2u);
    BOOST_CHECK(sink->actions().empty());
}

BOOST_AUTO_TEST_CASE(full_ingest_queue_sheds_load)
{
    cfg.pipeline.ingest_queue = 2;
    MetricsRegistry m;
    auto p = make(m);

    // not started: nothing drains the queue
    const uint64_t now = infra::now_ns();
    BOOST_CHECK(p->submit(make_flow("10.0.0.1", now)) == IngestResult::ACCEPTED);
    BOOST_CHECK(p->submit(make_flow("10.0.0.2", now)) == IngestResult::ACCEPTED);
    BOOST_CHECK(p->submit(make_flow("10.0.0.3", now)) == IngestResult::BUSY);
    BOOST_CHECK_EQUAL(m.snapshot().events_busy, 1u);
    BOOST_CHECK_EQUAL(std::string(to_string(IngestResult::BUSY)), "busy");
}

BOOST_AUTO_TEST_CASE(manual_block_expires_through_timer)
{
    MetricsRegistry m;
    auto p = make(m);
    p->start();

    const SourceId target("192.0.2.44");
    auto o = p->manual_block(target, 200, "test");
    BOOST_CHECK(o.state.state == MitigationState::BLOCKED);

    const bool unblocked = wait_for([&] {
        for (const auto& a : sink->actions()) {
            if (a.kind == ActionKind::UNBLOCK && a.source == target) return true;
        }
        return false;
    }, std::chrono::milliseconds(3000));
    BOOST_CHECK(unblocked);
    BOOST_CHECK(p->query().state(target).state == MitigationState::RECOVERING);

    p->stop();
}

BOOST_AUTO_TEST_CASE(manual_unblock_starts_probation)
{
    MetricsRegistry m;
    auto p = make(m);
    p->start();

    const SourceId target("192.0.2.45");
    p->manual_block(target, 0, "");
    auto o = p->manual_unblock(target);
    BOOST_CHECK(o.state.state == MitigationState::RECOVERING);
    BOOST_CHECK(!p->manual_unblock(SourceId("192.0.2.46")).changed());
    p->stop();

    BOOST_REQUIRE_EQUAL(sink->actions().size(), 2u);
    BOOST_CHECK(sink->actions()[1].kind == ActionKind::UNBLOCK);
}

BOOST_AUTO_TEST_CASE(pipeline_requires_a_model)
{
    MetricsRegistry m;
    BOOST_CHECK_THROW({ Pipeline p(cfg, ModelRegistry(), m); }, ConfigError);
}

BOOST_AUTO_TEST_SUITE_END()
