#include "test/test_shieldcore.h"

#include "shieldcore/core/Clock.hpp"
#include "shieldcore/mitigation/MitigationStateMachine.hpp"

#include <boost/asio/io_context.hpp>

#include <boost/test/unit_test.hpp>

using namespace shieldcore;
using namespace shieldcore::test;

namespace {

constexpr uint64_t T = 1000 * kSec;
const SourceId kSrc("198.51.100.7");

struct MachineFixture {
    explicit MachineFixture(MitigationConfig c = mitigation_config(0.5, 0.8, 2, 3, 60000))
        : cfg(c),
          store(cfg.max_tracked_identities, cfg.shards, m),
          sm(cfg, store, &timers, m) {}

    MitigationOutcome verdict(double score, uint64_t ts, uint64_t id = 1) {
        return sm.on_verdict(make_verdict(kSrc, score, ts, id));
    }

    MitigationState state() const {
        auto s = store.find(kSrc);
        return s ? s->state : MitigationState::OBSERVING;
    }

    MitigationConfig cfg;
    MetricsRegistry m;
    StateStore store;
    RecordingTimers timers;
    MitigationStateMachine sm;
};

size_t count_actions(const MitigationOutcome& o, ActionKind k) {
    size_t n = 0;
    for (const auto& a : o.actions) n += a.kind == k ? 1 : 0;
    return n;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(mitigation_tests, MachineFixture)

BOOST_AUTO_TEST_CASE(observing_to_suspicious_emits_watch_and_medium_alert)
{
    auto o = verdict(0.6, T);
    BOOST_CHECK(o.state.state == MitigationState::SUSPICIOUS);
    BOOST_REQUIRE_EQUAL(o.transitions.size(), 1u);
    BOOST_CHECK(o.transitions[0].from == MitigationState::OBSERVING);
    BOOST_CHECK_EQUAL(count_actions(o, ActionKind::WATCH), 1u);
    BOOST_REQUIRE_EQUAL(o.alerts.size(), 1u);
    BOOST_CHECK(o.alerts[0].severity == Severity::MEDIUM);
    BOOST_CHECK_EQUAL(o.state.generation, 1u);
}

BOOST_AUTO_TEST_CASE(low_scores_leave_observing_untouched)
{
    auto o = verdict(0.2, T);
    BOOST_CHECK(!o.changed());
    BOOST_CHECK(o.actions.empty());
    BOOST_CHECK(o.alerts.empty());
    BOOST_CHECK(state() == MitigationState::OBSERVING);
}

BOOST_AUTO_TEST_CASE(consecutive_high_verdicts_block_exactly_once)
{
    size_t blocks = 0;
    std::vector<MitigationOutcome> outs;
    for (uint64_t i = 0; i < 3; ++i) {
        outs.push_back(verdict(0.95, T + i * 10 * kSec, i + 1));
        blocks += count_actions(outs.back(), ActionKind::BLOCK);
    }
    BOOST_CHECK(outs[0].state.state == MitigationState::SUSPICIOUS);
    BOOST_CHECK(outs[1].state.state == MitigationState::BLOCKED);
    BOOST_CHECK(!outs[2].changed());
    BOOST_CHECK_EQUAL(blocks, 1u);

    const auto& block = outs[1].actions[0];
    BOOST_CHECK(block.kind == ActionKind::BLOCK);
    BOOST_CHECK_EQUAL(block.verdict_id, 2u);
    BOOST_CHECK_EQUAL(block.expires_ns, T + 10 * kSec + 60 * kSec);
    BOOST_REQUIRE_EQUAL(outs[1].alerts.size(), 1u);
    BOOST_CHECK(outs[1].alerts[0].severity == Severity::HIGH);

    auto armed = timers.armed();
    BOOST_REQUIRE_EQUAL(armed.size(), 1u);
    BOOST_CHECK(armed[0].kind == TimerKind::BLOCK_EXPIRY);
    BOOST_CHECK_EQUAL(armed[0].generation, outs[1].state.generation);
    BOOST_CHECK_EQUAL(armed[0].due_ns, block.expires_ns);
}

BOOST_AUTO_TEST_CASE(score_between_thresholds_resets_the_block_streak)
{
    verdict(0.9, T);                            // suspicious, streak 1
    verdict(0.6, T + 10 * kSec);                // reset
    auto o = verdict(0.9, T + 20 * kSec);       // streak 1 again
    BOOST_CHECK(o.state.state == MitigationState::SUSPICIOUS);
    BOOST_CHECK_EQUAL(o.state.block_streak, 1u);
    o = verdict(0.9, T + 30 * kSec);
    BOOST_CHECK(o.state.state == MitigationState::BLOCKED);
}

BOOST_AUTO_TEST_CASE(clean_verdicts_return_suspicious_to_observing)
{
    verdict(0.6, T);
    verdict(0.1, T + 10 * kSec);
    verdict(0.1, T + 20 * kSec);
    BOOST_CHECK(state() == MitigationState::SUSPICIOUS);
    auto o = verdict(0.1, T + 30 * kSec);
    BOOST_CHECK(o.state.state == MitigationState::OBSERVING);
    BOOST_CHECK(o.actions.empty());
    BOOST_CHECK(o.alerts.empty());
}

BOOST_AUTO_TEST_CASE(block_expiry_timer_then_relapse_doubles_duration)
{
    verdict(0.9, T);
    auto blocked = verdict(0.9, T + 1 * kSec);
    BOOST_REQUIRE(blocked.state.state == MitigationState::BLOCKED);
    const uint64_t t_block = T + 1 * kSec;
    BOOST_CHECK_EQUAL(blocked.state.offense_level, 1u);

    auto expired = sm.on_timer(kSrc, blocked.state.generation, TimerKind::BLOCK_EXPIRY,
                               t_block + 60 * kSec);
    BOOST_CHECK(!expired.stale);
    BOOST_CHECK(expired.state.state == MitigationState::RECOVERING);
    BOOST_CHECK_EQUAL(count_actions(expired, ActionKind::UNBLOCK), 1u);
    BOOST_CHECK(expired.alerts.empty());
    BOOST_CHECK_EQUAL(expired.state.probation_expires_ns, t_block + 60 * kSec + 30 * kSec);
    BOOST_CHECK(timers.armed().at(0).kind == TimerKind::PROBATION_EXPIRY);

    auto relapse = verdict(0.9, t_block + 65 * kSec, 9);
    BOOST_CHECK(relapse.state.state == MitigationState::BLOCKED);
    BOOST_REQUIRE_EQUAL(relapse.actions.size(), 1u);
    BOOST_CHECK_EQUAL(relapse.actions[0].expires_ns, t_block + 65 * kSec + 120 * kSec);
    BOOST_REQUIRE_EQUAL(relapse.alerts.size(), 1u);
    BOOST_CHECK(relapse.alerts[0].severity == Severity::CRITICAL);
    BOOST_CHECK_EQUAL(relapse.state.offense_level, 2u);
}

BOOST_AUTO_TEST_CASE(expiry_is_applied_lazily_when_the_timer_has_not_fired)
{
    verdict(0.9, T);
    verdict(0.9, T + 1 * kSec);
    const uint64_t t_block = T + 1 * kSec;

    auto o = verdict(0.9, t_block + 65 * kSec);
    BOOST_REQUIRE_EQUAL(o.transitions.size(), 2u);
    BOOST_CHECK(o.transitions[0].to == MitigationState::RECOVERING);
    BOOST_CHECK_EQUAL(o.transitions[0].ts_ns, t_block + 60 * kSec);
    BOOST_CHECK(o.transitions[1].to == MitigationState::BLOCKED);
    BOOST_CHECK_EQUAL(count_actions(o, ActionKind::UNBLOCK), 1u);
    BOOST_CHECK_EQUAL(count_actions(o, ActionKind::BLOCK), 1u);
    BOOST_CHECK(o.alerts.at(0).severity == Severity::CRITICAL);
}

BOOST_AUTO_TEST_CASE(clean_probation_resets_offense_level)
{
    verdict(0.9, T);
    auto b = verdict(0.9, T + 1 * kSec);
    auto r = sm.on_timer(kSrc, b.state.generation, TimerKind::BLOCK_EXPIRY, T + 61 * kSec);
    BOOST_REQUIRE(r.state.state == MitigationState::RECOVERING);

    // clean traffic during probation changes nothing
    BOOST_CHECK(!verdict(0.1, T + 70 * kSec).changed());

    auto o = sm.on_timer(kSrc, r.state.generation, TimerKind::PROBATION_EXPIRY, T + 91 * kSec);
    BOOST_CHECK(o.state.state == MitigationState::OBSERVING);
    BOOST_CHECK_EQUAL(o.state.offense_level, 0u);
    BOOST_CHECK(o.actions.empty());
    BOOST_CHECK_EQUAL(timers.pending(), 0u);

    // next offense starts from the base duration again
    verdict(0.9, T + 200 * kSec);
    auto again = verdict(0.9, T + 201 * kSec);
    BOOST_CHECK_EQUAL(again.actions.at(0).expires_ns, T + 201 * kSec + 60 * kSec);
}

BOOST_AUTO_TEST_CASE(stale_timer_is_a_no_op)
{
    verdict(0.9, T);
    auto b = verdict(0.9, T + 1 * kSec);
    sm.manual_unblock(kSrc, T + 5 * kSec);

    auto o = sm.on_timer(kSrc, b.state.generation, TimerKind::BLOCK_EXPIRY, T + 61 * kSec);
    BOOST_CHECK(o.stale);
    BOOST_CHECK(!o.changed());
    BOOST_CHECK(state() == MitigationState::RECOVERING);
    BOOST_CHECK_EQUAL(m.snapshot().stale_timers, 1u);

    auto gone = sm.on_timer(SourceId("192.0.2.1"), 1, TimerKind::BLOCK_EXPIRY, T);
    BOOST_CHECK(gone.stale);
}

BOOST_AUTO_TEST_CASE(block_duration_backoff_is_capped)
{
    BOOST_CHECK_EQUAL(sm.block_duration_ns(0), 60 * kSec);
    BOOST_CHECK_EQUAL(sm.block_duration_ns(1), 120 * kSec);
    BOOST_CHECK_EQUAL(sm.block_duration_ns(3), 480 * kSec);
    BOOST_CHECK_EQUAL(sm.block_duration_ns(10), 16 * 60 * kSec);
}

BOOST_AUTO_TEST_CASE(manual_block_and_unblock)
{
    auto o = sm.manual_block(kSrc, 5000, "operator", T);
    BOOST_CHECK(o.state.state == MitigationState::BLOCKED);
    BOOST_CHECK_EQUAL(o.actions.at(0).expires_ns, T + 5 * kSec);
    BOOST_CHECK_EQUAL(o.actions.at(0).reason, "manual block: operator");
    BOOST_CHECK(o.alerts.at(0).severity == Severity::HIGH);

    // re-block while blocked extends
    o = sm.manual_block(kSrc, 0, "", T + 1 * kSec);
    BOOST_CHECK(o.state.state == MitigationState::BLOCKED);
    BOOST_CHECK_EQUAL(o.actions.at(0).expires_ns, T + 1 * kSec + 120 * kSec);

    o = sm.manual_unblock(kSrc, T + 2 * kSec);
    BOOST_CHECK(o.state.state == MitigationState::RECOVERING);
    BOOST_CHECK_EQUAL(count_actions(o, ActionKind::UNBLOCK), 1u);

    // unblocking anything not blocked does nothing
    BOOST_CHECK(!sm.manual_unblock(kSrc, T + 3 * kSec).changed());
    BOOST_CHECK(!sm.manual_unblock(SourceId("192.0.2.99"), T).changed());
}

BOOST_AUTO_TEST_CASE(idle_sources_are_forgotten_but_blocks_survive)
{
    verdict(0.6, T);                                        // suspicious
    sm.manual_block(SourceId("192.0.2.50"), 0, "", T);      // blocked

    const uint64_t later = T + 601 * kSec;
    BOOST_CHECK_EQUAL(sm.evict_idle(later), 1u);
    BOOST_CHECK(!store.find(kSrc));
    BOOST_CHECK(store.find(SourceId("192.0.2.50")));

    auto o = verdict(0.1, later);
    BOOST_CHECK(o.state.state == MitigationState::OBSERVING);
    BOOST_CHECK_EQUAL(o.state.generation, 0u);
}

BOOST_AUTO_TEST_CASE(capacity_eviction_cancels_the_evicted_timer)
{
    boost::asio::io_context io;
    AsioTimerService asio_timers(io);
    MetricsRegistry m2;
    StateStore tiny(1, 1, m2);
    MitigationStateMachine tight(mitigation_config(0.5, 0.8, 2, 3, 60000), tiny, &asio_timers, m2);
    asio_timers.set_handler([&](const SourceId& id, uint64_t gen, TimerKind kind, uint64_t now) {
        tight.on_timer(id, gen, kind, now);
    });

    const SourceId a("192.0.2.81");
    const SourceId b("192.0.2.82");

    // a reaches Recovering with a probation timer several generations in
    tight.manual_block(a, 60000, "", infra::now_ns());
    tight.manual_unblock(a, infra::now_ns());
    BOOST_CHECK_EQUAL(asio_timers.pending(), 1u);

    // b takes a's slot; a's probation timer goes with it
    tight.on_verdict(make_verdict(b, 0.1, infra::now_ns()));
    BOOST_CHECK(!tiny.find(a));
    BOOST_CHECK_EQUAL(asio_timers.pending(), 0u);

    // a comes back at generation 0 and its short block still expires
    auto o = tight.manual_block(a, 100, "", infra::now_ns());
    BOOST_CHECK(o.state.state == MitigationState::BLOCKED);
    BOOST_CHECK_EQUAL(asio_timers.pending(), 1u);

    io.run_for(std::chrono::milliseconds(400));
    BOOST_REQUIRE(tiny.find(a));
    BOOST_CHECK(tiny.find(a)->state == MitigationState::RECOVERING);
    BOOST_CHECK_EQUAL(m2.snapshot().stale_timers, 0u);
    asio_timers.cancel_all();
}

BOOST_AUTO_TEST_CASE(works_without_a_timer_service)
{
    StateStore s2(16, 1);
    MitigationStateMachine bare(mitigation_config(0.5, 0.8, 1, 1, 1000), s2);
    bare.on_verdict(make_verdict(kSrc, 0.9, T));
    auto o = bare.on_verdict(make_verdict(kSrc, 0.9, T + kSec / 2));
    BOOST_CHECK(o.state.state == MitigationState::BLOCKED);
    o = bare.on_verdict(make_verdict(kSrc, 0.1, T + 2 * kSec));
    BOOST_CHECK(o.state.state == MitigationState::RECOVERING);
}

BOOST_AUTO_TEST_SUITE_END()
