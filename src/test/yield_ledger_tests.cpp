/**
 * YieldLedger tests
 *
 *   1. Spend authorization scenarios (boundary, overage, negative budget)
 *   2. Mode switches
 *   3. Accrual: linearity, threshold, clock going backwards
 *   4. Input validation
 *   5. Concurrent callers
 *   6. Preview and snapshot
 */

#include "test/test_yieldguard.h"
#include "ledger/Format.hpp"
#include "ledger/YieldLedger.hpp"

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using namespace yieldguard;
using namespace yieldguard_test;
using namespace std::chrono;

BOOST_AUTO_TEST_SUITE(yield_ledger_tests)

// =============================================================================
// Spend authorization
// =============================================================================
BOOST_AUTO_TEST_CASE(spend_sequence_books_every_amount)
{
    YieldLedger ledger(1000.0, 100.0, SpendingMode::BALANCED, t0());
    BOOST_CHECK_CLOSE(ledger.available_budget(), 80.0, 1e-9);

    // Within budget
    AuthorizationResult a = ledger.authorize_and_record(50.0);
    BOOST_CHECK(a.within_budget);
    BOOST_CHECK_CLOSE(a.budget_before, 80.0, 1e-9);
    BOOST_CHECK_CLOSE(a.remaining, 30.0, 1e-9);
    BOOST_CHECK_EQUAL(ledger.spent_from_yield_usd(), 50.0);
    BOOST_CHECK_EQUAL(a.message, "Spent $50.00 from yield ($30.00 remaining)");

    // Exactly at the budget boundary
    AuthorizationResult b = ledger.authorize_and_record(40.0);
    BOOST_CHECK_CLOSE(b.budget_before, 40.0, 1e-9);
    BOOST_CHECK(b.within_budget);
    BOOST_CHECK_EQUAL(ledger.spent_from_yield_usd(), 90.0);

    // Over budget: reported, still booked
    AuthorizationResult c = ledger.authorize_and_record(20.0);
    BOOST_CHECK_CLOSE(c.budget_before, 8.0, 1e-9);
    BOOST_CHECK(!c.within_budget);
    BOOST_CHECK_CLOSE(c.overage, 12.0, 1e-9);
    BOOST_CHECK_EQUAL(ledger.spent_from_yield_usd(), 110.0);
    BOOST_CHECK_EQUAL(c.message, "Over budget by $12.00! This dips into principal.");

    // Principal never moves
    BOOST_CHECK_EQUAL(ledger.principal_usd(), 1000.0);
}

BOOST_AUTO_TEST_CASE(budget_goes_negative_after_overspend)
{
    YieldLedger ledger(1000.0, 100.0, SpendingMode::BALANCED, t0());
    ledger.authorize_and_record(110.0);
    BOOST_CHECK_CLOSE(ledger.available_budget(), -8.0, 1e-9);

    AuthorizationResult r = ledger.authorize_and_record(1.0);
    BOOST_CHECK(!r.within_budget);
    BOOST_CHECK_CLOSE(r.overage, 9.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(zero_spend_is_within_budget)
{
    YieldLedger ledger(1000.0, 0.0, SpendingMode::BALANCED, t0());
    AuthorizationResult r = ledger.authorize_and_record(0.0);
    BOOST_CHECK(r.within_budget);
    BOOST_CHECK_EQUAL(ledger.spent_from_yield_usd(), 0.0);
}

// =============================================================================
// Mode switches
// =============================================================================
BOOST_AUTO_TEST_CASE(mode_switch_changes_budget_only)
{
    YieldLedger ledger(1000.0, 100.0, SpendingMode::BALANCED, t0());
    ledger.authorize_and_record(50.0);
    BOOST_CHECK_CLOSE(ledger.available_budget(), 40.0, 1e-9);

    ledger.set_mode(SpendingMode::CONSERVATIVE);
    BOOST_CHECK_CLOSE(ledger.available_budget(), 25.0, 1e-9);
    BOOST_CHECK_EQUAL(ledger.accrued_yield_usd(), 100.0);
    BOOST_CHECK_EQUAL(ledger.spent_from_yield_usd(), 50.0);
    BOOST_CHECK(ledger.mode() == SpendingMode::CONSERVATIVE);

    ledger.set_mode(SpendingMode::GROWTH);
    BOOST_CHECK_CLOSE(ledger.available_budget(), 15.0, 1e-9);
}

// =============================================================================
// Accrual
// =============================================================================
BOOST_AUTO_TEST_CASE(accrual_is_linear_in_elapsed_time)
{
    // 36500 @ 10% = 10/day
    YieldLedger ledger(36500.0, 0.0, SpendingMode::BALANCED, t0());
    ledger.replace_sources(kSimulatedOrigin, {make_source("vault", kSimulatedOrigin, 36500.0, 10.0)});
    BOOST_CHECK_CLOSE(ledger.total_daily_yield(), 10.0, 1e-9);

    double added = ledger.accrue(t0() + hours(12));
    BOOST_CHECK_CLOSE(added, 5.0, 1e-9);
    BOOST_CHECK_CLOSE(ledger.accrued_yield_usd(), 5.0, 1e-9);

    ledger.accrue(t0() + hours(24));
    BOOST_CHECK_CLOSE(ledger.accrued_yield_usd(), 10.0, 1e-9);
    BOOST_CHECK(ledger.last_accrual_at() == t0() + hours(24));
}

BOOST_AUTO_TEST_CASE(accrual_split_matches_single_step)
{
    std::vector<YieldSource> src{make_source("a", kSimulatedOrigin, 10000.0, 5.0),
                                 make_source("b", kSimulatedOrigin, 2500.0, 8.0)};

    YieldLedger stepped(0.0, 0.0, SpendingMode::BALANCED, t0());
    YieldLedger single(0.0, 0.0, SpendingMode::BALANCED, t0());
    stepped.replace_sources(kSimulatedOrigin, src);
    single.replace_sources(kSimulatedOrigin, src);

    for (int h = 1; h <= 48; ++h) stepped.accrue(t0() + hours(h));
    single.accrue(t0() + hours(48));

    BOOST_CHECK_CLOSE(stepped.accrued_yield_usd(), single.accrued_yield_usd(), 1e-9);
}

BOOST_AUTO_TEST_CASE(accrual_below_threshold_is_noop)
{
    YieldLedger ledger(0.0, 0.0, SpendingMode::BALANCED, t0(), seconds(360));
    ledger.replace_sources(kSimulatedOrigin, {make_source("v", kSimulatedOrigin, 36500.0, 10.0)});

    BOOST_CHECK_EQUAL(ledger.accrue(t0() + seconds(359)), 0.0);
    BOOST_CHECK(ledger.last_accrual_at() == t0());

    // Repeated calls at the same instant add nothing further
    double first = ledger.accrue(t0() + seconds(360));
    BOOST_CHECK_GT(first, 0.0);
    BOOST_CHECK_EQUAL(ledger.accrue(t0() + seconds(360)), 0.0);
}

BOOST_AUTO_TEST_CASE(accrual_ignores_clock_going_backwards)
{
    YieldLedger ledger(0.0, 10.0, SpendingMode::BALANCED, t0());
    ledger.replace_sources(kSimulatedOrigin, {make_source("v", kSimulatedOrigin, 36500.0, 10.0)});

    BOOST_CHECK_EQUAL(ledger.accrue(t0() - hours(5)), 0.0);
    BOOST_CHECK_EQUAL(ledger.accrued_yield_usd(), 10.0);
    BOOST_CHECK(ledger.last_accrual_at() == t0());
}

BOOST_AUTO_TEST_CASE(accrual_without_sources_advances_mark)
{
    YieldLedger ledger(0.0, 3.0, SpendingMode::BALANCED, t0());
    BOOST_CHECK_EQUAL(ledger.accrue(t0() + hours(2)), 0.0);
    BOOST_CHECK_EQUAL(ledger.accrued_yield_usd(), 3.0);
    BOOST_CHECK(ledger.last_accrual_at() == t0() + hours(2));
}

// =============================================================================
// Validation
// =============================================================================
BOOST_AUTO_TEST_CASE(rejects_bad_amounts_without_mutation)
{
    YieldLedger ledger(1000.0, 100.0, SpendingMode::BALANCED, t0());

    BOOST_CHECK_THROW(ledger.authorize_and_record(-1.0), ValidationError);
    BOOST_CHECK_THROW(ledger.authorize_and_record(std::numeric_limits<double>::quiet_NaN()),
                      ValidationError);
    BOOST_CHECK_THROW(ledger.authorize_and_record(std::numeric_limits<double>::infinity()),
                      ValidationError);
    BOOST_CHECK_THROW(ledger.preview(-5.0), ValidationError);

    BOOST_CHECK_EQUAL(ledger.spent_from_yield_usd(), 0.0);
    BOOST_CHECK_CLOSE(ledger.available_budget(), 80.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(huge_amount_is_booked_and_reported)
{
    YieldLedger ledger(1000.0, 100.0, SpendingMode::BALANCED, t0());

    AuthorizationResult r = ledger.authorize_and_record(1e307);
    BOOST_CHECK(!r.within_budget);
    BOOST_CHECK_EQUAL(ledger.spent_from_yield_usd(), 1e307);
    BOOST_CHECK(r.message.find("Over budget by $") == 0);

    // A second one would overflow the total: refused, nothing booked
    BOOST_CHECK_THROW(ledger.authorize_and_record(std::numeric_limits<double>::max()),
                      ValidationError);
    BOOST_CHECK_EQUAL(ledger.spent_from_yield_usd(), 1e307);
}

BOOST_AUTO_TEST_CASE(format_usd_handles_extremes)
{
    BOOST_CHECK_EQUAL(format_usd(std::numeric_limits<double>::infinity()), "$inf");
    BOOST_CHECK_EQUAL(format_usd(-std::numeric_limits<double>::infinity()), "-$inf");
    BOOST_CHECK_EQUAL(format_usd(std::numeric_limits<double>::quiet_NaN()), "$nan");

    std::string big = format_usd(1e307);
    BOOST_CHECK_EQUAL(big.front(), '$');
    BOOST_CHECK(big.size() > 300);
    BOOST_CHECK_EQUAL(big.substr(big.size() - 3), ".00");
    BOOST_CHECK_EQUAL(format_usd(1e16), "$10,000,000,000,000,000.00");
}

BOOST_AUTO_TEST_CASE(rejects_bad_construction)
{
    BOOST_CHECK_THROW((void)YieldLedger(-1.0, 0.0, SpendingMode::BALANCED, t0()), ValidationError);
    BOOST_CHECK_THROW((void)YieldLedger(0.0, -1.0, SpendingMode::BALANCED, t0()), ValidationError);
}

BOOST_AUTO_TEST_CASE(failed_source_refresh_keeps_previous_sources)
{
    YieldLedger ledger(0.0, 0.0, SpendingMode::BALANCED, t0());
    ledger.replace_sources(kSimulatedOrigin, {make_source("v", kSimulatedOrigin, 36500.0, 10.0)});

    BOOST_CHECK_THROW(ledger.replace_sources(kSimulatedOrigin,
                                             {make_source("v", kSimulatedOrigin, -1.0, 10.0)}),
                      ValidationError);
    BOOST_CHECK_CLOSE(ledger.total_daily_yield(), 10.0, 1e-9);
}

// =============================================================================
// Concurrency
// =============================================================================
BOOST_AUTO_TEST_CASE(concurrent_spends_accrual_and_mode_switches_serialize)
{
    YieldLedger ledger(36500.0, 0.0, SpendingMode::BALANCED, t0(), seconds(0));
    ledger.replace_sources(kSimulatedOrigin, {make_source("v", kSimulatedOrigin, 36500.0, 24.0)});
    BOOST_REQUIRE_CLOSE(ledger.total_daily_yield(), 24.0, 1e-9);   // 1/hour

    const int kSpenders = 4;
    const int kSpendsEach = 500;
    const int kTicks = 600;

    std::atomic<bool> spenders_done{false};
    std::atomic<bool> went_backwards{false};

    std::thread ticker([&]() {
        double last_accrued = 0.0;
        double last_spent = 0.0;
        for (int i = 1; i <= kTicks || !spenders_done.load(); ++i) {
            ledger.accrue(t0() + minutes(i));
            ledger.set_mode(i % 2 ? SpendingMode::GROWTH : SpendingMode::BALANCED);
            ledger.replace_sources(kSimulatedOrigin,
                                   {make_source("v", kSimulatedOrigin, 36500.0, 24.0)});

            LedgerSnapshot snap = ledger.snapshot(t0() + minutes(i));
            if (snap.accrued_yield_usd < last_accrued || snap.spent_from_yield_usd < last_spent) {
                went_backwards = true;
            }
            last_accrued = snap.accrued_yield_usd;
            last_spent = snap.spent_from_yield_usd;
        }
    });

    std::vector<std::thread> spenders;
    for (int t = 0; t < kSpenders; ++t) {
        spenders.emplace_back([&]() {
            for (int i = 0; i < kSpendsEach; ++i) ledger.authorize_and_record(1.0);
        });
    }
    for (auto& th : spenders) th.join();
    spenders_done = true;
    ticker.join();

    BOOST_CHECK(!went_backwards.load());
    BOOST_CHECK_EQUAL(ledger.spent_from_yield_usd(), double(kSpenders * kSpendsEach));
    BOOST_CHECK(ledger.accrued_yield_usd() >= kTicks / 60.0 - 1e-9);
}

// =============================================================================
// Preview and snapshot
// =============================================================================
BOOST_AUTO_TEST_CASE(preview_books_nothing)
{
    YieldLedger ledger(36500.0, 100.0, SpendingMode::BALANCED, t0());
    ledger.replace_sources(kSimulatedOrigin, {make_source("v", kSimulatedOrigin, 36500.0, 10.0)});

    SpendPreview ok = ledger.preview(30.0);
    BOOST_CHECK(ok.approved);
    BOOST_CHECK_CLOSE(ok.remaining, 50.0, 1e-9);

    SpendPreview no = ledger.preview(100.0);
    BOOST_CHECK(!no.approved);
    BOOST_CHECK_CLOSE(no.shortfall, 20.0, 1e-9);
    BOOST_CHECK_CLOSE(no.days_needed, 2.0, 1e-9);   // 20 / 10 per day

    BOOST_CHECK_EQUAL(ledger.spent_from_yield_usd(), 0.0);
}

BOOST_AUTO_TEST_CASE(preview_without_yield_has_no_wait_estimate)
{
    YieldLedger ledger(0.0, 0.0, SpendingMode::BALANCED, t0());
    SpendPreview p = ledger.preview(10.0);
    BOOST_CHECK(!p.approved);
    BOOST_CHECK_LT(p.days_needed, 0.0);
}

BOOST_AUTO_TEST_CASE(snapshot_is_consistent_copy)
{
    YieldLedger ledger(1000.0, 100.0, SpendingMode::GROWTH, t0());
    ledger.replace_sources(kSimulatedOrigin, {make_source("v", kSimulatedOrigin, 3650.0, 10.0)});
    ledger.authorize_and_record(10.0);

    LedgerSnapshot s = ledger.snapshot(t0() + hours(1));
    BOOST_CHECK(s.taken_at == t0() + hours(1));
    BOOST_CHECK_EQUAL(s.principal_usd, 1000.0);
    BOOST_CHECK_EQUAL(s.accrued_yield_usd, 100.0);
    BOOST_CHECK_EQUAL(s.spent_from_yield_usd, 10.0);
    BOOST_CHECK(s.mode == SpendingMode::GROWTH);
    BOOST_CHECK_CLOSE(s.available_budget, 27.0, 1e-9);
    BOOST_CHECK_CLOSE(s.total_daily_yield, 1.0, 1e-9);
    BOOST_CHECK_EQUAL(s.sources.size(), 1u);
    BOOST_CHECK_CLOSE(s.net_yield(), 90.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(restore_totals_seeds_state)
{
    YieldLedger ledger(1000.0, 0.0, SpendingMode::BALANCED, t0());
    ledger.restore_totals(250.0, 75.0, SpendingMode::CONSERVATIVE);

    BOOST_CHECK_EQUAL(ledger.accrued_yield_usd(), 250.0);
    BOOST_CHECK_EQUAL(ledger.spent_from_yield_usd(), 75.0);
    BOOST_CHECK(ledger.mode() == SpendingMode::CONSERVATIVE);
    BOOST_CHECK_CLOSE(ledger.available_budget(), 87.5, 1e-9);

    BOOST_CHECK_THROW(ledger.restore_totals(-1.0, 0.0, SpendingMode::BALANCED), ValidationError);
}

BOOST_AUTO_TEST_SUITE_END()
