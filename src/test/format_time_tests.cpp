#include "test/test_yieldguard.h"
#include "ledger/Format.hpp"
#include "ledger/Time.hpp"
#include "runtime/Reports.hpp"

#include <boost/test/unit_test.hpp>

using namespace yieldguard;
using namespace yieldguard_test;

BOOST_AUTO_TEST_SUITE(format_time_tests)

BOOST_AUTO_TEST_CASE(usd_formatting)
{
    BOOST_CHECK_EQUAL(format_usd(0.0), "$0.00");
    BOOST_CHECK_EQUAL(format_usd(12.0), "$12.00");
    BOOST_CHECK_EQUAL(format_usd(1234.567), "$1,234.57");
    BOOST_CHECK_EQUAL(format_usd(1234567.0), "$1,234,567.00");
    BOOST_CHECK_EQUAL(format_usd(-12.0), "-$12.00");
    BOOST_CHECK_EQUAL(format_usd(-0.004), "$0.00");
    BOOST_CHECK_EQUAL(format_fixed(4.0, 2), "4.00");
    BOOST_CHECK_EQUAL(format_fixed(2.26, 1), "2.3");
}

BOOST_AUTO_TEST_CASE(utc_round_trip)
{
    Timestamp ts = parse_utc("2026-10-19T08:30:05Z");
    BOOST_CHECK_EQUAL(format_utc(ts), "2026-10-19T08:30:05Z");
    BOOST_CHECK_CLOSE(hours_between(t0(), t0() + std::chrono::minutes(90)), 1.5, 1e-9);
    BOOST_CHECK_THROW(parse_utc("yesterday"), ValidationError);
}

BOOST_AUTO_TEST_CASE(mode_labels)
{
    BOOST_CHECK_EQUAL(mode_label(SpendingMode::BALANCED), "Balanced (80%)");
    BOOST_CHECK_EQUAL(mode_label(SpendingMode::CONSERVATIVE), "Conservative (50%)");
    BOOST_CHECK_EQUAL(mode_label(SpendingMode::GROWTH), "Growth (30%)");
}

BOOST_AUTO_TEST_CASE(preview_report_wording)
{
    SpendPreview denied;
    denied.amount      = 100.0;
    denied.available   = 80.0;
    denied.shortfall   = 20.0;
    denied.days_needed = 2.0;
    std::string text = preview_report(denied);
    BOOST_CHECK(text.find("DENIED") != std::string::npos);
    BOOST_CHECK(text.find("Wait 2.0 days") != std::string::npos);

    denied.days_needed = -1.0;
    BOOST_CHECK(preview_report(denied).find("No yield accruing") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(budget_report_reserved_figure)
{
    LedgerSnapshot s;
    s.accrued_yield_usd    = 100.0;
    s.spent_from_yield_usd = 50.0;
    s.mode                 = SpendingMode::BALANCED;
    s.available_budget     = 40.0;
    s.total_daily_yield    = 2.0;

    std::string text = budget_report(s);
    BOOST_CHECK(text.find("Reserved:  $10.00") != std::string::npos);
    BOOST_CHECK(text.find("Weekly:  $14.00") != std::string::npos);
    BOOST_CHECK(text.find("Monthly: $60.00") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
