#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "ledger/SourceRegistry.hpp"
#include "ledger/SpendingMode.hpp"
#include "ledger/Time.hpp"
#include "ledger/YieldSource.hpp"

namespace yieldguard {

// Outcome of authorize_and_record(). The spend has already been booked
// whatever within_budget says.
struct AuthorizationResult {
    bool        within_budget{false};
    double      amount{0.0};
    double      budget_before{0.0};
    double      remaining{0.0};     // budget_before - amount, approved case
    double      overage{0.0};       // amount - budget_before, denied case
    std::string message;
};

// Read-only pre-authorization. Nothing is booked.
struct SpendPreview {
    bool   approved{false};
    double amount{0.0};
    double available{0.0};
    double remaining{0.0};
    double shortfall{0.0};
    double days_needed{-1.0};       // < 0 when there is no yield to wait for
};

// Consistent copy of the whole ledger, taken under the lock.
struct LedgerSnapshot {
    Timestamp    taken_at{};
    double       principal_usd{0.0};
    double       accrued_yield_usd{0.0};
    double       spent_from_yield_usd{0.0};
    SpendingMode mode{SpendingMode::BALANCED};
    Timestamp    last_accrual_at{};
    double       available_budget{0.0};
    double       total_daily_yield{0.0};
    std::vector<YieldSource> sources;

    double net_yield() const { return accrued_yield_usd - spent_from_yield_usd; }
};

// ---------------------------------------------------------------------------
// YieldLedger: principal / accrued / spent bookkeeping and spend authorization.
//
//   available_budget = (accrued - spent) * retention_fraction(mode)
//
// Accrued and spent only ever grow. Spending is always booked, even when it
// exceeds the budget: the transfer already happened on-chain, the ledger
// reports the overage instead of blocking it. The budget may go negative.
//
// THREADING: one mutex guards everything. All entry points are safe to call
//   from the driver thread and the operator console concurrently. Nothing
//   inside the lock does I/O; callers fetch collaborator data first and pass
//   plain values in.
// ---------------------------------------------------------------------------
class YieldLedger {
public:
    static constexpr std::chrono::seconds DEFAULT_ACCRUAL_THRESHOLD{360};   // 0.1h

    YieldLedger(double principal_usd,
                double initial_yield_usd,
                SpendingMode mode,
                Timestamp start,
                std::chrono::seconds accrual_threshold = DEFAULT_ACCRUAL_THRESHOLD);

    // Adds total_hourly_yield * elapsed_hours when at least the accrual
    // threshold has passed since the last accrual, then advances the accrual
    // mark to `now`. Returns the amount added (0 when skipped).
    double accrue(Timestamp now);

    double available_budget() const;

    // Books `amount` against yield and reports whether it fitted the budget.
    // Throws ValidationError for negative / non-finite amounts, or one that
    // would push the spent total to infinity, before any state is touched.
    AuthorizationResult authorize_and_record(double amount);

    // Throws ValidationError for negative / non-finite amounts.
    SpendPreview preview(double amount) const;

    // Swaps every source of `origin` for `sources`. All-or-nothing.
    void replace_sources(const std::string& origin, const std::vector<YieldSource>& sources);

    void set_mode(SpendingMode mode);
    SpendingMode mode() const;

    double principal_usd() const;
    double accrued_yield_usd() const;
    double spent_from_yield_usd() const;
    double total_daily_yield() const;
    Timestamp last_accrual_at() const;

    LedgerSnapshot snapshot(Timestamp now = Clock::now()) const;

    // Startup-only: seed totals from a persisted snapshot before the driver
    // and console start. Not a runtime mutation path.
    void restore_totals(double accrued_yield_usd, double spent_from_yield_usd, SpendingMode mode);

private:
    double budget_locked() const;
    void   check_monotonic_locked(double prev_accrued, double prev_spent) const;

    mutable std::mutex   mtx_;
    double               principal_usd_;
    double               accrued_yield_usd_;
    double               spent_from_yield_usd_{0.0};
    SpendingMode         mode_;
    SourceRegistry       sources_;
    Timestamp            last_accrual_at_;
    std::chrono::seconds accrual_threshold_;
};

} // namespace yieldguard
