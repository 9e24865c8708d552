#include "ledger/YieldLedger.hpp"
#include "ledger/Errors.hpp"
#include "ledger/Format.hpp"
#include <cmath>
#include <iostream>

using namespace yieldguard;

static void require_amount(double amount, const char* what) {
    if (!std::isfinite(amount) || amount < 0.0) {
        throw ValidationError(std::string(what) + ": amount must be finite and non-negative");
    }
}

YieldLedger::YieldLedger(double principal_usd,
                         double initial_yield_usd,
                         SpendingMode mode,
                         Timestamp start,
                         std::chrono::seconds accrual_threshold)
    : principal_usd_(principal_usd),
      accrued_yield_usd_(initial_yield_usd),
      mode_(mode),
      last_accrual_at_(start),
      accrual_threshold_(accrual_threshold) {
    require_amount(principal_usd, "principal_usd");
    require_amount(initial_yield_usd, "initial_yield_usd");
    if (accrual_threshold.count() < 0) {
        throw ValidationError("accrual threshold must be non-negative");
    }
}

double YieldLedger::budget_locked() const {
    return (accrued_yield_usd_ - spent_from_yield_usd_) * retention_fraction(mode_);
}

void YieldLedger::check_monotonic_locked(double prev_accrued, double prev_spent) const {
    if (accrued_yield_usd_ < prev_accrued || !std::isfinite(accrued_yield_usd_)) {
        throw LedgerInvariantError("accrued_yield_usd decreased or became non-finite");
    }
    if (spent_from_yield_usd_ < prev_spent || !std::isfinite(spent_from_yield_usd_)) {
        throw LedgerInvariantError("spent_from_yield_usd decreased or became non-finite");
    }
}

double YieldLedger::accrue(Timestamp now) {
    std::lock_guard<std::mutex> lock(mtx_);

    // Clock stepped backwards or tick came too soon: nothing to apply. The
    // accrual mark is left alone so the interval is picked up next time.
    if (now <= last_accrual_at_ || now - last_accrual_at_ < accrual_threshold_) {
        return 0.0;
    }

    const double prev_accrued = accrued_yield_usd_;
    const double hours = hours_between(last_accrual_at_, now);
    const double delta = sources_.total_hourly_yield() * hours;

    accrued_yield_usd_ += delta;
    last_accrual_at_ = now;

    check_monotonic_locked(prev_accrued, spent_from_yield_usd_);
    return delta;
}

double YieldLedger::available_budget() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return budget_locked();
}

AuthorizationResult YieldLedger::authorize_and_record(double amount) {
    require_amount(amount, "authorize_and_record");

    AuthorizationResult r;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        const double prev_spent = spent_from_yield_usd_;

        r.amount        = amount;
        r.budget_before = budget_locked();
        r.within_budget = amount <= r.budget_before;

        // Refuse before booking: an infinite total would trip the invariant check.
        if (!std::isfinite(spent_from_yield_usd_ + amount)) {
            throw ValidationError("authorize_and_record: amount overflows the spent total");
        }
        spent_from_yield_usd_ += amount;
        check_monotonic_locked(accrued_yield_usd_, prev_spent);
    }

    if (r.within_budget) {
        r.remaining = r.budget_before - amount;
        r.message = "Spent " + format_usd(amount) + " from yield (" +
                    format_usd(r.remaining) + " remaining)";
    } else {
        r.overage = amount - r.budget_before;
        r.message = "Over budget by " + format_usd(r.overage) +
                    "! This dips into principal.";
    }
    return r;
}

SpendPreview YieldLedger::preview(double amount) const {
    require_amount(amount, "preview");

    SpendPreview p;
    double daily = 0.0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        p.available = budget_locked();
        daily = sources_.total_daily_yield();
    }

    p.amount   = amount;
    p.approved = amount <= p.available;
    if (p.approved) {
        p.remaining = p.available - amount;
    } else {
        p.shortfall = amount - p.available;
        if (daily > 0.0) p.days_needed = p.shortfall / daily;
    }
    return p;
}

void YieldLedger::replace_sources(const std::string& origin,
                                  const std::vector<YieldSource>& sources) {
    std::lock_guard<std::mutex> lock(mtx_);
    sources_.replace_origin(origin, sources);
}

void YieldLedger::set_mode(SpendingMode mode) {
    // Goes through the closed-set lookup so a cast-in value fails here.
    retention_fraction(mode);
    std::lock_guard<std::mutex> lock(mtx_);
    mode_ = mode;
}

SpendingMode YieldLedger::mode() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return mode_;
}

double YieldLedger::principal_usd() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return principal_usd_;
}

double YieldLedger::accrued_yield_usd() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return accrued_yield_usd_;
}

double YieldLedger::spent_from_yield_usd() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return spent_from_yield_usd_;
}

double YieldLedger::total_daily_yield() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return sources_.total_daily_yield();
}

Timestamp YieldLedger::last_accrual_at() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return last_accrual_at_;
}

LedgerSnapshot YieldLedger::snapshot(Timestamp now) const {
    std::lock_guard<std::mutex> lock(mtx_);
    LedgerSnapshot s;
    s.taken_at             = now;
    s.principal_usd        = principal_usd_;
    s.accrued_yield_usd    = accrued_yield_usd_;
    s.spent_from_yield_usd = spent_from_yield_usd_;
    s.mode                 = mode_;
    s.last_accrual_at      = last_accrual_at_;
    s.available_budget     = budget_locked();
    s.total_daily_yield    = sources_.total_daily_yield();
    s.sources              = sources_.list();
    return s;
}

void YieldLedger::restore_totals(double accrued_yield_usd,
                                 double spent_from_yield_usd,
                                 SpendingMode mode) {
    require_amount(accrued_yield_usd, "restore accrued");
    require_amount(spent_from_yield_usd, "restore spent");
    retention_fraction(mode);

    {
        std::lock_guard<std::mutex> lock(mtx_);
        accrued_yield_usd_    = accrued_yield_usd;
        spent_from_yield_usd_ = spent_from_yield_usd;
        mode_                 = mode;
    }
    std::cout << "[LEDGER] Restored accrued=" << format_usd(accrued_yield_usd)
              << " spent=" << format_usd(spent_from_yield_usd)
              << " mode=" << mode_name(mode) << "\n";
}
