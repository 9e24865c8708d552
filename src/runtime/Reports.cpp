#include "runtime/Reports.hpp"
#include "ledger/Format.hpp"
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace yieldguard;

std::string yieldguard::mode_label(SpendingMode m) {
    std::string name = mode_name(m);
    for (size_t i = 1; i < name.size(); ++i) {
        name[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
    }
    int pct = static_cast<int>(std::lround(retention_fraction(m) * 100.0));
    return name + " (" + std::to_string(pct) + "%)";
}

std::string yieldguard::status_report(const LedgerSnapshot& s,
                                      const std::map<std::string, double>& balances,
                                      bool balances_available) {
    std::ostringstream out;
    out << "Yield Guardian Status\n"
        << "  Principal protected: " << format_usd(s.principal_usd) << "\n"
        << "  Yield accrued:       " << format_usd(s.accrued_yield_usd) << "\n"
        << "  Yield spent:         " << format_usd(s.spent_from_yield_usd) << "\n"
        << "  Available budget:    " << format_usd(s.available_budget) << "\n"
        << "  Mode:                " << mode_label(s.mode) << "\n"
        << "  Daily yield:         " << format_usd(s.total_daily_yield) << "/day\n";

    if (!balances_available) {
        out << "  Wallet balances:     unavailable\n";
    } else if (balances.empty()) {
        out << "  Wallet balances:     none\n";
    } else {
        double total = 0.0;
        for (const auto& kv : balances) {
            out << "  " << std::left << std::setw(21) << (kv.first + ":")
                << format_usd(kv.second) << "\n";
            total += kv.second;
        }
        out << "  Wallet total:        " << format_usd(total) << "\n";
    }
    return out.str();
}

std::string yieldguard::budget_report(const LedgerSnapshot& s) {
    const double net = s.net_yield();
    std::ostringstream out;
    out << "Budget Details\n"
        << "Yield account:\n"
        << "  Accrued: " << format_usd(s.accrued_yield_usd) << "\n"
        << "  Spent:   " << format_usd(s.spent_from_yield_usd) << "\n"
        << "  Net:     " << format_usd(net) << "\n"
        << "Spending budget:\n"
        << "  Mode:      " << mode_label(s.mode) << "\n"
        << "  Available: " << format_usd(s.available_budget) << "\n"
        << "  Reserved:  " << format_usd(net - s.available_budget) << "\n"
        << "Projections:\n"
        << "  Daily:   " << format_usd(s.total_daily_yield) << "\n"
        << "  Weekly:  " << format_usd(s.total_daily_yield * 7.0) << "\n"
        << "  Monthly: " << format_usd(s.total_daily_yield * 30.0) << "\n";
    return out.str();
}

std::string yieldguard::yield_report(const LedgerSnapshot& s) {
    std::ostringstream out;
    out << "Yield Details\n"
        << "  Total accrued: " << format_usd(s.accrued_yield_usd) << "\n"
        << "  Already spent: " << format_usd(s.spent_from_yield_usd) << "\n"
        << "  Net available: " << format_usd(s.net_yield()) << "\n"
        << "  Daily rate:    " << format_usd(s.total_daily_yield) << "\n"
        << "  Monthly:       " << format_usd(s.total_daily_yield * 30.0) << "\n"
        << "Sources:\n";
    if (s.sources.empty()) {
        out << "  (none)\n";
    }
    for (const auto& src : s.sources) {
        out << "  - " << src.name << " [" << src.origin << "]: "
            << format_usd(src.principal_usd) << " @ "
            << format_fixed(src.annual_rate_percent, 2) << "% = "
            << format_usd(src.daily_yield()) << "/day\n";
    }
    return out.str();
}

std::string yieldguard::history_report(const std::vector<TransactionRecord>& rows) {
    if (rows.empty()) return "No transactions recorded yet.\n";

    std::ostringstream out;
    out << "Recent Transactions\n";
    for (const auto& r : rows) {
        std::time_t t = Clock::to_time_t(r.timestamp());
        std::tm tm{};
        gmtime_r(&t, &tm);

        const char* tag = r.direction() == Direction::IN ? "IN  "
                        : r.status() == TxStatus::OVER_BUDGET ? "OVER"
                        : r.status() == TxStatus::WITHIN_BUDGET ? "OK  " : "--  ";
        out << "  " << tag << " " << format_usd(r.amount()) << " " << r.asset()
            << " - " << std::put_time(&tm, "%m/%d %H:%M") << " " << to_string(r.status()) << "\n";
    }
    return out.str();
}

std::string yieldguard::preview_report(const SpendPreview& p) {
    std::ostringstream out;
    if (p.approved) {
        out << format_usd(p.amount) << " APPROVED\n"
            << "  Within your yield budget.\n"
            << "  Remaining after spend: " << format_usd(p.remaining) << "\n";
        return out.str();
    }

    out << format_usd(p.amount) << " DENIED\n"
        << "  Exceeds yield budget by " << format_usd(p.shortfall) << "\n"
        << "  Available now: " << format_usd(p.available) << "\n";
    if (p.days_needed >= 0.0) {
        out << "  Wait " << format_fixed(p.days_needed, 1) << " days for enough yield\n";
    } else {
        out << "  No yield accruing, budget will not grow\n";
    }
    return out.str();
}

std::string yieldguard::topup_report(const LedgerSnapshot& s) {
    int reserve = static_cast<int>(std::lround((1.0 - retention_fraction(s.mode)) * 100.0));
    std::ostringstream out;
    out << "Card Top-up Available\n"
        << "  Yield earned:  " << format_usd(s.accrued_yield_usd) << "\n"
        << "  Already spent: " << format_usd(s.spent_from_yield_usd) << "\n"
        << "  Mode reserve:  " << reserve << "%\n"
        << "  Available to transfer: " << format_usd(s.available_budget) << "\n";
    return out.str();
}
