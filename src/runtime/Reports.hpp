#pragma once
#include <map>
#include <string>
#include <vector>

#include "ledger/TransactionRecord.hpp"
#include "ledger/YieldLedger.hpp"

namespace yieldguard {

// Plain-text operator reports. Pure formatting over values the caller
// already collected; nothing here touches the ledger or the network.

std::string status_report(const LedgerSnapshot& s,
                          const std::map<std::string, double>& balances,
                          bool balances_available);

std::string budget_report(const LedgerSnapshot& s);
std::string yield_report(const LedgerSnapshot& s);
std::string history_report(const std::vector<TransactionRecord>& rows);
std::string preview_report(const SpendPreview& p);
std::string topup_report(const LedgerSnapshot& s);

// "Balanced (80%)"
std::string mode_label(SpendingMode m);

} // namespace yieldguard
