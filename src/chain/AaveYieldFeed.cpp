#include "chain/AaveYieldFeed.hpp"
#include "chain/BaseChain.hpp"
#include "ledger/Format.hpp"
#include <iostream>

using namespace yieldguard;

AaveYieldFeed::AaveYieldFeed(TokenBalanceReader& reader, std::string wallet, double apy_percent)
    : reader_(reader), wallet_(std::move(wallet)), apy_percent_(apy_percent) {}

std::vector<YieldSource> AaveYieldFeed::fetch_sources() {
    // Throws CollaboratorUnavailable straight through; the driver logs it.
    double balance = reader_.erc20_balance(base_chain::AAVE_V3_AUSDC, wallet_,
                                           base_chain::AUSDC_DECIMALS);

    std::vector<YieldSource> out;
    if (balance <= 0.0) {
        std::cout << "[FEED] No Aave aUSDC position\n";
        return out;
    }

    YieldSource s;
    s.name                = SOURCE_NAME;
    s.origin              = ORIGIN;
    s.principal_usd       = balance;
    s.annual_rate_percent = apy_percent_;
    s.last_updated        = Clock::now();
    s.protocol_address    = base_chain::AAVE_V3_POOL;
    out.push_back(s);

    std::cout << "[FEED] Aave aUSDC " << format_usd(balance) << " @ "
              << format_fixed(apy_percent_, 2) << "% APY\n";
    return out;
}
