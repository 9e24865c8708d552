#pragma once
#include <string>
#include <vector>

#include "chain/Collaborators.hpp"

namespace yieldguard {

// ---------------------------------------------------------------------------
// AaveYieldFeed: the wallet's Aave V3 aUSDC position as a yield source.
//
// Principal is the aUSDC balance (balanceOf on the aToken). The rate is the
// configured APY; reading the live reserve rate from the pool is not wired.
// Returns an empty list when the balance is zero.
// ---------------------------------------------------------------------------
class AaveYieldFeed : public YieldSourceFeed {
public:
    static constexpr const char* ORIGIN      = "aave_v3";
    static constexpr const char* SOURCE_NAME = "Aave V3 USDC";

    AaveYieldFeed(TokenBalanceReader& reader, std::string wallet, double apy_percent);

    std::string origin() const override { return ORIGIN; }
    std::vector<YieldSource> fetch_sources() override;

private:
    TokenBalanceReader& reader_;
    std::string         wallet_;
    double              apy_percent_;
};

} // namespace yieldguard
