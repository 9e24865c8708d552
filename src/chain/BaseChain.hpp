#pragma once
#include <array>
#include <string>

namespace yieldguard {
namespace base_chain {

// Base mainnet (chain id 8453).
constexpr int         CHAIN_ID     = 8453;
constexpr const char* RPC_URL      = "https://mainnet.base.org";
constexpr const char* EXPLORER_URL = "https://basescan.org";

struct TokenInfo {
    const char* symbol;
    const char* address;
    int         decimals;
};

constexpr std::array<TokenInfo, 3> STABLECOINS = {{
    {"USDC",  "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913", 6},
    {"USDbC", "0xd9aAEc86B65D86f6A7B5B1b0c42FFA531710b6CA", 6},
    {"DAI",   "0x50c5725949A6F0c72E6C4a641F24049A917DB0Cb", 18},
}};

// Aave V3 on Base.
constexpr const char* AAVE_V3_POOL  = "0xA238Dd80C259a72e81d7e4664a9801593F98d1c5";
constexpr const char* AAVE_V3_AUSDC = "0x4e65fE4DbA92790696d040ac24Aa414708F5c0AB";
constexpr int         AUSDC_DECIMALS = 6;

inline std::string explorer_tx_url(const std::string& tx_hash) {
    return std::string(EXPLORER_URL) + "/tx/" + tx_hash;
}

} // namespace base_chain
} // namespace yieldguard
