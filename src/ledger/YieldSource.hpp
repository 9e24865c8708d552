#pragma once
#include <string>
#include "ledger/Time.hpp"

namespace yieldguard {

// Origin tag for sources configured by hand rather than discovered on-chain.
constexpr const char* kSimulatedOrigin = "simulated";

// One yield-bearing position. Principal and rate are only ever changed by an
// external refresh, which replaces the whole source.
struct YieldSource {
    std::string name;
    std::string origin;
    double      principal_usd{0.0};
    double      annual_rate_percent{0.0};
    Timestamp   last_updated{};
    std::string protocol_address;   // empty when not on-chain

    double daily_yield() const {
        return principal_usd * (annual_rate_percent / 100.0) / 365.0;
    }

    double hourly_yield() const { return daily_yield() / 24.0; }
};

} // namespace yieldguard
