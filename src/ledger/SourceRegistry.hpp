#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "ledger/YieldSource.hpp"

namespace yieldguard {

// ---------------------------------------------------------------------------
// SourceRegistry: current set of yield sources keyed by (origin, name).
//
// Refreshes replace every source of one origin at once; sources of other
// origins are untouched. Not internally locked: the owning YieldLedger
// serializes all access under its own mutex.
// ---------------------------------------------------------------------------
class SourceRegistry {
public:
    using Key = std::pair<std::string, std::string>;   // (origin, name)

    // Validates the whole batch before touching anything. Every source must
    // carry `origin`, a non-empty unique name and finite non-negative figures.
    // Throws ValidationError; on throw the registry is unchanged.
    void replace_origin(const std::string& origin, const std::vector<YieldSource>& sources);

    double total_daily_yield() const;
    double total_hourly_yield() const;

    std::vector<YieldSource> list() const;
    size_t size() const { return sources_.size(); }
    size_t count_origin(const std::string& origin) const;

private:
    std::map<Key, YieldSource> sources_;
};

} // namespace yieldguard
