#include "ledger/SourceRegistry.hpp"
#include "ledger/Errors.hpp"
#include <cmath>
#include <set>

using namespace yieldguard;

static bool valid_figure(double v) {
    return std::isfinite(v) && v >= 0.0;
}

void SourceRegistry::replace_origin(const std::string& origin,
                                    const std::vector<YieldSource>& sources) {
    if (origin.empty()) {
        throw ValidationError("replace_origin: empty origin");
    }

    std::set<std::string> names;
    for (const auto& s : sources) {
        if (s.origin != origin) {
            throw ValidationError("source '" + s.name + "' has origin '" + s.origin +
                                  "', expected '" + origin + "'");
        }
        if (s.name.empty()) {
            throw ValidationError("source with empty name in origin " + origin);
        }
        if (!valid_figure(s.principal_usd) || !valid_figure(s.annual_rate_percent)) {
            throw ValidationError("source '" + s.name + "' has negative or non-finite figures");
        }
        if (!names.insert(s.name).second) {
            throw ValidationError("duplicate source '" + s.name + "' in origin " + origin);
        }
    }

    // Batch is valid. Drop the old origin, insert the new set.
    for (auto it = sources_.begin(); it != sources_.end();) {
        if (it->first.first == origin) it = sources_.erase(it);
        else ++it;
    }
    for (const auto& s : sources) {
        sources_.emplace(Key{s.origin, s.name}, s);
    }
}

double SourceRegistry::total_daily_yield() const {
    double total = 0.0;
    for (const auto& kv : sources_) total += kv.second.daily_yield();
    return total;
}

double SourceRegistry::total_hourly_yield() const {
    double total = 0.0;
    for (const auto& kv : sources_) total += kv.second.hourly_yield();
    return total;
}

std::vector<YieldSource> SourceRegistry::list() const {
    std::vector<YieldSource> out;
    out.reserve(sources_.size());
    for (const auto& kv : sources_) out.push_back(kv.second);
    return out;
}

size_t SourceRegistry::count_origin(const std::string& origin) const {
    size_t n = 0;
    for (const auto& kv : sources_) {
        if (kv.first.first == origin) ++n;
    }
    return n;
}
