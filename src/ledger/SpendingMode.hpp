#pragma once
#include <array>
#include <string>

namespace yieldguard {

// Closed set of spending policies. Each value carries the fraction of net
// yield exposed as spendable budget.
enum class SpendingMode : int {
    CONSERVATIVE = 0,
    BALANCED     = 1,
    GROWTH       = 2
};

constexpr std::array<SpendingMode, 3> kAllSpendingModes = {
    SpendingMode::CONSERVATIVE,
    SpendingMode::BALANCED,
    SpendingMode::GROWTH
};

double retention_fraction(SpendingMode mode);

// Upper-case canonical name ("BALANCED").
const char* mode_name(SpendingMode mode);

// Case-insensitive. Throws UnknownModeError for anything outside the set.
SpendingMode parse_mode(const std::string& name);

} // namespace yieldguard
