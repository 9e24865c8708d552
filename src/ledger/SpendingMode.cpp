#include "ledger/SpendingMode.hpp"
#include "ledger/Errors.hpp"
#include <algorithm>
#include <cctype>

using namespace yieldguard;

double yieldguard::retention_fraction(SpendingMode mode) {
    switch (mode) {
        case SpendingMode::CONSERVATIVE: return 0.5;
        case SpendingMode::BALANCED:     return 0.8;
        case SpendingMode::GROWTH:       return 0.3;
    }
    throw LedgerInvariantError("retention_fraction: mode outside closed set");
}

const char* yieldguard::mode_name(SpendingMode mode) {
    switch (mode) {
        case SpendingMode::CONSERVATIVE: return "CONSERVATIVE";
        case SpendingMode::BALANCED:     return "BALANCED";
        case SpendingMode::GROWTH:       return "GROWTH";
    }
    throw LedgerInvariantError("mode_name: mode outside closed set");
}

SpendingMode yieldguard::parse_mode(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (SpendingMode m : kAllSpendingModes) {
        if (upper == mode_name(m)) return m;
    }
    throw UnknownModeError(name);
}
