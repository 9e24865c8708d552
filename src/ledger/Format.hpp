#pragma once
#include <string>

namespace yieldguard {

// "$1,234.56", "-$12.00". Two decimals, thousands separators.
std::string format_usd(double v);

// Fixed decimals without currency sign: format_fixed(4.0, 2) == "4.00"
std::string format_fixed(double v, int decimals);

} // namespace yieldguard
