#include "ledger/Format.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

using namespace yieldguard;

std::string yieldguard::format_fixed(double v, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << v;
    return oss.str();
}

std::string yieldguard::format_usd(double v) {
    if (std::isnan(v)) return "$nan";
    if (std::isinf(v)) return v < 0.0 ? "-$inf" : "$inf";

    // Round first so -0.004 prints as $0.00, not -$0.00. Past 1e15 there are
    // no cents left to round and v * 100 may overflow.
    double rounded = std::fabs(v) < 1e15 ? std::round(v * 100.0) / 100.0 : v;
    bool negative = rounded < 0.0;

    std::string digits = format_fixed(std::fabs(rounded), 2);
    std::string::size_type dot = digits.find('.');
    std::string whole = dot == std::string::npos ? digits : digits.substr(0, dot);
    std::string frac  = dot == std::string::npos ? "" : digits.substr(dot);

    std::string grouped;
    int count = 0;
    for (auto it = whole.rbegin(); it != whole.rend(); ++it) {
        if (count > 0 && count % 3 == 0) grouped.insert(grouped.begin(), ',');
        grouped.insert(grouped.begin(), *it);
        ++count;
    }

    return (negative ? "-$" : "$") + grouped + frac;
}
