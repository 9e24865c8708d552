#include "ledger/Time.hpp"
#include "ledger/Errors.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace yieldguard;

std::string yieldguard::format_utc(Timestamp ts) {
    std::time_t t = Clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

Timestamp yieldguard::parse_utc(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw ValidationError("bad UTC timestamp: " + text);
    }
    return Clock::from_time_t(timegm(&tm));
}
