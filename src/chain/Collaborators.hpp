#pragma once
#include <string>
#include <vector>

#include "ledger/TransactionRecord.hpp"
#include "ledger/YieldSource.hpp"

namespace yieldguard {

// ---------------------------------------------------------------------------
// External collaborator seams. None of these are ever called with the ledger
// lock held; they hand plain values back to the caller, which then mutates
// the ledger.
// ---------------------------------------------------------------------------

// Current positions for one origin. Throws CollaboratorUnavailable on
// network / parse failure; the registry is left untouched in that case.
class YieldSourceFeed {
public:
    virtual ~YieldSourceFeed() = default;
    virtual std::string origin() const = 0;
    virtual std::vector<YieldSource> fetch_sources() = 0;
};

// New transfers since the last poll. A given id is never returned twice to
// the same consumer. Throws CollaboratorUnavailable.
class TransferDetector {
public:
    virtual ~TransferDetector() = default;
    virtual std::vector<TransferEvent> poll_new_transfers() = 0;
};

struct TransferOutcome {
    bool        success{false};
    std::string reference;
    std::string error;
};

// Moves funds. Failures are reported in the outcome, not thrown.
class TransferExecutor {
public:
    virtual ~TransferExecutor() = default;
    virtual TransferOutcome execute(double amount, const std::string& destination) = 0;
};

// ERC-20 balanceOf in whole-token units. Throws CollaboratorUnavailable.
class TokenBalanceReader {
public:
    virtual ~TokenBalanceReader() = default;
    virtual double erc20_balance(const std::string& token,
                                 const std::string& holder,
                                 int decimals) = 0;
};

} // namespace yieldguard
