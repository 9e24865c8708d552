#pragma once
#include <cstdint>
#include <string>

#include "ledger/Time.hpp"

namespace yieldguard {

enum class Direction : uint8_t {
    IN  = 0,
    OUT = 1
};

enum class TxStatus : uint8_t {
    DETECTED      = 0,
    WITHIN_BUDGET = 1,
    OVER_BUDGET   = 2
};

const char* to_string(Direction d);
const char* to_string(TxStatus s);

// Throw ValidationError on unknown text. Case-sensitive, lower-case wire form.
Direction parse_direction(const std::string& text);
TxStatus  parse_status(const std::string& text);

// A transfer as delivered by a TransferDetector.
struct TransferEvent {
    std::string id;
    Timestamp   timestamp{};
    double      amount{0.0};
    std::string asset;
    Direction   direction{Direction::OUT};
    std::string counterparty;
    std::string category;
};

// ---------------------------------------------------------------------------
// TransactionRecord: one detected transfer plus the authorization outcome.
//
// Built once from a TransferEvent. Status starts DETECTED and may be assigned
// exactly once via settle(); a second settle() is a defect and throws
// LedgerInvariantError.
// ---------------------------------------------------------------------------
class TransactionRecord {
public:
    explicit TransactionRecord(const TransferEvent& ev);

    // Rebuild a persisted record (audit reload). No lifecycle checks.
    static TransactionRecord restore(const TransferEvent& ev, TxStatus status);

    void settle(bool within_budget);

    const std::string& id() const           { return ev_.id; }
    Timestamp          timestamp() const    { return ev_.timestamp; }
    double             amount() const       { return ev_.amount; }
    const std::string& asset() const        { return ev_.asset; }
    Direction          direction() const    { return ev_.direction; }
    const std::string& counterparty() const { return ev_.counterparty; }
    const std::string& category() const     { return ev_.category; }
    TxStatus           status() const       { return status_; }
    bool               settled() const      { return settled_; }

    const TransferEvent& event() const { return ev_; }

    bool operator==(const TransactionRecord& o) const;
    bool operator!=(const TransactionRecord& o) const { return !(*this == o); }

private:
    TransferEvent ev_;
    TxStatus      status_{TxStatus::DETECTED};
    bool          settled_{false};
};

} // namespace yieldguard
