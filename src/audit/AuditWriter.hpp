#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ledger/SpendingMode.hpp"
#include "ledger/Time.hpp"
#include "ledger/TransactionRecord.hpp"
#include "ledger/YieldLedger.hpp"

namespace yieldguard {

// One persisted snapshot row. Rows are append-only and hash-chained.
struct SnapshotRow {
    uint64_t     seq{0};
    Timestamp    timestamp{};
    double       principal_usd{0.0};
    double       accrued_yield_usd{0.0};
    double       spent_from_yield_usd{0.0};
    SpendingMode mode{SpendingMode::BALANCED};
    std::string  prev_hash;
    std::string  hash;
};

// ---------------------------------------------------------------------------
// AuditWriter: persistence seam for transaction records and ledger snapshots.
//
// upsert_transaction is idempotent by record id. write_snapshot only appends.
// Both throw StorageWriteError on failure; the caller decides when to retry.
// ---------------------------------------------------------------------------
class AuditWriter {
public:
    virtual ~AuditWriter() = default;

    virtual void upsert_transaction(const TransactionRecord& rec) = 0;
    virtual void write_snapshot(const LedgerSnapshot& snap) = 0;

    // Newest first.
    virtual std::vector<TransactionRecord> recent_transactions(size_t limit) const = 0;
    virtual std::optional<SnapshotRow> latest_snapshot() const = 0;

    // Every persisted transaction id, oldest first.
    virtual std::vector<std::string> transaction_ids() const = 0;

    // True when every persisted snapshot row links to its predecessor.
    virtual bool verify_snapshot_chain() const = 0;
};

} // namespace yieldguard
