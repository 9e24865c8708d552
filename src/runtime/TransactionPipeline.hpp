#pragma once
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "audit/AuditWriter.hpp"
#include "ledger/TransactionRecord.hpp"
#include "ledger/YieldLedger.hpp"

namespace yieldguard {

struct ProcessedTransfer {
    TransactionRecord                  record;
    std::optional<AuthorizationResult> auth;     // set only when booked
};

struct PipelineReport {
    std::vector<ProcessedTransfer> processed;
    size_t duplicates{0};
    size_t rejected{0};
    size_t write_failures{0};
};

// ---------------------------------------------------------------------------
// TransactionPipeline: turns detected transfers into ledger bookings and
// audit rows.
//
//   in             → recorded DETECTED, not booked
//   out, amount>0  → authorize_and_record, WITHIN_BUDGET / OVER_BUDGET
//   out, amount=0  → recorded DETECTED, not booked
//   bad amount     → rejected, logged, never booked
//   overflowing    → authorize_and_record refuses it; rejected like a bad amount
//
// Every id is handled at most once per process: the id is claimed before the
// ledger is touched, so a re-delivered id can never double-book a spend.
// Audit writes that fail are queued and retried by flush_pending(); the
// ledger booking is never undone.
//
// THREADING: own mutex for the seen-set and retry queue. Never held while
//   calling the ledger or the writer.
// ---------------------------------------------------------------------------
class TransactionPipeline {
public:
    TransactionPipeline(YieldLedger& ledger, AuditWriter& writer);

    PipelineReport process(const std::vector<TransferEvent>& events);

    // Record a spend that was already booked elsewhere (operator transfer).
    // Claims the id so a later detector delivery of it is ignored.
    ProcessedTransfer record_booked(const TransferEvent& ev, const AuthorizationResult& auth);

    // Retries queued audit writes. Returns how many are still queued. Throws
    // the first StorageWriteError seen, after attempting every queued row.
    size_t flush_pending();

    // Startup only: ids already in the audit trail, so a re-read inbox does
    // not book them a second time.
    void mark_seen(const std::vector<std::string>& ids);

    size_t pending_writes() const;
    bool   seen(const std::string& id) const;

private:
    bool claim(const std::string& id);
    bool write_or_queue(const TransactionRecord& rec);

    YieldLedger& ledger_;
    AuditWriter& writer_;

    mutable std::mutex              mtx_;
    std::unordered_set<std::string> seen_;
    std::deque<TransactionRecord>   pending_;
};

} // namespace yieldguard
