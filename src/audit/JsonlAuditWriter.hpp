#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "audit/AuditWriter.hpp"

namespace yieldguard {

// ---------------------------------------------------------------------------
// JsonlAuditWriter: file-backed AuditWriter, one JSON object per line.
//
//   <dir>/transactions.jsonl  one row per transaction id
//       new id          → appended
//       identical row   → no-op
//       changed row     → whole file rewritten to .tmp then renamed over
//   <dir>/snapshots.jsonl     append-only, never rewritten
//       hash = SHA-256(prev_hash || payload), first row prev_hash = ""
//
// Existing files are loaded at construction so the id index and chain head
// survive restarts. Unreadable lines in transactions.jsonl are skipped with
// a warning; a snapshot file that cannot be parsed refuses further appends
// (StorageWriteError) rather than forking the chain.
//
// THREADING: internal mutex. Safe from driver and console concurrently.
// ---------------------------------------------------------------------------
class JsonlAuditWriter : public AuditWriter {
public:
    explicit JsonlAuditWriter(const std::string& dir);

    void upsert_transaction(const TransactionRecord& rec) override;
    void write_snapshot(const LedgerSnapshot& snap) override;

    std::vector<TransactionRecord> recent_transactions(size_t limit) const override;
    std::optional<SnapshotRow> latest_snapshot() const override;
    std::vector<std::string> transaction_ids() const override;

    // Re-reads snapshots.jsonl and checks sequence numbers and the hash chain.
    bool verify_snapshot_chain() const override;

    size_t transaction_count() const;
    const std::string& transactions_path() const { return tx_path_; }
    const std::string& snapshots_path() const { return snap_path_; }

private:
    void load_transactions();
    void load_snapshots();
    void append_line(const std::string& path, const std::string& line);
    void rewrite_transactions_locked();

    std::string dir_;
    std::string tx_path_;
    std::string snap_path_;

    mutable std::mutex mtx_;
    std::map<std::string, TransactionRecord> by_id_;
    std::vector<std::string>                 order_;     // ids in first-seen order
    std::optional<SnapshotRow>               head_;
    bool                                     chain_broken_{false};
};

} // namespace yieldguard
