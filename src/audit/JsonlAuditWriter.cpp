#include "audit/JsonlAuditWriter.hpp"
#include "audit/AuditCodec.hpp"
#include "audit/Sha256.hpp"
#include "ledger/Errors.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace yieldguard;
using json = nlohmann::json;
namespace fs = std::filesystem;

JsonlAuditWriter::JsonlAuditWriter(const std::string& dir)
    : dir_(dir),
      tx_path_((fs::path(dir) / "transactions.jsonl").string()),
      snap_path_((fs::path(dir) / "snapshots.jsonl").string()) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw StorageWriteError("[AUDIT] Cannot create " + dir_ + ": " + ec.message());
    }
    load_transactions();
    load_snapshots();
    std::cout << "[AUDIT] " << dir_ << ": " << by_id_.size() << " transactions, "
              << (head_ ? head_->seq : 0) << " snapshots\n";
}

void JsonlAuditWriter::load_transactions() {
    std::ifstream in(tx_path_);
    if (!in) return;

    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.empty()) continue;
        try {
            TransactionRecord rec = record_from_json(json::parse(line));
            auto it = by_id_.find(rec.id());
            if (it == by_id_.end()) {
                order_.push_back(rec.id());
                by_id_.emplace(rec.id(), rec);
            } else {
                it->second = rec;
            }
        } catch (const std::exception& e) {
            std::cerr << "[AUDIT] Skipping " << tx_path_ << ":" << lineno
                      << " (" << e.what() << ")\n";
        }
    }
}

void JsonlAuditWriter::load_snapshots() {
    std::ifstream in(snap_path_);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        try {
            head_ = snapshot_from_json(json::parse(line));
        } catch (const std::exception& e) {
            std::cerr << "[AUDIT] Snapshot file unreadable (" << e.what()
                      << "), snapshot writes disabled until repaired\n";
            chain_broken_ = true;
            return;
        }
    }
}

void JsonlAuditWriter::append_line(const std::string& path, const std::string& line) {
    std::ofstream out(path, std::ios::app);
    if (!out) {
        throw StorageWriteError("[AUDIT] Cannot open " + path);
    }
    out << line << "\n";
    out.flush();
    if (!out) {
        throw StorageWriteError("[AUDIT] Write failed on " + path);
    }
}

void JsonlAuditWriter::rewrite_transactions_locked() {
    const std::string tmp = tx_path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw StorageWriteError("[AUDIT] Cannot open " + tmp);
        }
        for (const auto& id : order_) {
            out << record_to_json(by_id_.at(id)).dump() << "\n";
        }
        out.flush();
        if (!out) {
            throw StorageWriteError("[AUDIT] Write failed on " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, tx_path_, ec);
    if (ec) {
        throw StorageWriteError("[AUDIT] Rename " + tmp + " failed: " + ec.message());
    }
}

void JsonlAuditWriter::upsert_transaction(const TransactionRecord& rec) {
    std::lock_guard<std::mutex> lock(mtx_);

    auto it = by_id_.find(rec.id());
    if (it == by_id_.end()) {
        append_line(tx_path_, record_to_json(rec).dump());
        order_.push_back(rec.id());
        by_id_.emplace(rec.id(), rec);
        return;
    }

    if (it->second == rec) return;   // replay of the same row

    // Changed row: memory first, then rewrite. On failure restore memory so
    // the index keeps matching what is on disk.
    TransactionRecord previous = it->second;
    it->second = rec;
    try {
        rewrite_transactions_locked();
    } catch (const std::exception&) {
        it->second = previous;
        throw;
    }
}

void JsonlAuditWriter::write_snapshot(const LedgerSnapshot& snap) {
    std::lock_guard<std::mutex> lock(mtx_);

    if (chain_broken_) {
        throw StorageWriteError("[AUDIT] Snapshot chain unreadable, refusing to append");
    }

    SnapshotRow row;
    row.seq                  = head_ ? head_->seq + 1 : 1;
    row.timestamp            = snap.taken_at;
    row.principal_usd        = snap.principal_usd;
    row.accrued_yield_usd    = snap.accrued_yield_usd;
    row.spent_from_yield_usd = snap.spent_from_yield_usd;
    row.mode                 = snap.mode;
    row.prev_hash            = head_ ? head_->hash : std::string();
    row.hash                 = sha256_hex(row.prev_hash + snapshot_payload(row).dump());

    append_line(snap_path_, snapshot_to_json(row).dump());
    head_ = row;
}

std::vector<TransactionRecord> JsonlAuditWriter::recent_transactions(size_t limit) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<TransactionRecord> out;
    for (auto it = order_.rbegin(); it != order_.rend() && out.size() < limit; ++it) {
        out.push_back(by_id_.at(*it));
    }
    return out;
}

std::optional<SnapshotRow> JsonlAuditWriter::latest_snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (chain_broken_) return std::nullopt;
    return head_;
}

bool JsonlAuditWriter::verify_snapshot_chain() const {
    std::lock_guard<std::mutex> lock(mtx_);

    std::ifstream in(snap_path_);
    if (!in) return true;   // nothing written yet

    std::string line;
    std::string prev_hash;
    uint64_t expected_seq = 1;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        try {
            SnapshotRow row = snapshot_from_json(json::parse(line));
            if (row.seq != expected_seq || row.prev_hash != prev_hash) {
                std::cerr << "[AUDIT] Chain break at seq " << row.seq << "\n";
                return false;
            }
            if (sha256_hex(row.prev_hash + snapshot_payload(row).dump()) != row.hash) {
                std::cerr << "[AUDIT] Hash mismatch at seq " << row.seq << "\n";
                return false;
            }
            prev_hash = row.hash;
            ++expected_seq;
        } catch (const std::exception& e) {
            std::cerr << "[AUDIT] Unreadable snapshot row: " << e.what() << "\n";
            return false;
        }
    }
    return true;
}

std::vector<std::string> JsonlAuditWriter::transaction_ids() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return order_;
}

size_t JsonlAuditWriter::transaction_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return by_id_.size();
}
