#include "runtime/TransactionPipeline.hpp"
#include "ledger/Errors.hpp"
#include "ledger/Format.hpp"
#include <cmath>
#include <iostream>

using namespace yieldguard;

static std::string short_id(const std::string& id) {
    return id.size() > 10 ? id.substr(0, 10) + "..." : id;
}

TransactionPipeline::TransactionPipeline(YieldLedger& ledger, AuditWriter& writer)
    : ledger_(ledger), writer_(writer) {}

bool TransactionPipeline::claim(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    return seen_.insert(id).second;
}

bool TransactionPipeline::seen(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return seen_.count(id) != 0;
}

bool TransactionPipeline::write_or_queue(const TransactionRecord& rec) {
    try {
        writer_.upsert_transaction(rec);
        return true;
    } catch (const StorageWriteError& e) {
        std::cerr << "[PIPELINE] Audit write failed for " << short_id(rec.id())
                  << ": " << e.what() << ", queued for retry\n";
        std::lock_guard<std::mutex> lock(mtx_);
        pending_.push_back(rec);
        return false;
    }
}

PipelineReport TransactionPipeline::process(const std::vector<TransferEvent>& events) {
    PipelineReport report;

    for (const auto& ev : events) {
        if (ev.id.empty()) {
            std::cerr << "[PIPELINE] Dropping transfer without id\n";
            ++report.rejected;
            continue;
        }
        if (!claim(ev.id)) {
            ++report.duplicates;
            continue;
        }
        if (!std::isfinite(ev.amount) || ev.amount < 0.0) {
            std::cerr << "[PIPELINE] Rejecting " << short_id(ev.id)
                      << ": amount must be finite and non-negative\n";
            ++report.rejected;
            continue;
        }

        TransactionRecord rec(ev);
        std::optional<AuthorizationResult> auth;

        if (ev.direction == Direction::OUT && ev.amount > 0.0) {
            try {
                auth = ledger_.authorize_and_record(ev.amount);
            } catch (const ValidationError& e) {
                std::cerr << "[PIPELINE] Rejecting " << short_id(ev.id) << ": " << e.what() << "\n";
                ++report.rejected;
                continue;
            }
            rec.settle(auth->within_budget);
            std::cout << "[PIPELINE] Transaction " << short_id(ev.id) << ": "
                      << format_usd(ev.amount) << " " << ev.asset << " - "
                      << auth->message << "\n";
        } else {
            std::cout << "[PIPELINE] Recorded " << to_string(ev.direction) << " "
                      << short_id(ev.id) << ": " << format_usd(ev.amount) << " "
                      << ev.asset << " (not a spend)\n";
        }

        if (!write_or_queue(rec)) ++report.write_failures;
        report.processed.push_back(ProcessedTransfer{rec, auth});
    }
    return report;
}

ProcessedTransfer TransactionPipeline::record_booked(const TransferEvent& ev,
                                                     const AuthorizationResult& auth) {
    if (!claim(ev.id)) {
        throw LedgerInvariantError("booked transfer id already seen: " + ev.id);
    }
    TransactionRecord rec(ev);
    rec.settle(auth.within_budget);
    write_or_queue(rec);
    return ProcessedTransfer{rec, auth};
}

size_t TransactionPipeline::flush_pending() {
    std::deque<TransactionRecord> batch;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        batch.swap(pending_);
    }
    if (batch.empty()) return 0;

    std::deque<TransactionRecord> still_failing;
    std::optional<StorageWriteError> first_error;
    for (const auto& rec : batch) {
        try {
            writer_.upsert_transaction(rec);
        } catch (const StorageWriteError& e) {
            if (!first_error) first_error = e;
            still_failing.push_back(rec);
        }
    }
    const size_t written = batch.size() - still_failing.size();

    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        // Rows queued while we were flushing go after the retried ones.
        for (auto& rec : pending_) still_failing.push_back(rec);
        pending_.swap(still_failing);
        remaining = pending_.size();
    }

    std::cout << "[PIPELINE] Flushed " << written << "/" << batch.size()
              << " queued audit rows\n";
    if (first_error) throw *first_error;
    return remaining;
}

void TransactionPipeline::mark_seen(const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mtx_);
    seen_.insert(ids.begin(), ids.end());
}

size_t TransactionPipeline::pending_writes() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_.size();
}
