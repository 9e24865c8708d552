#include "runtime/Context.hpp"
#include "ledger/Errors.hpp"
#include <iostream>
#include <map>

using namespace yieldguard;

Context::Context(Config cfg, std::unique_ptr<AuditWriter> writer, Timestamp start)
    : config(std::move(cfg)),
      ledger(config.principal_usd, config.initial_yield, config.spending_mode,
             start, config.accrual_threshold),
      audit(std::move(writer)),
      pipeline(ledger, *audit) {}

void Context::seed_sources() {
    std::map<std::string, std::vector<YieldSource>> by_origin;
    for (const auto& s : config.yield_sources) {
        by_origin[s.origin].push_back(s);
    }
    for (const auto& kv : by_origin) {
        try {
            ledger.replace_sources(kv.first, kv.second);
        } catch (const ValidationError& e) {
            throw ConfigurationError(std::string("[CONFIG] yield_sources: ") + e.what());
        }
        std::cout << "[REGISTRY] " << kv.first << ": " << kv.second.size() << " source(s)\n";
    }
}

bool Context::restore_from_audit() {
    if (!audit->verify_snapshot_chain()) {
        std::cerr << "[YIELDGUARD] Snapshot chain failed verification, starting from config totals\n";
        return false;
    }
    std::optional<SnapshotRow> row = audit->latest_snapshot();
    if (!row) {
        std::cout << "[YIELDGUARD] No usable snapshot, starting from config totals\n";
        return false;
    }
    ledger.restore_totals(row->accrued_yield_usd, row->spent_from_yield_usd, row->mode);

    std::vector<std::string> ids = audit->transaction_ids();
    pipeline.mark_seen(ids);
    std::cout << "[YIELDGUARD] Restored from snapshot seq=" << row->seq
              << " (" << format_utc(row->timestamp) << "), "
              << ids.size() << " known transaction id(s)\n";
    return true;
}
