#pragma once
#include <atomic>
#include <memory>
#include <vector>

#include "audit/AuditWriter.hpp"
#include "chain/Collaborators.hpp"
#include "ledger/YieldLedger.hpp"
#include "runtime/Config.hpp"
#include "runtime/TransactionPipeline.hpp"

namespace yieldguard {

// Single authoritative owner of all runtime state.
// No globals. Constructed once in main(); the driver and the operator
// console both receive Context&.
struct Context {
    Context(Config cfg, std::unique_ptr<AuditWriter> writer, Timestamp start = Clock::now());

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    std::atomic<bool> running{true};

    Config                       config;
    YieldLedger                  ledger;
    std::unique_ptr<AuditWriter> audit;
    TransactionPipeline          pipeline;

    // ---------------------------------------------------------------------------
    // Collaborators: constructed in main() after Context and wired by pointer.
    // Caller owns lifetime. Null means the step that needs it is skipped.
    // ---------------------------------------------------------------------------
    std::vector<YieldSourceFeed*> feeds;
    TransferDetector*   detector{nullptr};
    TransferExecutor*   executor{nullptr};
    TokenBalanceReader* balances{nullptr};

    // Loads the configured sources into the ledger, one replace per origin.
    void seed_sources();

    // Seeds accrued/spent/mode from the newest persisted snapshot and marks
    // every audited transaction id as seen. Returns false (and leaves the
    // config values) when there is no snapshot or the chain fails to verify.
    bool restore_from_audit();
};

} // namespace yieldguard
