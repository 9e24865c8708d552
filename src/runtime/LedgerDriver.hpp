#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

#include "ledger/Time.hpp"

namespace yieldguard {

struct Context;

struct TickReport {
    bool   refreshed{false};        // at least one feed replaced its origin
    double accrued{0.0};
    size_t transfers{0};            // events handed to the pipeline
    size_t over_budget{0};
    bool   snapshot_written{false};
    size_t errors{0};               // collaborator / storage failures this tick
};

// ---------------------------------------------------------------------------
// LedgerDriver: periodic background loop around the ledger.
//
// Each tick, in order:
//   1. DeFi refresh (every defi_refresh): fetch each feed, replace its origin
//      only if the feed returned sources. Failures logged, registry untouched.
//   2. accrue(now).
//   3. Retry queued audit writes.
//   4. Poll the detector and run new transfers through the pipeline.
//   5. Snapshot (every snapshot_interval). A failed write is retried next
//      tick; the interval clock only advances on success.
//
// Missed or late ticks are harmless: accrual works from elapsed wall time.
//
// THREADING: dedicated thread. stop() wakes the sleep and joins, so a tick
//   in progress always completes before shutdown. tick() is public so tests
//   can drive time explicitly without the thread.
// ---------------------------------------------------------------------------
class LedgerDriver {
public:
    LedgerDriver(Context& ctx, std::chrono::seconds interval);
    ~LedgerDriver();

    void start();
    void stop();
    bool running() const { return running_.load(); }

    TickReport tick(Timestamp now);

private:
    void run();
    bool refresh_sources(TickReport& r);
    void poll_transfers(TickReport& r);
    void maybe_snapshot(Timestamp now, TickReport& r);

    Context&             ctx_;
    std::chrono::seconds interval_;
    std::atomic<bool>    running_{false};
    std::thread          worker_;

    std::mutex              wake_mtx_;
    std::condition_variable wake_cv_;

    std::optional<Timestamp> last_refresh_;
    std::optional<Timestamp> last_snapshot_;
};

} // namespace yieldguard
