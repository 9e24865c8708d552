#include "runtime/LedgerDriver.hpp"
#include "runtime/Context.hpp"
#include "ledger/Errors.hpp"
#include "ledger/Format.hpp"
#include <iostream>

using namespace yieldguard;

LedgerDriver::LedgerDriver(Context& ctx, std::chrono::seconds interval)
    : ctx_(ctx), interval_(interval) {}

LedgerDriver::~LedgerDriver() {
    stop();
}

void LedgerDriver::start() {
    if (running_.exchange(true)) return;  // already running
    worker_ = std::thread([this]() { run(); });
    std::cout << "[DRIVER] Started (tick=" << interval_.count() << "s)\n";
}

void LedgerDriver::stop() {
    if (!running_.exchange(false)) return;  // already stopped
    {
        std::lock_guard<std::mutex> lock(wake_mtx_);
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    std::cout << "[DRIVER] Stopped\n";
}

void LedgerDriver::run() {
    while (running_.load()) {
        tick(Clock::now());

        std::unique_lock<std::mutex> lock(wake_mtx_);
        wake_cv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
    }
}

TickReport LedgerDriver::tick(Timestamp now) {
    TickReport r;

    // --- 1. DeFi refresh ---
    if (!last_refresh_ || now - *last_refresh_ >= ctx_.config.defi_refresh) {
        r.refreshed = refresh_sources(r);
        last_refresh_ = now;
    }

    // --- 2. Accrual ---
    r.accrued = ctx_.ledger.accrue(now);
    if (r.accrued > 0.0) {
        std::cout << "[DRIVER] Accrued " << format_usd(r.accrued)
                  << " (budget now " << format_usd(ctx_.ledger.available_budget()) << ")\n";
    }

    // --- 3. Retry audit rows that failed earlier ---
    if (ctx_.pipeline.pending_writes() > 0) {
        try {
            ctx_.pipeline.flush_pending();
        } catch (const StorageWriteError& e) {
            std::cerr << "[DRIVER] Audit retry failed: " << e.what() << "\n";
            ++r.errors;
        }
    }

    // --- 4. New transfers ---
    poll_transfers(r);

    // --- 5. Snapshot ---
    maybe_snapshot(now, r);

    return r;
}

bool LedgerDriver::refresh_sources(TickReport& r) {
    bool any = false;
    for (YieldSourceFeed* feed : ctx_.feeds) {
        if (!feed) continue;
        const std::string origin = feed->origin();

        // Network first, ledger lock second: fetch never runs under the lock.
        std::vector<YieldSource> fresh;
        try {
            fresh = feed->fetch_sources();
        } catch (const CollaboratorUnavailable& e) {
            std::cerr << "[DRIVER] Could not update " << origin << " yields: " << e.what() << "\n";
            ++r.errors;
            continue;
        }

        if (fresh.empty()) continue;   // keep the previous figures

        try {
            ctx_.ledger.replace_sources(origin, fresh);
        } catch (const ValidationError& e) {
            std::cerr << "[DRIVER] Rejected " << origin << " refresh: " << e.what() << "\n";
            ++r.errors;
            continue;
        }
        std::cout << "[DRIVER] Updated " << fresh.size() << " " << origin << " yield source(s)\n";
        any = true;
    }
    return any;
}

void LedgerDriver::poll_transfers(TickReport& r) {
    if (!ctx_.detector) return;

    std::vector<TransferEvent> events;
    try {
        events = ctx_.detector->poll_new_transfers();
    } catch (const CollaboratorUnavailable& e) {
        std::cerr << "[DRIVER] Transfer poll failed: " << e.what() << "\n";
        ++r.errors;
        return;
    }
    if (events.empty()) return;

    PipelineReport pr = ctx_.pipeline.process(events);
    r.transfers = pr.processed.size();
    r.errors   += pr.write_failures;

    for (const auto& p : pr.processed) {
        if (p.auth && !p.auth->within_budget) {
            ++r.over_budget;
            std::cerr << "[DRIVER] ALERT over-budget spend " << format_usd(p.record.amount())
                      << " " << p.record.asset() << " (" << p.auth->message << ") budget now "
                      << format_usd(ctx_.ledger.available_budget()) << "\n";
        }
    }
}

void LedgerDriver::maybe_snapshot(Timestamp now, TickReport& r) {
    if (!last_snapshot_) {
        // First tick: start the interval clock, no row yet.
        last_snapshot_ = now;
        return;
    }
    if (now - *last_snapshot_ < ctx_.config.snapshot_interval) return;

    try {
        ctx_.audit->write_snapshot(ctx_.ledger.snapshot(now));
        last_snapshot_ = now;
        r.snapshot_written = true;
        std::cout << "[DRIVER] Snapshot written\n";
    } catch (const StorageWriteError& e) {
        std::cerr << "[DRIVER] Snapshot write failed, retrying next tick: " << e.what() << "\n";
        ++r.errors;
    }
}
