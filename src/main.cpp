#include <csignal>
#include <chrono>
#include <iostream>
#include <memory>
#include <atomic>
#include <thread>

#include "runtime/Config.hpp"
#include "runtime/Context.hpp"
#include "runtime/LedgerDriver.hpp"
#include "runtime/OperatorConsole.hpp"

#include "audit/JsonlAuditWriter.hpp"
#include "chain/AaveYieldFeed.hpp"
#include "chain/ChainRpcClient.hpp"
#include "chain/JsonlTransferInbox.hpp"
#include "chain/OutboxTransferExecutor.hpp"
#include "ledger/Errors.hpp"
#include "ledger/Format.hpp"

#include <curl/curl.h>

using namespace yieldguard;

// ---------------------------------------------------------------------------
// Signal handler only touches this flag. Installed without SA_RESTART so a
// console blocked in getline() returns and the shutdown sequence runs on the
// main thread.
// ---------------------------------------------------------------------------
static std::atomic<bool> g_sigint_flag{false};

static void handle_sigint(int) {
    g_sigint_flag.store(true, std::memory_order_relaxed);
}

static void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = handle_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT,  &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : "yieldguard.json";

    Config cfg;
    try {
        cfg = Config::load_file(config_path);
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    // CURL: process-wide init, once, before any RPC client exists.
    curl_global_init(CURL_GLOBAL_ALL);

    int rc = 0;
    try {
        // ---- CONTEXT: single owner of all state ----
        auto audit = std::make_unique<JsonlAuditWriter>(cfg.data_dir);
        Context ctx(cfg, std::move(audit));
        ctx.seed_sources();

        if (ctx.config.restore_from_snapshot) {
            ctx.restore_from_audit();
        }

        // ---- COLLABORATORS ----
        ChainRpcClient rpc(ctx.config.rpc_url);
        ctx.balances = &rpc;

        AaveYieldFeed aave(rpc, ctx.config.wallet_address, ctx.config.aave_apy_percent);
        ctx.feeds.push_back(&aave);

        JsonlTransferInbox inbox(ctx.config.transfer_inbox);
        ctx.detector = &inbox;

        OutboxTransferExecutor outbox(ctx.config.transfer_outbox);
        ctx.executor = &outbox;

        std::cout << "[YIELDGUARD] Wallet " << ctx.config.wallet_address << "\n"
                  << "[YIELDGUARD] Principal " << format_usd(ctx.ledger.principal_usd())
                  << ", mode " << mode_name(ctx.ledger.mode()) << "\n"
                  << "[YIELDGUARD] Inbox " << ctx.config.transfer_inbox
                  << ", outbox " << ctx.config.transfer_outbox << "\n";

        install_signal_handlers();

        // ---- DRIVER ----
        LedgerDriver driver(ctx, ctx.config.tick_interval);
        driver.start();

        // ---- CONSOLE (main thread) ----
        OperatorConsole console(ctx);
        console.run(std::cin, std::cout);

        // stdin closed without quit: keep running headless until signalled.
        while (!console.quit_requested() && !g_sigint_flag.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        // ---- SHUTDOWN ----
        ctx.running.store(false);
        driver.stop();

        try {
            ctx.audit->write_snapshot(ctx.ledger.snapshot());
            std::cout << "[YIELDGUARD] Final snapshot written\n";
        } catch (const StorageWriteError& e) {
            std::cerr << "[YIELDGUARD] Final snapshot failed: " << e.what() << "\n";
            rc = 1;
        }
        if (ctx.pipeline.pending_writes() > 0) {
            try {
                ctx.pipeline.flush_pending();
            } catch (const StorageWriteError& e) {
                std::cerr << "[YIELDGUARD] " << ctx.pipeline.pending_writes()
                          << " audit row(s) lost at shutdown: " << e.what() << "\n";
                rc = 1;
            }
        }
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        rc = 2;
    } catch (const StorageWriteError& e) {
        std::cerr << "[YIELDGUARD] Storage unavailable: " << e.what() << "\n";
        rc = 1;
    } catch (const CollaboratorUnavailable& e) {
        std::cerr << "[YIELDGUARD] Startup failed: " << e.what() << "\n";
        rc = 1;
    }

    curl_global_cleanup();
    std::cout << "[YIELDGUARD] Exit " << rc << "\n";
    return rc;
}
