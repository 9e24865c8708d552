#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "ledger/SpendingMode.hpp"
#include "ledger/YieldSource.hpp"

namespace yieldguard {

// ---------------------------------------------------------------------------
// Config: daemon startup parameters from a JSON file.
//
// Every problem (missing file, bad JSON, wrong type, negative figure, unknown
// mode, malformed wallet) throws ConfigurationError. No silent defaults for
// present-but-invalid values; absent optional keys take the defaults below.
//
// Environment overrides (applied by load_file after parsing):
//   YIELDGUARD_RPC_URL   → rpc_url
//   YIELDGUARD_DATA_DIR  → data_dir (and the default inbox/outbox paths)
// ---------------------------------------------------------------------------
struct Config {
    std::string  wallet_address;
    std::string  rpc_url{"https://mainnet.base.org"};

    double       principal_usd{0.0};
    double       initial_yield{0.0};
    SpendingMode spending_mode{SpendingMode::BALANCED};
    std::vector<YieldSource> yield_sources;

    std::string  data_dir{"data"};
    std::string  transfer_inbox;         // default <data_dir>/transfers_in.jsonl
    std::string  transfer_outbox;        // default <data_dir>/transfer_outbox.jsonl
    std::string  transfer_destination;

    std::chrono::seconds tick_interval{30};
    std::chrono::seconds defi_refresh{3600};
    std::chrono::seconds snapshot_interval{3600};
    std::chrono::seconds accrual_threshold{360};

    double       aave_apy_percent{4.0};
    bool         restore_from_snapshot{false};

    static Config load_file(const std::string& path);
    static Config from_json(const nlohmann::json& j);

    // Reads the YIELDGUARD_* variables. Split out so tests can skip it.
    void apply_env();

    static bool valid_address(const std::string& addr);
};

} // namespace yieldguard
