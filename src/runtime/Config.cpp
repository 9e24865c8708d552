#include "runtime/Config.hpp"
#include "ledger/Errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace yieldguard;
using json = nlohmann::json;

namespace {

double read_amount(const json& j, const char* key, double def) {
    if (!j.contains(key)) return def;
    const json& v = j.at(key);
    if (!v.is_number()) {
        throw ConfigurationError(std::string("[CONFIG] ") + key + " must be a number");
    }
    double d = v.get<double>();
    if (!std::isfinite(d) || d < 0.0) {
        throw ConfigurationError(std::string("[CONFIG] ") + key + " must be non-negative");
    }
    return d;
}

std::string read_string(const json& j, const char* key, const std::string& def) {
    if (!j.contains(key) || j.at(key).is_null()) return def;
    if (!j.at(key).is_string()) {
        throw ConfigurationError(std::string("[CONFIG] ") + key + " must be a string");
    }
    return j.at(key).get<std::string>();
}

std::chrono::seconds read_seconds(const json& j, const char* key, std::chrono::seconds def,
                                  bool allow_zero) {
    if (!j.contains(key)) return def;
    const json& v = j.at(key);
    if (!v.is_number_integer()) {
        throw ConfigurationError(std::string("[CONFIG] ") + key + " must be an integer");
    }
    long long s = v.get<long long>();
    if (s < 0 || (s == 0 && !allow_zero)) {
        throw ConfigurationError(std::string("[CONFIG] ") + key + " out of range");
    }
    return std::chrono::seconds(s);
}

std::string join_path(const std::string& dir, const char* file) {
    return (std::filesystem::path(dir) / file).string();
}

} // namespace

bool Config::valid_address(const std::string& addr) {
    if (addr.size() != 42 || addr[0] != '0' || (addr[1] != 'x' && addr[1] != 'X')) return false;
    for (size_t i = 2; i < addr.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(addr[i]))) return false;
    }
    return true;
}

Config Config::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("[CONFIG] top level must be an object");
    }

    Config c;

    // Safe address wins over the raw wallet when both are present.
    c.wallet_address = read_string(j, "safe_address", "");
    if (c.wallet_address.empty()) c.wallet_address = read_string(j, "wallet_address", "");
    if (c.wallet_address.empty()) {
        throw ConfigurationError("[CONFIG] wallet_address (or safe_address) is required");
    }
    if (!valid_address(c.wallet_address)) {
        throw ConfigurationError("[CONFIG] malformed wallet address: " + c.wallet_address);
    }

    c.rpc_url       = read_string(j, "rpc_url", c.rpc_url);
    c.principal_usd = read_amount(j, "principal_usd", 0.0);
    c.initial_yield = read_amount(j, "initial_yield", 0.0);

    try {
        c.spending_mode = parse_mode(read_string(j, "spending_mode", "balanced"));
    } catch (const UnknownModeError& e) {
        throw ConfigurationError(std::string("[CONFIG] ") + e.what());
    }

    if (j.contains("yield_sources")) {
        const json& arr = j.at("yield_sources");
        if (!arr.is_array()) {
            throw ConfigurationError("[CONFIG] yield_sources must be an array");
        }
        for (const auto& sj : arr) {
            if (!sj.is_object()) {
                throw ConfigurationError("[CONFIG] yield_sources entries must be objects");
            }
            YieldSource s;
            s.name                = read_string(sj, "name", "Unknown");
            s.origin              = read_string(sj, "type", kSimulatedOrigin);
            s.principal_usd       = read_amount(sj, "principal_usd", 0.0);
            s.annual_rate_percent = read_amount(sj, "apy_percent", 0.0);
            s.protocol_address    = read_string(sj, "protocol_address", "");
            s.last_updated        = Clock::now();
            if (s.origin.empty()) {
                throw ConfigurationError("[CONFIG] yield source '" + s.name + "' has empty type");
            }
            c.yield_sources.push_back(s);
        }
    }

    c.data_dir             = read_string(j, "data_dir", c.data_dir);
    c.transfer_inbox       = read_string(j, "transfer_inbox", "");
    c.transfer_outbox      = read_string(j, "transfer_outbox", "");
    c.transfer_destination = read_string(j, "transfer_destination", "");

    c.tick_interval     = read_seconds(j, "tick_interval_sec", c.tick_interval, false);
    c.defi_refresh      = read_seconds(j, "defi_refresh_sec", c.defi_refresh, false);
    c.snapshot_interval = read_seconds(j, "snapshot_interval_sec", c.snapshot_interval, false);
    c.accrual_threshold = read_seconds(j, "accrual_threshold_sec", c.accrual_threshold, true);

    c.aave_apy_percent = read_amount(j, "aave_apy_percent", c.aave_apy_percent);

    if (j.contains("restore_from_snapshot")) {
        if (!j.at("restore_from_snapshot").is_boolean()) {
            throw ConfigurationError("[CONFIG] restore_from_snapshot must be a boolean");
        }
        c.restore_from_snapshot = j.at("restore_from_snapshot").get<bool>();
    }

    if (c.data_dir.empty()) {
        throw ConfigurationError("[CONFIG] data_dir must not be empty");
    }
    if (c.transfer_inbox.empty())  c.transfer_inbox  = join_path(c.data_dir, "transfers_in.jsonl");
    if (c.transfer_outbox.empty()) c.transfer_outbox = join_path(c.data_dir, "transfer_outbox.jsonl");

    return c;
}

void Config::apply_env() {
    if (const char* rpc = std::getenv("YIELDGUARD_RPC_URL")) {
        if (*rpc) rpc_url = rpc;
    }
    if (const char* dir = std::getenv("YIELDGUARD_DATA_DIR")) {
        if (*dir) {
            // Only move the inbox/outbox if they were derived from data_dir.
            const std::string old_inbox  = join_path(data_dir, "transfers_in.jsonl");
            const std::string old_outbox = join_path(data_dir, "transfer_outbox.jsonl");
            data_dir = dir;
            if (transfer_inbox == old_inbox)   transfer_inbox  = join_path(data_dir, "transfers_in.jsonl");
            if (transfer_outbox == old_outbox) transfer_outbox = join_path(data_dir, "transfer_outbox.jsonl");
        }
    }
}

Config Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("[CONFIG] Config file not found: " + path);
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::exception& e) {
        throw ConfigurationError("[CONFIG] Failed to parse " + path + ": " + e.what());
    }

    Config c = from_json(j);
    c.apply_env();
    std::cout << "[CONFIG] Loaded " << path << " (mode=" << mode_name(c.spending_mode)
              << ", sources=" << c.yield_sources.size() << ")\n";
    return c;
}
