#include "chain/OutboxTransferExecutor.hpp"
#include "ledger/Errors.hpp"
#include "ledger/Format.hpp"
#include "ledger/Time.hpp"
#include <nlohmann/json.hpp>
#include <openssl/rand.h>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace yieldguard;
using json = nlohmann::json;

OutboxTransferExecutor::OutboxTransferExecutor(std::string path, std::string asset)
    : path_(std::move(path)), asset_(std::move(asset)) {}

std::string OutboxTransferExecutor::new_reference() {
    unsigned char bytes[32];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw CollaboratorUnavailable("[EXECUTOR] RAND_bytes failed");
    }
    std::ostringstream out;
    out << "0x";
    for (unsigned char b : bytes)
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    return out.str();
}

TransferOutcome OutboxTransferExecutor::execute(double amount, const std::string& destination) {
    TransferOutcome r;
    if (!std::isfinite(amount) || amount <= 0.0) {
        r.error = "amount must be positive";
        return r;
    }
    if (destination.empty()) {
        r.error = "no destination configured";
        return r;
    }

    try {
        r.reference = new_reference();
    } catch (const CollaboratorUnavailable& e) {
        r.error = e.what();
        return r;
    }

    json j;
    j["reference"]   = r.reference;
    j["amount"]      = amount;
    j["asset"]       = asset_;
    j["destination"] = destination;
    j["timestamp"]   = format_utc(Clock::now());

    // Serialize before opening the file so a rejected request leaves no line.
    std::string line;
    try {
        line = j.dump();
    } catch (const json::exception& e) {
        std::cerr << "[EXECUTOR] Rejected request: " << e.what() << "\n";
        r.error = "destination is not valid text";
        r.reference.clear();
        return r;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        r.error = "cannot open outbox " + path_;
        return r;
    }
    out << line << "\n";
    out.flush();
    if (!out) {
        r.error = "write failed on outbox " + path_;
        return r;
    }

    r.success = true;
    std::cout << "[EXECUTOR] Queued " << format_usd(amount) << " " << asset_
              << " to " << destination << " ref=" << r.reference.substr(0, 10) << "...\n";
    return r;
}
