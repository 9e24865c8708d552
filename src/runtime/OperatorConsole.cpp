#include "runtime/OperatorConsole.hpp"
#include "runtime/Context.hpp"
#include "runtime/Reports.hpp"
#include "chain/BaseChain.hpp"
#include "ledger/Errors.hpp"
#include "ledger/Format.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

using namespace yieldguard;

namespace {

std::vector<std::string> split_words(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> words;
    std::string w;
    while (in >> w) words.push_back(w);
    return words;
}

// Accepts "25", "25.50", "$25". Throws ValidationError otherwise.
double parse_amount(const std::string& text) {
    std::string s = text;
    if (!s.empty() && s[0] == '$') s.erase(0, 1);
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &used);
    } catch (const std::logic_error&) {
        throw ValidationError("invalid amount: " + text);
    }
    if (used != s.size() || !std::isfinite(v)) {
        throw ValidationError("invalid amount: " + text);
    }
    return v;
}

// Destinations are addresses or short labels: printable ASCII only.
bool printable_destination(const std::string& dest) {
    for (unsigned char c : dest) {
        if (c < 0x21 || c > 0x7e) return false;
    }
    return true;
}

constexpr size_t kMaxHistory = 1000;

std::string error_line(const std::string& msg) {
    return "Error: " + msg + "\n";
}

} // namespace

OperatorConsole::OperatorConsole(Context& ctx) : ctx_(ctx) {}

std::string OperatorConsole::handle(const std::string& line) {
    std::vector<std::string> words = split_words(line);
    if (words.empty()) return "";

    std::string cmd = words.front();
    if (!cmd.empty() && cmd[0] == '/') cmd.erase(0, 1);
    std::vector<std::string> args(words.begin() + 1, words.end());

    try {
        if (cmd == "status")   return cmd_status();
        if (cmd == "budget")   return cmd_budget();
        if (cmd == "yield")    return cmd_yield();
        if (cmd == "history")  return cmd_history(args);
        if (cmd == "spend")    return cmd_spend(args);
        if (cmd == "topup")    return cmd_topup();
        if (cmd == "transfer") return cmd_transfer(args);
        if (cmd == "mode")     return cmd_mode(args);
        if (cmd == "snapshot") return cmd_snapshot();
        if (cmd == "help")     return help_text();
        if (cmd == "quit" || cmd == "exit") {
            quit_ = true;
            return "Shutting down.\n";
        }
    } catch (const ValidationError& e) {
        return error_line(e.what());
    } catch (const StorageWriteError& e) {
        return error_line(std::string("audit write failed: ") + e.what());
    }
    return error_line("unknown command '" + cmd + "' (try help)");
}

void OperatorConsole::run(std::istream& in, std::ostream& out) {
    out << help_text() << "> " << std::flush;
    std::string line;
    while (ctx_.running.load() && std::getline(in, line)) {
        out << handle(line);
        if (quit_) break;
        out << "> " << std::flush;
    }
    std::cout << "[CONSOLE] Input closed\n";
}

std::string OperatorConsole::cmd_status() {
    // Balances are fetched before the snapshot so the RPC round-trips never
    // overlap a ledger lock.
    std::map<std::string, double> balances;
    bool balances_ok = ctx_.balances != nullptr;
    if (balances_ok) {
        try {
            for (const auto& token : base_chain::STABLECOINS) {
                double amt = ctx_.balances->erc20_balance(token.address,
                                                          ctx_.config.wallet_address,
                                                          token.decimals);
                if (amt > 0.0) balances[token.symbol] = amt;
            }
        } catch (const CollaboratorUnavailable& e) {
            std::cerr << "[CONSOLE] Balance lookup failed: " << e.what() << "\n";
            balances_ok = false;
            balances.clear();
        }
    }
    return status_report(ctx_.ledger.snapshot(), balances, balances_ok);
}

std::string OperatorConsole::cmd_budget() {
    ctx_.ledger.accrue(Clock::now());
    return budget_report(ctx_.ledger.snapshot());
}

std::string OperatorConsole::cmd_yield() {
    return yield_report(ctx_.ledger.snapshot());
}

std::string OperatorConsole::cmd_history(const std::vector<std::string>& args) {
    size_t limit = 10;
    if (!args.empty()) {
        double n = parse_amount(args[0]);
        if (n < 1.0 || n != std::floor(n)) {
            throw ValidationError("history count must be a positive integer");
        }
        limit = n > static_cast<double>(kMaxHistory) ? kMaxHistory : static_cast<size_t>(n);
    }
    return history_report(ctx_.audit->recent_transactions(limit));
}

std::string OperatorConsole::cmd_spend(const std::vector<std::string>& args) {
    if (args.size() != 1) throw ValidationError("usage: spend <amount>");
    const double amount = parse_amount(args[0]);
    ctx_.ledger.accrue(Clock::now());
    return preview_report(ctx_.ledger.preview(amount));
}

std::string OperatorConsole::cmd_topup() {
    ctx_.ledger.accrue(Clock::now());
    return topup_report(ctx_.ledger.snapshot());
}

std::string OperatorConsole::cmd_transfer(const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        throw ValidationError("usage: transfer <amount> [destination]");
    }
    const double amount = parse_amount(args[0]);
    if (amount <= 0.0) throw ValidationError("transfer amount must be positive");

    const std::string destination = args.size() == 2 ? args[1] : ctx_.config.transfer_destination;
    if (destination.empty()) {
        throw ValidationError("no destination given and transfer_destination not configured");
    }
    if (!printable_destination(destination)) {
        throw ValidationError("destination must be printable ASCII");
    }
    if (!ctx_.executor) return error_line("transfers are not available");

    const Timestamp now = Clock::now();
    ctx_.ledger.accrue(now);
    const double budget = ctx_.ledger.available_budget();
    if (amount > budget) {
        std::ostringstream out;
        out << "Transfer refused: " << format_usd(amount)
            << " exceeds available yield budget " << format_usd(budget) << "\n";
        return out.str();
    }

    // The executor runs without any ledger lock held.
    TransferOutcome outcome = ctx_.executor->execute(amount, destination);
    if (!outcome.success) {
        std::cerr << "[CONSOLE] Transfer failed: " << outcome.error << "\n";
        return error_line("transfer failed: " + outcome.error);
    }

    AuthorizationResult auth = ctx_.ledger.authorize_and_record(amount);

    TransferEvent ev;
    ev.id           = outcome.reference;
    ev.timestamp    = std::chrono::time_point_cast<std::chrono::seconds>(now);
    ev.amount       = amount;
    ev.asset        = "USDC";
    ev.direction    = Direction::OUT;
    ev.counterparty = destination;
    ev.category     = "transfer";
    ctx_.pipeline.record_booked(ev, auth);

    std::ostringstream out;
    out << "Transferred " << format_usd(amount) << " to " << destination << "\n"
        << "  Reference: " << outcome.reference << "\n"
        << "  " << auth.message << "\n";

    try {
        ctx_.audit->write_snapshot(ctx_.ledger.snapshot(now));
    } catch (const StorageWriteError& e) {
        std::cerr << "[CONSOLE] Snapshot after transfer failed: " << e.what() << "\n";
        out << "  (snapshot not written, will be taken on the next interval)\n";
    }

    std::cout << "[CONSOLE] Transfer " << outcome.reference << " " << format_usd(amount)
              << " -> " << destination << "\n";
    return out.str();
}

std::string OperatorConsole::cmd_mode(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::ostringstream out;
        out << "Current mode: " << mode_label(ctx_.ledger.mode()) << "\n"
            << "Available modes:\n";
        for (SpendingMode m : kAllSpendingModes) {
            out << "  " << mode_label(m) << "\n";
        }
        return out.str();
    }
    if (args.size() != 1) throw ValidationError("usage: mode [name]");

    const SpendingMode m = parse_mode(args[0]);   // UnknownModeError is a ValidationError
    ctx_.ledger.set_mode(m);

    std::ostringstream out;
    out << "Mode set to " << mode_label(m) << "\n"
        << "  Available budget: " << format_usd(ctx_.ledger.available_budget()) << "\n";
    try {
        ctx_.audit->write_snapshot(ctx_.ledger.snapshot());
    } catch (const StorageWriteError& e) {
        std::cerr << "[CONSOLE] Snapshot after mode change failed: " << e.what() << "\n";
    }
    return out.str();
}

std::string OperatorConsole::cmd_snapshot() {
    ctx_.ledger.accrue(Clock::now());
    ctx_.audit->write_snapshot(ctx_.ledger.snapshot());
    std::optional<SnapshotRow> row = ctx_.audit->latest_snapshot();
    if (!row) return "Snapshot written.\n";
    return "Snapshot #" + std::to_string(row->seq) + " written (" + row->hash.substr(0, 16) + ")\n";
}

std::string OperatorConsole::help_text() {
    return "Commands:\n"
           "  status                 ledger summary and wallet balances\n"
           "  budget                 budget breakdown\n"
           "  yield                  yield sources\n"
           "  history [n]            recent transactions\n"
           "  spend <amount>         check a spend against the budget\n"
           "  topup                  amount available to transfer\n"
           "  transfer <amt> [dest]  move yield out\n"
           "  mode [name]            show or set spending mode\n"
           "  snapshot               write a ledger snapshot\n"
           "  help, quit\n";
}
