#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace yieldguard {

struct Context;

// ---------------------------------------------------------------------------
// OperatorConsole: line-oriented command surface over the running ledger.
//
//   status                 ledger summary + stablecoin balances
//   budget                 budget breakdown and projections
//   yield                  per-source yield listing
//   history [n]            last n transactions (default 10, at most 1000)
//   spend <amount>         preview only, nothing is booked
//   topup                  amount currently transferable
//   transfer <amt> [dest]  execute, book, record, snapshot
//   mode [name]            show or change the spending mode
//   snapshot               write a snapshot row now
//   help, quit
//
// Runs on the caller's thread, concurrently with the LedgerDriver. Every
// ledger access goes through the ledger's own lock; collaborator calls
// (balances, executor) happen outside it.
//
// Bad input yields an "Error: ..." line. Ledger invariant violations are
// not caught here.
// ---------------------------------------------------------------------------
class OperatorConsole {
public:
    explicit OperatorConsole(Context& ctx);

    // Executes one command line and returns the text to show.
    std::string handle(const std::string& line);

    // Reads commands until EOF, `quit`, or ctx.running goes false.
    void run(std::istream& in, std::ostream& out);

    bool quit_requested() const { return quit_; }

private:
    std::string cmd_status();
    std::string cmd_budget();
    std::string cmd_yield();
    std::string cmd_history(const std::vector<std::string>& args);
    std::string cmd_spend(const std::vector<std::string>& args);
    std::string cmd_topup();
    std::string cmd_transfer(const std::vector<std::string>& args);
    std::string cmd_mode(const std::vector<std::string>& args);
    std::string cmd_snapshot();

    static std::string help_text();

    Context& ctx_;
    bool     quit_{false};
};

} // namespace yieldguard
