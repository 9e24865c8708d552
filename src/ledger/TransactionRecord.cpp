#include "ledger/TransactionRecord.hpp"
#include "ledger/Errors.hpp"

using namespace yieldguard;

const char* yieldguard::to_string(Direction d) {
    return d == Direction::IN ? "in" : "out";
}

const char* yieldguard::to_string(TxStatus s) {
    switch (s) {
        case TxStatus::DETECTED:      return "detected";
        case TxStatus::WITHIN_BUDGET: return "within_budget";
        case TxStatus::OVER_BUDGET:   return "over_budget";
    }
    return "detected";
}

Direction yieldguard::parse_direction(const std::string& text) {
    if (text == "in")  return Direction::IN;
    if (text == "out") return Direction::OUT;
    throw ValidationError("unknown transfer direction: " + text);
}

TxStatus yieldguard::parse_status(const std::string& text) {
    if (text == "detected")      return TxStatus::DETECTED;
    if (text == "within_budget") return TxStatus::WITHIN_BUDGET;
    if (text == "over_budget")   return TxStatus::OVER_BUDGET;
    throw ValidationError("unknown transaction status: " + text);
}

TransactionRecord::TransactionRecord(const TransferEvent& ev) : ev_(ev) {
    if (ev_.id.empty()) {
        throw ValidationError("transaction record without id");
    }
}

TransactionRecord TransactionRecord::restore(const TransferEvent& ev, TxStatus status) {
    TransactionRecord rec(ev);
    rec.status_  = status;
    rec.settled_ = (status != TxStatus::DETECTED);
    return rec;
}

void TransactionRecord::settle(bool within_budget) {
    if (settled_) {
        throw LedgerInvariantError("transaction " + ev_.id + " settled twice");
    }
    status_  = within_budget ? TxStatus::WITHIN_BUDGET : TxStatus::OVER_BUDGET;
    settled_ = true;
}

bool TransactionRecord::operator==(const TransactionRecord& o) const {
    return ev_.id == o.ev_.id &&
           ev_.timestamp == o.ev_.timestamp &&
           ev_.amount == o.ev_.amount &&
           ev_.asset == o.ev_.asset &&
           ev_.direction == o.ev_.direction &&
           ev_.counterparty == o.ev_.counterparty &&
           ev_.category == o.ev_.category &&
           status_ == o.status_;
}
