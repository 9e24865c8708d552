#include "audit/AuditCodec.hpp"
#include "ledger/Errors.hpp"

using namespace yieldguard;
using json = nlohmann::json;

json yieldguard::transfer_event_to_json(const TransferEvent& ev) {
    json j;
    j["id"]        = ev.id;
    j["timestamp"] = format_utc(ev.timestamp);
    j["amount"]    = ev.amount;
    j["asset"]     = ev.asset;
    j["direction"] = to_string(ev.direction);
    if (!ev.counterparty.empty()) j["counterparty"] = ev.counterparty;
    if (!ev.category.empty())     j["category"]     = ev.category;
    return j;
}

TransferEvent yieldguard::transfer_event_from_json(const json& j) {
    try {
        TransferEvent ev;
        ev.id        = j.at("id").get<std::string>();
        ev.timestamp = parse_utc(j.at("timestamp").get<std::string>());
        ev.amount    = j.at("amount").get<double>();
        ev.asset     = j.at("asset").get<std::string>();
        ev.direction = parse_direction(j.at("direction").get<std::string>());
        ev.counterparty = j.value("counterparty", std::string());
        ev.category     = j.value("category", std::string());
        if (ev.id.empty()) throw ValidationError("transfer event with empty id");
        return ev;
    } catch (const json::exception& e) {
        throw ValidationError(std::string("bad transfer event: ") + e.what());
    }
}

json yieldguard::record_to_json(const TransactionRecord& rec) {
    json j = transfer_event_to_json(rec.event());
    j["status"]        = to_string(rec.status());
    j["within_budget"] = rec.status() == TxStatus::WITHIN_BUDGET ? 1 : 0;
    return j;
}

TransactionRecord yieldguard::record_from_json(const json& j) {
    TransferEvent ev = transfer_event_from_json(j);
    try {
        return TransactionRecord::restore(ev, parse_status(j.at("status").get<std::string>()));
    } catch (const json::exception& e) {
        throw ValidationError(std::string("bad transaction row: ") + e.what());
    }
}

json yieldguard::snapshot_payload(const SnapshotRow& row) {
    json j;
    j["seq"]                  = row.seq;
    j["timestamp"]            = format_utc(row.timestamp);
    j["principal_usd"]        = row.principal_usd;
    j["accrued_yield_usd"]    = row.accrued_yield_usd;
    j["spent_from_yield_usd"] = row.spent_from_yield_usd;
    j["spending_mode"]        = mode_name(row.mode);
    j["prev_hash"]            = row.prev_hash;
    return j;
}

json yieldguard::snapshot_to_json(const SnapshotRow& row) {
    json j = snapshot_payload(row);
    j["hash"] = row.hash;
    return j;
}

SnapshotRow yieldguard::snapshot_from_json(const json& j) {
    try {
        SnapshotRow row;
        row.seq                  = j.at("seq").get<uint64_t>();
        row.timestamp            = parse_utc(j.at("timestamp").get<std::string>());
        row.principal_usd        = j.at("principal_usd").get<double>();
        row.accrued_yield_usd    = j.at("accrued_yield_usd").get<double>();
        row.spent_from_yield_usd = j.at("spent_from_yield_usd").get<double>();
        row.mode                 = parse_mode(j.at("spending_mode").get<std::string>());
        row.prev_hash            = j.at("prev_hash").get<std::string>();
        row.hash                 = j.at("hash").get<std::string>();
        return row;
    } catch (const json::exception& e) {
        throw ValidationError(std::string("bad snapshot row: ") + e.what());
    }
}
