#pragma once
#include <nlohmann/json.hpp>

#include "audit/AuditWriter.hpp"
#include "ledger/TransactionRecord.hpp"

namespace yieldguard {

// JSON forms shared by the audit files, the transfer inbox and the outbox.
// The from_json helpers throw ValidationError on missing or mistyped fields.

nlohmann::json    transfer_event_to_json(const TransferEvent& ev);
TransferEvent     transfer_event_from_json(const nlohmann::json& j);

nlohmann::json    record_to_json(const TransactionRecord& rec);
TransactionRecord record_from_json(const nlohmann::json& j);

// Row without the "hash" field: the exact bytes the hash is computed over.
nlohmann::json    snapshot_payload(const SnapshotRow& row);
nlohmann::json    snapshot_to_json(const SnapshotRow& row);
SnapshotRow       snapshot_from_json(const nlohmann::json& j);

} // namespace yieldguard
