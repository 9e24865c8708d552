#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "chain/Collaborators.hpp"

namespace yieldguard {

// ---------------------------------------------------------------------------
// JsonlTransferInbox: TransferDetector fed by an external indexer.
//
// The indexer appends one JSON transfer event per line to `path`. Each poll
// reads from the last consumed byte offset to the last complete line; a
// trailing line without '\n' is left for the next poll. Malformed lines are
// skipped with a warning. A file that shrank (rotated) is re-read from 0.
//
// Event ids are the dedup key. A transfer that the operator console started
// through OutboxTransferExecutor is already booked under its outbox
// `reference`; the indexer must report it with that id, not the tx hash.
// ---------------------------------------------------------------------------
class JsonlTransferInbox : public TransferDetector {
public:
    explicit JsonlTransferInbox(std::string path);

    std::vector<TransferEvent> poll_new_transfers() override;

    uint64_t offset() const { return offset_; }

private:
    std::string path_;
    uint64_t    offset_{0};
};

} // namespace yieldguard
