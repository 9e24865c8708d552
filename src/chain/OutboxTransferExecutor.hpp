#pragma once
#include <mutex>
#include <string>

#include "chain/Collaborators.hpp"

namespace yieldguard {

// ---------------------------------------------------------------------------
// OutboxTransferExecutor: hands transfer requests to an external signer.
//
// Each request is appended to `path` as one JSON line:
//   {"reference","amount","asset","destination","timestamp"}
// and is considered executed once the line is durably written. Signing and
// broadcasting happen outside this process.
//
// reference = "0x" + 64 hex chars from RAND_bytes. The console books the
// transfer under this reference, so whatever later reports the on-chain
// transfer through the inbox must use it as the event id. Reporting the tx
// hash instead would book the same spend twice.
//
// Failures, including a destination that is not valid UTF-8, come back in
// the outcome; execute() does not throw.
// ---------------------------------------------------------------------------
class OutboxTransferExecutor : public TransferExecutor {
public:
    OutboxTransferExecutor(std::string path, std::string asset = "USDC");

    TransferOutcome execute(double amount, const std::string& destination) override;

    static std::string new_reference();

private:
    std::string path_;
    std::string asset_;
    std::mutex  mtx_;
};

} // namespace yieldguard
