#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "chain/Collaborators.hpp"

namespace yieldguard {

// ---------------------------------------------------------------------------
// ChainRpcClient: Ethereum JSON-RPC over HTTP POST (libcurl).
//
// Read-only: eth_call and friends. Nothing here signs or broadcasts.
//
// THREADING: one persistent CURL easy handle guarded by mtx_. The driver's
//   DeFi refresh and the console's balance report may call concurrently.
//   Never called with the ledger lock held.
// ---------------------------------------------------------------------------
class ChainRpcClient : public TokenBalanceReader {
public:
    explicit ChainRpcClient(const std::string& rpc_url);
    ~ChainRpcClient() override;

    ChainRpcClient(const ChainRpcClient&) = delete;
    ChainRpcClient& operator=(const ChainRpcClient&) = delete;

    // Returns the "result" member. Throws CollaboratorUnavailable on transport
    // failure, unparseable body, or an RPC "error" member.
    nlohmann::json call(const std::string& method, const nlohmann::json& params);

    double erc20_balance(const std::string& token,
                         const std::string& holder,
                         int decimals) override;

    // balanceOf(address) calldata: selector 0x70a08231 + 32-byte address.
    static std::string balance_of_calldata(const std::string& holder);

    // "0x..." uint256 → whole units. "0x" and "" decode to 0.
    static double hex_to_units(const std::string& hex, int decimals);

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);
    std::string perform(const std::string& body);

    std::string url_;
    CURL*       curl_{nullptr};
    uint64_t    next_id_{1};
    std::mutex  mtx_;
};

} // namespace yieldguard
