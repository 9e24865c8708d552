/**
 * Chain collaborator tests
 *
 *   1. eth_call encoding helpers
 *   2. Aave feed over a fake balance reader
 *   3. JSON-lines transfer inbox
 *   4. Transfer outbox
 */

#include "test/test_yieldguard.h"
#include "chain/AaveYieldFeed.hpp"
#include "chain/BaseChain.hpp"
#include "chain/ChainRpcClient.hpp"
#include "chain/JsonlTransferInbox.hpp"
#include "chain/OutboxTransferExecutor.hpp"

#include <boost/test/unit_test.hpp>
#include <nlohmann/json.hpp>

#include <fstream>

using namespace yieldguard;
using namespace yieldguard_test;
using json = nlohmann::json;

namespace {

void append(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::app | std::ios::binary);
    out << text;
}

std::string event_line(const std::string& id, double amount, const std::string& dir = "out") {
    json j = {{"id", id}, {"timestamp", "2026-01-01T00:00:00Z"}, {"amount", amount},
              {"asset", "USDC"}, {"direction", dir}};
    return j.dump() + "\n";
}

} // namespace

BOOST_AUTO_TEST_SUITE(chain_tests)

// =============================================================================
// RPC encoding
// =============================================================================
BOOST_AUTO_TEST_CASE(balance_of_calldata_pads_address)
{
    std::string data = ChainRpcClient::balance_of_calldata("0xAbCdEf0123456789aBcDeF0123456789AbCdEf01");
    BOOST_CHECK_EQUAL(data.size(), 10u + 64u);
    BOOST_CHECK_EQUAL(data.substr(0, 10), "0x70a08231");
    BOOST_CHECK_EQUAL(data.substr(10, 24), std::string(24, '0'));
    BOOST_CHECK_EQUAL(data.substr(34), "abcdef0123456789abcdef0123456789abcdef01");
}

BOOST_AUTO_TEST_CASE(hex_quantities_scale_by_decimals)
{
    // 1,500,000 units of a 6-decimal token = 1.5
    BOOST_CHECK_CLOSE(ChainRpcClient::hex_to_units("0x16e360", 6), 1.5, 1e-9);
    // 1e18 wei of an 18-decimal token = 1.0
    BOOST_CHECK_CLOSE(ChainRpcClient::hex_to_units("0xde0b6b3a7640000", 18), 1.0, 1e-9);
    BOOST_CHECK_EQUAL(ChainRpcClient::hex_to_units("0x", 6), 0.0);
    BOOST_CHECK_EQUAL(ChainRpcClient::hex_to_units("0x0", 6), 0.0);
    BOOST_CHECK_THROW(ChainRpcClient::hex_to_units("0xzz", 6), ValidationError);
}

// =============================================================================
// Aave feed
// =============================================================================
BOOST_AUTO_TEST_CASE(aave_feed_reports_position)
{
    FakeBalances reader;
    reader.by_token[base_chain::AAVE_V3_AUSDC] = 2500.0;
    AaveYieldFeed feed(reader, "0x1111111111111111111111111111111111111111", 4.0);

    BOOST_CHECK_EQUAL(feed.origin(), "aave_v3");
    std::vector<YieldSource> out = feed.fetch_sources();
    BOOST_REQUIRE_EQUAL(out.size(), 1u);
    BOOST_CHECK_EQUAL(out[0].name, "Aave V3 USDC");
    BOOST_CHECK_EQUAL(out[0].origin, "aave_v3");
    BOOST_CHECK_EQUAL(out[0].principal_usd, 2500.0);
    BOOST_CHECK_EQUAL(out[0].annual_rate_percent, 4.0);
    BOOST_CHECK_EQUAL(out[0].protocol_address, base_chain::AAVE_V3_POOL);
}

BOOST_AUTO_TEST_CASE(aave_feed_empty_without_position)
{
    FakeBalances reader;
    AaveYieldFeed feed(reader, "0x1111111111111111111111111111111111111111", 4.0);
    BOOST_CHECK(feed.fetch_sources().empty());

    reader.fail = true;
    BOOST_CHECK_THROW(feed.fetch_sources(), CollaboratorUnavailable);
}

// =============================================================================
// Transfer inbox
// =============================================================================
BOOST_FIXTURE_TEST_CASE(inbox_reads_only_complete_lines, TempDirSetup)
{
    const std::string file = path("in.jsonl");
    JsonlTransferInbox inbox(file);

    // Missing file: nothing yet
    BOOST_CHECK(inbox.poll_new_transfers().empty());

    std::string second = event_line("0xb", 2.0, "in");
    append(file, event_line("0xa", 1.0));
    append(file, second.substr(0, 20));   // writer mid-line

    std::vector<TransferEvent> got = inbox.poll_new_transfers();
    BOOST_REQUIRE_EQUAL(got.size(), 1u);
    BOOST_CHECK_EQUAL(got[0].id, "0xa");
    BOOST_CHECK(got[0].direction == Direction::OUT);

    append(file, second.substr(20));
    got = inbox.poll_new_transfers();
    BOOST_REQUIRE_EQUAL(got.size(), 1u);
    BOOST_CHECK_EQUAL(got[0].id, "0xb");
    BOOST_CHECK(got[0].direction == Direction::IN);

    // Nothing new
    BOOST_CHECK(inbox.poll_new_transfers().empty());
}

BOOST_FIXTURE_TEST_CASE(inbox_skips_malformed_lines, TempDirSetup)
{
    const std::string file = path("in.jsonl");
    append(file, "not json at all\n");
    append(file, "{\"id\":\"0xc\"}\n");   // missing fields
    append(file, event_line("0xd", 4.0));

    JsonlTransferInbox inbox(file);
    std::vector<TransferEvent> got = inbox.poll_new_transfers();
    BOOST_REQUIRE_EQUAL(got.size(), 1u);
    BOOST_CHECK_EQUAL(got[0].id, "0xd");
    BOOST_CHECK_EQUAL(got[0].amount, 4.0);
}

BOOST_FIXTURE_TEST_CASE(inbox_rereads_rotated_file, TempDirSetup)
{
    const std::string file = path("in.jsonl");
    append(file, event_line("0xlong-id-number-one", 1.0));
    append(file, event_line("0xlong-id-number-two", 1.0));

    JsonlTransferInbox inbox(file);
    BOOST_CHECK_EQUAL(inbox.poll_new_transfers().size(), 2u);

    {
        std::ofstream out(file, std::ios::trunc);
        out << event_line("0xe", 5.0);
    }
    std::vector<TransferEvent> got = inbox.poll_new_transfers();
    BOOST_REQUIRE_EQUAL(got.size(), 1u);
    BOOST_CHECK_EQUAL(got[0].id, "0xe");
}

// =============================================================================
// Transfer outbox
// =============================================================================
BOOST_FIXTURE_TEST_CASE(outbox_appends_request, TempDirSetup)
{
    OutboxTransferExecutor exec(path("out.jsonl"));

    TransferOutcome ok = exec.execute(25.0, "0xcard");
    BOOST_CHECK(ok.success);
    BOOST_CHECK_EQUAL(ok.reference.size(), 66u);
    BOOST_CHECK_EQUAL(ok.reference.substr(0, 2), "0x");

    std::ifstream in(path("out.jsonl"));
    std::string line;
    BOOST_REQUIRE(std::getline(in, line));
    json j = json::parse(line);
    BOOST_CHECK_EQUAL(j["reference"].get<std::string>(), ok.reference);
    BOOST_CHECK_EQUAL(j["amount"].get<double>(), 25.0);
    BOOST_CHECK_EQUAL(j["asset"].get<std::string>(), "USDC");
    BOOST_CHECK_EQUAL(j["destination"].get<std::string>(), "0xcard");

    TransferOutcome again = exec.execute(1.0, "0xcard");
    BOOST_CHECK(again.reference != ok.reference);
}

BOOST_FIXTURE_TEST_CASE(outbox_rejects_bad_requests, TempDirSetup)
{
    OutboxTransferExecutor exec(path("out.jsonl"));
    TransferOutcome neg = exec.execute(-1.0, "0xcard");
    BOOST_CHECK(!neg.success);
    BOOST_CHECK(!neg.error.empty());
    BOOST_CHECK(!exec.execute(0.0, "0xcard").success);
    BOOST_CHECK(!exec.execute(5.0, "").success);
    BOOST_CHECK(!std::filesystem::exists(path("out.jsonl")));

    // Not valid UTF-8: reported in the outcome, nothing appended
    TransferOutcome garbled = exec.execute(5.0, "0xca\xffrd");
    BOOST_CHECK(!garbled.success);
    BOOST_CHECK(!garbled.error.empty());
    BOOST_CHECK(garbled.reference.empty());
    BOOST_CHECK(!std::filesystem::exists(path("out.jsonl")));

    OutboxTransferExecutor nowhere(path("no/such/dir/out.jsonl"));
    TransferOutcome failed = nowhere.execute(5.0, "0xcard");
    BOOST_CHECK(!failed.success);
}

BOOST_AUTO_TEST_SUITE_END()
