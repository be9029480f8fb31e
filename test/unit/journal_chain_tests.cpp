// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "bridge/json_codec.hpp"
#include "chain/journal_chain.hpp"
#include "../bridge/bridge_test_helpers.hpp"
#include "../bridge/mock_blockchain_service.hpp"
#include "../test_temp_dir.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace swaprelay;
using namespace swaprelay::bridge;
using namespace swaprelay::test;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

void AppendText(const fs::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::app | std::ios::binary);
  out << text;
}

std::string EventLine(const ContractEvent& event) {
  return ContractEventToJson(event).dump() + "\n";
}

std::vector<json> ReadJsonLines(const fs::path& path) {
  std::vector<json> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) lines.push_back(json::parse(line));
  }
  return lines;
}

chain::JournalChainService::Config MakeConfig(const TempDir& dir) {
  chain::JournalChainService::Config config;
  config.name = "alpha";
  config.events_path = dir.path() / "alpha.events.jsonl";
  config.calls_path = dir.path() / "alpha.calls.jsonl";
  config.poll_interval = std::chrono::milliseconds(20);
  return config;
}

} // namespace

TEST_CASE("JournalChainService - reads contract events", "[chain][journal]") {
  TempDir dir("journal_read");
  boost::asio::io_context io;
  chain::JournalChainService chain(io, MakeConfig(dir));

  SECTION("Missing file is not an error") {
    CHECK(chain.PollJournal() == 0);
    CHECK_FALSE(chain.failed());
  }

  SECTION("Lines are queued in order, blank lines skipped") {
    AppendText(chain.config().events_path,
               EventLine(Initiated(MakeTransfer(1))) + "\n   \n" +
                   EventLine(Locked(MakeLock(2))));
    CHECK(chain.PollJournal() == 2);
    CHECK(chain.lines_read() == 3);

    auto first = chain.Events().PollNext();
    REQUIRE(first.ready());
    CHECK(first.item->initiator.kind == InitiatorEventKind::Initiated);
    CHECK(first.item->bridge_transfer_id() == MakeId(1));

    auto second = chain.Events().PollNext();
    REQUIRE(second.ready());
    CHECK(second.item->counterparty.kind == CounterpartyEventKind::Locked);

    CHECK(chain.Events().PollNext().status == PollStatus::Pending);
  }

  SECTION("Only new lines are read on the next poll") {
    AppendText(chain.config().events_path, EventLine(Initiated(MakeTransfer(1))));
    CHECK(chain.PollJournal() == 1);
    CHECK(chain.PollJournal() == 0);
    AppendText(chain.config().events_path, EventLine(Initiated(MakeTransfer(2))));
    CHECK(chain.PollJournal() == 1);
  }

  SECTION("Incomplete line waits for its newline") {
    std::string line = EventLine(Initiated(MakeTransfer(3)));
    AppendText(chain.config().events_path, line.substr(0, 40));
    CHECK(chain.PollJournal() == 0);
    CHECK_FALSE(chain.failed());

    AppendText(chain.config().events_path, line.substr(40));
    CHECK(chain.PollJournal() == 1);
  }
}

TEST_CASE("JournalChainService - malformed line fails the stream", "[chain][journal]") {
  TempDir dir("journal_malformed");
  boost::asio::io_context io;
  chain::JournalChainService chain(io, MakeConfig(dir));

  AppendText(chain.config().events_path,
             EventLine(Initiated(MakeTransfer(1))) + "{\"contract\":\"initiator\"}\n" +
                 EventLine(Initiated(MakeTransfer(2))));
  CHECK(chain.PollJournal() == 1);
  CHECK(chain.failed());

  auto first = chain.Events().PollNext();
  REQUIRE(first.ready());
  CHECK(first.item->bridge_transfer_id() == MakeId(1));

  auto failed = chain.Events().PollNext();
  CHECK(failed.status == PollStatus::Failed);
  CHECK(failed.error.find("line 2") != std::string::npos);

  CHECK(chain.Events().PollNext().status == PollStatus::Ended);

  // Nothing after the failure is read
  AppendText(chain.config().events_path, EventLine(Initiated(MakeTransfer(3))));
  CHECK(chain.PollJournal() == 0);
}

TEST_CASE("JournalChainService - contract calls are journaled", "[chain][journal]") {
  TempDir dir("journal_calls");
  boost::asio::io_context io;
  chain::JournalChainService chain(io, MakeConfig(dir));

  std::vector<ContractCallResult> results;
  auto handler = [&results](const ContractCallResult& r) { results.push_back(r); };

  chain.counterparty_contract().LockBridgeTransfer(MakeLock(1), handler);
  chain.initiator_contract().CompleteBridgeTransfer(MakeId(2), uint256(0x42), handler);
  chain.counterparty_contract().AbortBridgeTransfer(MakeId(3), handler);

  // Results are delivered asynchronously
  CHECK(results.empty());
  RunUntilIdle(io);
  REQUIRE(results.size() == 3);
  for (const auto& r : results) {
    CHECK(r.ok);
  }

  auto lines = ReadJsonLines(chain.config().calls_path);
  REQUIRE(lines.size() == 3);

  CHECK(lines[0]["call"] == "lock");
  CHECK(lines[0]["chain"] == "alpha");
  CHECK(lines[0]["bridge_transfer_id"] == MakeId(1).GetHex());
  CHECK(lines[0]["amount"] == 1000);
  CHECK(lines[0]["time_lock"] == 3600);
  CHECK(lines[0]["recipient_address"] == MakeAddress(0xb0).ToString());

  CHECK(lines[1]["call"] == "complete");
  CHECK(lines[1]["secret"] == uint256(0x42).GetHex());

  CHECK(lines[2]["call"] == "abort");
  CHECK(lines[2]["bridge_transfer_id"] == MakeId(3).GetHex());
}

TEST_CASE("JournalChainService - chain name with invalid UTF-8", "[chain][journal]") {
  TempDir dir("journal_utf8");
  boost::asio::io_context io;
  auto config = MakeConfig(dir);
  config.name = "alpha\xff";
  chain::JournalChainService chain(io, config);

  std::vector<ContractCallResult> results;
  REQUIRE_NOTHROW(chain.counterparty_contract().AbortBridgeTransfer(
      MakeId(4), [&results](const ContractCallResult& r) { results.push_back(r); }));
  RunUntilIdle(io);
  REQUIRE(results.size() == 1);
  CHECK(results[0].ok);

  auto lines = ReadJsonLines(chain.config().calls_path);
  REQUIRE(lines.size() == 1);
  CHECK(lines[0]["call"] == "abort");
  CHECK(lines[0]["chain"] == "alpha\xEF\xBF\xBD");
}

TEST_CASE("JournalChainService - unwritable call journal reports failure",
          "[chain][journal]") {
  TempDir dir("journal_unwritable");
  boost::asio::io_context io;
  auto config = MakeConfig(dir);
  // A directory cannot be opened for append
  config.calls_path = dir.path();
  chain::JournalChainService chain(io, config);

  std::vector<ContractCallResult> results;
  chain.counterparty_contract().AbortBridgeTransfer(
      MakeId(1), [&results](const ContractCallResult& r) { results.push_back(r); });
  RunUntilIdle(io);

  REQUIRE(results.size() == 1);
  CHECK_FALSE(results[0].ok);
  CHECK_FALSE(results[0].error.empty());
}

TEST_CASE("JournalChainService - tails the journal on a timer", "[chain][journal]") {
  TempDir dir("journal_tail");
  boost::asio::io_context io;
  chain::JournalChainService chain(io, MakeConfig(dir));

  int wakes = 0;
  chain.Events().SetWaker([&wakes]() { ++wakes; });

  AppendText(chain.config().events_path, EventLine(Initiated(MakeTransfer(1))));
  chain.Start();
  CHECK(wakes == 1);

  AppendText(chain.config().events_path, EventLine(Initiated(MakeTransfer(2))));
  io.run_for(std::chrono::milliseconds(200));
  CHECK(wakes == 2);

  chain.Stop();
  int count = 0;
  while (chain.Events().PollNext().ready()) {
    ++count;
  }
  CHECK(count == 2);
}
