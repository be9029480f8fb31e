// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "bridge/bridge_service.hpp"
#include "bridge/notifications.hpp"
#include "bridge/relay_driver.hpp"
#include "../bridge/bridge_test_helpers.hpp"
#include "../bridge/mock_blockchain_service.hpp"
#include <boost/asio/io_context.hpp>
#include <memory>
#include <thread>
#include <vector>

using namespace swaprelay;
using namespace swaprelay::bridge;
using namespace swaprelay::test;

namespace {

Event ContractEventFor(uint8_t n) {
  return Event::Contract(EventOrigin::B1I, Initiated(MakeTransfer(n)));
}

} // namespace

TEST_CASE("RelayDriver - publishes every event in order", "[bridge][driver]") {
  boost::asio::io_context io;
  QueuedEventStream<Event> stream;
  RelayDriver driver(io, stream);

  std::vector<BridgeTransferId> seen;
  auto sub = BridgeEvents().SubscribeEvent(
      [&seen](const Event& e) { seen.push_back(e.contract.bridge_transfer_id()); });

  driver.Start();
  REQUIRE(driver.IsRunning());
  stream.Push(ContractEventFor(1));
  stream.Push(ContractEventFor(2));
  stream.Push(ContractEventFor(3));
  RunUntilIdle(io);

  CHECK(driver.events_processed() == 3);
  REQUIRE(seen.size() == 3);
  CHECK(seen[0] == MakeId(1));
  CHECK(seen[1] == MakeId(2));
  CHECK(seen[2] == MakeId(3));
}

TEST_CASE("RelayDriver - turn budget yields to the io_context", "[bridge][driver]") {
  boost::asio::io_context io;
  QueuedEventStream<Event> stream;
  RelayDriver::Config config;
  config.max_events_per_turn = 2;
  RelayDriver driver(io, stream, config);

  for (uint8_t i = 1; i <= 5; ++i) {
    stream.Push(ContractEventFor(i));
  }
  driver.Start();

  // One turn handles at most two events
  io.restart();
  io.poll_one();
  CHECK(driver.events_processed() == 2);

  RunUntilIdle(io);
  CHECK(driver.events_processed() == 5);
  CHECK(driver.turns() >= 3);
}

TEST_CASE("RelayDriver - wakes are coalesced into one turn", "[bridge][driver]") {
  boost::asio::io_context io;
  QueuedEventStream<Event> stream;
  RelayDriver driver(io, stream);

  driver.Start();
  RunUntilIdle(io);
  REQUIRE(driver.turns() == 1);

  stream.Push(ContractEventFor(1));
  stream.Push(ContractEventFor(2));
  stream.Push(ContractEventFor(3));
  RunUntilIdle(io);

  CHECK(driver.turns() == 2);
  CHECK(driver.events_processed() == 3);
}

TEST_CASE("RelayDriver - wakes from other threads", "[bridge][driver]") {
  boost::asio::io_context io;
  QueuedEventStream<Event> stream;
  RelayDriver driver(io, stream);
  driver.Start();

  std::thread producer([&stream]() {
    for (uint8_t i = 1; i <= 10; ++i) {
      stream.Push(ContractEventFor(i));
    }
  });
  producer.join();

  RunUntilIdle(io);
  CHECK(driver.events_processed() == 10);
}

TEST_CASE("RelayDriver - stop halts polling", "[bridge][driver]") {
  boost::asio::io_context io;
  QueuedEventStream<Event> stream;
  RelayDriver driver(io, stream);

  driver.Start();
  stream.Push(ContractEventFor(1));
  RunUntilIdle(io);
  REQUIRE(driver.events_processed() == 1);

  driver.Stop();
  CHECK_FALSE(driver.IsRunning());
  stream.Push(ContractEventFor(2));
  RunUntilIdle(io);

  CHECK(driver.events_processed() == 1);
  CHECK(stream.queued() == 1);
}

TEST_CASE("RelayDriver - terminated stream stops the driver", "[bridge][driver]") {
  boost::asio::io_context io;
  QueuedEventStream<Event> stream;
  RelayDriver driver(io, stream);

  driver.Start();
  stream.Push(ContractEventFor(1));
  stream.Fail("orchestrator gone");
  RunUntilIdle(io);

  CHECK(driver.events_processed() == 1);
  CHECK_FALSE(driver.IsRunning());
}

TEST_CASE("RelayDriver - drives the orchestrator end to end", "[bridge][driver]") {
  boost::asio::io_context io;
  auto chain1 = std::make_shared<MockBlockchainService>("alpha");
  auto chain2 = std::make_shared<MockBlockchainService>("beta");
  ActiveSwapMap::Config config;
  config.retry_delay = std::chrono::milliseconds(0);
  BridgeService service(io, chain1, chain2, std::make_shared<IdentityConverter>(), config);
  RelayDriver driver(io, service);

  std::vector<Event> events;
  std::vector<Event> critical;
  auto all_sub = BridgeEvents().SubscribeEvent([&events](const Event& e) { events.push_back(e); });
  auto critical_sub =
      BridgeEvents().SubscribeCriticalWarning([&critical](const Event& e) { critical.push_back(e); });

  driver.Start();
  chain1->Emit(Initiated(MakeTransfer(1)));
  RunUntilIdle(io);
  chain2->Emit(CounterpartyCompleted(MakeCompleted(1)));
  chain2->Emit(CounterpartyCompleted(MakeCompleted(2)));
  RunUntilIdle(io);

  // Initiated, AssetsLocked, Completed, unknown-swap warning, AssetsCompleted
  REQUIRE(events.size() == 5);
  CHECK(driver.events_processed() == 5);
  CHECK(chain1->contracts().CountCalls("complete") == 1);
  CHECK(service.b1_to_b2().Size() == 0);

  REQUIRE(critical.size() == 1);
  CHECK(critical[0].warning.kind == WarningKind::CannotCompleteUnexistingSwap);
  CHECK(critical[0].warning.bridge_transfer_id == MakeId(2));
}
