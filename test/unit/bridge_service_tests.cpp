// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the swap orchestrator

#include <catch2/catch_test_macros.hpp>
#include "bridge/bridge_service.hpp"
#include "bridge/conversion.hpp"
#include "util/time.hpp"
#include "../bridge/bridge_test_helpers.hpp"
#include "../bridge/mock_blockchain_service.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <vector>

using namespace swaprelay;
using namespace swaprelay::bridge;
using namespace swaprelay::test;

namespace {

struct BridgeFixture {
  boost::asio::io_context io;
  std::shared_ptr<MockBlockchainService> chain1 = std::make_shared<MockBlockchainService>("alpha");
  std::shared_ptr<MockBlockchainService> chain2 = std::make_shared<MockBlockchainService>("beta");
  std::unique_ptr<BridgeService> service;

  explicit BridgeFixture(size_t max_attempts = 5,
                         std::shared_ptr<const ChainConverter> converter =
                             std::make_shared<IdentityConverter>()) {
    ActiveSwapMap::Config config;
    config.max_attempts = max_attempts;
    config.retry_delay = std::chrono::milliseconds(0);
    service = std::make_unique<BridgeService>(io, chain1, chain2, converter, config);
  }

  // Poll until both the orchestrator and the io_context are idle
  std::vector<Event> Drain() {
    std::vector<Event> out;
    for (;;) {
      const size_t before = out.size();
      for (;;) {
        auto poll = service->PollNext();
        if (!poll.ready()) break;
        out.push_back(*poll.item);
      }
      const size_t ran = RunUntilIdle(io);
      if (ran == 0 && out.size() == before) break;
    }
    return out;
  }
};

size_t CountWarnings(const std::vector<Event>& events, WarningKind kind) {
  size_t n = 0;
  for (const auto& e : events) {
    if (e.kind == EventKind::Warning && e.warning.kind == kind) ++n;
  }
  return n;
}

} // namespace

TEST_CASE("BridgeService - Initiated starts a swap and locks on the other chain",
          "[bridge][service]") {
  BridgeFixture f;
  auto transfer = MakeTransfer(1);
  f.chain1->Emit(Initiated(transfer));

  auto events = f.Drain();
  REQUIRE(events.size() == 2);

  CHECK(events[0].kind == EventKind::Contract);
  CHECK(events[0].origin == EventOrigin::B1I);
  CHECK(events[0].contract.initiator.kind == InitiatorEventKind::Initiated);

  CHECK(events[1].kind == EventKind::Progress);
  CHECK(events[1].origin == EventOrigin::B2C);
  CHECK(events[1].progress.kind == ActiveSwapEventKind::AssetsLocked);

  auto calls = f.chain2->contracts().calls();
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].call == "lock");
  CHECK(calls[0].lock.bridge_transfer_id == transfer.bridge_transfer_id);
  CHECK(f.chain1->contracts().TotalCalls() == 0);

  // Entry kept after the lock
  CHECK(f.service->b1_to_b2().AlreadyExecuting(transfer.bridge_transfer_id));
  CHECK(f.service->b2_to_b1().Size() == 0);
}

TEST_CASE("BridgeService - revealed secret completes the swap", "[bridge][service]") {
  BridgeFixture f;
  f.chain1->Emit(Initiated(MakeTransfer(2)));
  f.Drain();

  f.chain2->Emit(CounterpartyCompleted(MakeCompleted(2, 0x77)));
  auto events = f.Drain();
  REQUIRE(events.size() == 2);

  CHECK(events[0].kind == EventKind::Contract);
  CHECK(events[0].origin == EventOrigin::B2C);
  CHECK(events[0].contract.counterparty.kind == CounterpartyEventKind::Completed);

  CHECK(events[1].kind == EventKind::Progress);
  CHECK(events[1].origin == EventOrigin::B1I);
  CHECK(events[1].progress.kind == ActiveSwapEventKind::AssetsCompleted);

  auto calls = f.chain1->contracts().calls();
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].call == "complete");
  CHECK(calls[0].id == MakeId(2));
  CHECK(calls[0].secret == uint256(0x77));

  CHECK_FALSE(f.service->b1_to_b2().AlreadyExecuting(MakeId(2)));
}

TEST_CASE("BridgeService - completion for an unknown swap", "[bridge][service]") {
  BridgeFixture f;
  f.chain2->Emit(CounterpartyCompleted(MakeCompleted(9)));

  auto events = f.Drain();
  REQUIRE(events.size() == 1);
  CHECK(events[0].kind == EventKind::Warning);
  CHECK(events[0].origin == EventOrigin::B2C);
  CHECK(events[0].warning.kind == WarningKind::CannotCompleteUnexistingSwap);
  CHECK(events[0].warning.severity == Severity::Critical);
  CHECK(events[0].warning.bridge_transfer_id == MakeId(9));
  REQUIRE(events[0].warning.observed.has_value());
  CHECK(events[0].IsCritical());

  CHECK(f.chain1->contracts().TotalCalls() == 0);
  CHECK(f.chain2->contracts().TotalCalls() == 0);
  CHECK(f.service->b1_to_b2().Size() == 0);
  CHECK(f.service->b2_to_b1().Size() == 0);
}

TEST_CASE("BridgeService - duplicate Initiated", "[bridge][service]") {
  BridgeFixture f;
  auto transfer = MakeTransfer(3, 1000);
  f.chain1->Emit(Initiated(transfer));
  f.Drain();

  SECTION("Identical replay is a plain warning") {
    f.chain1->Emit(Initiated(transfer));
    auto events = f.Drain();
    REQUIRE(events.size() == 1);
    CHECK(events[0].origin == EventOrigin::B1I);
    CHECK(events[0].warning.kind == WarningKind::AlreadyPresent);
    CHECK(events[0].warning.severity == Severity::Warning);
    REQUIRE(events[0].warning.observed.has_value());
    CHECK(events[0].warning.observed->initiator.details == transfer);
  }

  SECTION("Conflicting details are critical and change nothing") {
    f.chain1->Emit(Initiated(MakeTransfer(3, 5000)));
    auto events = f.Drain();
    REQUIRE(events.size() == 1);
    CHECK(events[0].warning.kind == WarningKind::AlreadyPresent);
    CHECK(events[0].warning.severity == Severity::Critical);
    CHECK(f.service->b1_to_b2().GetSwap(MakeId(3))->details.amount == 1000);
  }

  CHECK(f.service->b1_to_b2().Size() == 1);
  CHECK(f.chain2->contracts().CountCalls("lock") == 1);
}

TEST_CASE("BridgeService - exhausted lock retries become a warning", "[bridge][service]") {
  BridgeFixture f(3);
  f.chain2->contracts().FailAlways("gas too low");
  f.chain1->Emit(Initiated(MakeTransfer(4)));

  auto events = f.Drain();
  REQUIRE(events.size() == 2);
  CHECK(events[0].kind == EventKind::Contract);
  CHECK(events[1].kind == EventKind::Warning);
  CHECK(events[1].origin == EventOrigin::B2C);
  CHECK(events[1].warning.kind == WarningKind::LockingFailed);
  CHECK(events[1].warning.severity == Severity::Critical);
  CHECK(f.chain2->contracts().CountCalls("lock") == 3);
  CHECK(CountWarnings(events, WarningKind::LockingFailed) == 1);
}

TEST_CASE("BridgeService - exhausted claim retries become a warning", "[bridge][service]") {
  BridgeFixture f(2);
  f.chain1->Emit(Initiated(MakeTransfer(5)));
  f.Drain();

  f.chain1->contracts().FailAlways();
  f.chain2->Emit(CounterpartyCompleted(MakeCompleted(5)));
  auto events = f.Drain();

  REQUIRE(events.size() == 2);
  CHECK(events[1].warning.kind == WarningKind::CompletingFailed);
  CHECK(events[1].origin == EventOrigin::B1I);
  CHECK(f.chain1->contracts().CountCalls("complete") == 2);
  CHECK(f.service->b1_to_b2().GetSwap(MakeId(5))->status == SwapStatus::Locked);
}

TEST_CASE("BridgeService - failed chain stream does not stop the other chain",
          "[bridge][service]") {
  BridgeFixture f;
  f.chain1->FailStream("cannot decode event payload");

  auto events = f.Drain();
  REQUIRE(events.size() == 1);
  CHECK(events[0].warning.kind == WarningKind::StreamTerminated);
  CHECK(events[0].warning.severity == Severity::Critical);
  CHECK(events[0].origin == EventOrigin::B1I);
  CHECK_FALSE(f.service->IsChainActive(ChainSide::Chain1));
  CHECK(f.service->IsChainActive(ChainSide::Chain2));

  // Terminated exactly once
  CHECK(f.Drain().empty());

  f.chain2->Emit(Initiated(MakeTransfer(6)));
  events = f.Drain();
  REQUIRE(events.size() == 2);
  CHECK(events[0].origin == EventOrigin::B2I);
  CHECK(events[1].origin == EventOrigin::B1C);
  CHECK(events[1].progress.kind == ActiveSwapEventKind::AssetsLocked);
  CHECK(f.chain1->contracts().CountCalls("lock") == 1);
}

TEST_CASE("BridgeService - refund aborts the destination lock", "[bridge][service]") {
  BridgeFixture f;

  SECTION("Tracked swap") {
    auto transfer = MakeTransfer(7);
    f.chain1->Emit(Initiated(transfer));
    f.Drain();

    f.chain1->Emit(Refunded(transfer));
    auto events = f.Drain();
    REQUIRE(events.size() == 2);
    CHECK(events[0].kind == EventKind::Contract);
    CHECK(events[0].contract.initiator.kind == InitiatorEventKind::Refunded);
    CHECK(events[1].origin == EventOrigin::B2C);
    CHECK(events[1].progress.kind == ActiveSwapEventKind::AssetsAborted);

    CHECK(f.chain2->contracts().CountCalls("abort") == 1);
    CHECK_FALSE(f.service->b1_to_b2().AlreadyExecuting(transfer.bridge_transfer_id));
  }

  SECTION("Untracked swap is only forwarded") {
    f.chain1->Emit(Refunded(MakeTransfer(8)));
    auto events = f.Drain();
    REQUIRE(events.size() == 1);
    CHECK(events[0].kind == EventKind::Contract);
    CHECK(f.chain2->contracts().TotalCalls() == 0);
  }
}

TEST_CASE("BridgeService - refund after the secret was revealed", "[bridge][service]") {
  BridgeFixture f;
  auto transfer = MakeTransfer(3);
  f.chain1->Emit(Initiated(transfer));
  f.Drain();

  // Hold the source claim so the swap stays in Completing
  f.chain1->contracts().SetDeferred(true);
  f.chain2->Emit(CounterpartyCompleted(MakeCompleted(3)));
  auto events = f.Drain();
  REQUIRE(events.size() == 1);
  REQUIRE(f.service->b1_to_b2().GetSwap(MakeId(3))->status == SwapStatus::Completing);

  f.chain1->Emit(Refunded(transfer));
  events = f.Drain();
  REQUIRE(events.size() == 1);
  CHECK(events[0].kind == EventKind::Warning);
  CHECK(events[0].origin == EventOrigin::B1I);
  CHECK(events[0].warning.kind == WarningKind::RefundedWhileCompleting);
  CHECK(events[0].warning.severity == Severity::Critical);
  CHECK(events[0].warning.bridge_transfer_id == MakeId(3));
  REQUIRE(events[0].warning.observed.has_value());
  CHECK(events[0].warning.observed->initiator.kind == InitiatorEventKind::Refunded);

  // The claimed destination lock is not aborted and the swap stays tracked
  CHECK(f.chain2->contracts().CountCalls("abort") == 0);
  REQUIRE(f.service->b1_to_b2().AlreadyExecuting(MakeId(3)));
  CHECK(f.service->b1_to_b2().GetSwap(MakeId(3))->status == SwapStatus::Completing);

  f.chain1->contracts().ResolvePending(ContractCallResult::Success());
  events = f.Drain();
  REQUIRE(events.size() == 1);
  CHECK(events[0].progress.kind == ActiveSwapEventKind::AssetsCompleted);
  CHECK_FALSE(f.service->b1_to_b2().AlreadyExecuting(MakeId(3)));
}

TEST_CASE("BridgeService - chain 2 to chain 1 mirrors the forward direction",
          "[bridge][service]") {
  BridgeFixture f;
  f.chain2->Emit(Initiated(MakeTransfer(10)));
  auto events = f.Drain();

  REQUIRE(events.size() == 2);
  CHECK(events[0].origin == EventOrigin::B2I);
  CHECK(events[1].origin == EventOrigin::B1C);
  CHECK(f.service->b2_to_b1().AlreadyExecuting(MakeId(10)));
  CHECK(f.service->b1_to_b2().Size() == 0);
  CHECK(f.chain1->contracts().CountCalls("lock") == 1);

  f.chain1->Emit(CounterpartyCompleted(MakeCompleted(10, 0x21)));
  events = f.Drain();
  REQUIRE(events.size() == 2);
  CHECK(events[0].origin == EventOrigin::B1C);
  CHECK(events[1].origin == EventOrigin::B2I);
  CHECK(events[1].progress.kind == ActiveSwapEventKind::AssetsCompleted);

  auto calls = f.chain2->contracts().calls();
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].call == "complete");
  CHECK(calls[0].secret == uint256(0x21));
  CHECK(f.service->b2_to_b1().Size() == 0);

  // Unknown completion on chain 1 is critical too
  f.chain1->Emit(CounterpartyCompleted(MakeCompleted(11)));
  events = f.Drain();
  REQUIRE(events.size() == 1);
  CHECK(events[0].origin == EventOrigin::B1C);
  CHECK(events[0].warning.kind == WarningKind::CannotCompleteUnexistingSwap);
}

TEST_CASE("BridgeService - observation-only events are forwarded", "[bridge][service]") {
  BridgeFixture f;
  f.chain2->Emit(Locked(MakeLock(12)));
  f.chain1->Emit(InitiatorCompleted(MakeCompleted(12)));

  auto events = f.Drain();
  REQUIRE(events.size() == 2);
  CHECK(events[0].origin == EventOrigin::B1I);
  CHECK(events[0].contract.initiator.kind == InitiatorEventKind::Completed);
  CHECK(events[1].origin == EventOrigin::B2C);
  CHECK(events[1].contract.counterparty.kind == CounterpartyEventKind::Locked);

  CHECK(f.chain1->contracts().TotalCalls() == 0);
  CHECK(f.chain2->contracts().TotalCalls() == 0);
}

TEST_CASE("BridgeService - repeated completion while claiming is forwarded",
          "[bridge][service]") {
  BridgeFixture f;
  f.chain1->Emit(Initiated(MakeTransfer(13)));
  f.Drain();

  f.chain1->contracts().SetDeferred(true);
  f.chain2->Emit(CounterpartyCompleted(MakeCompleted(13)));
  f.chain2->Emit(CounterpartyCompleted(MakeCompleted(13)));
  auto events = f.Drain();

  REQUIRE(events.size() == 2);
  CHECK(events[0].kind == EventKind::Contract);
  CHECK(events[1].kind == EventKind::Contract);
  CHECK(f.chain1->contracts().CountCalls("complete") == 1);
}

TEST_CASE("BridgeService - unrepresentable initiation", "[bridge][service]") {
  BridgeFixture f(5, std::make_shared<AddressWidthConverter>(20, 32));
  // 32-byte address observed on a 20-byte chain
  f.chain1->Emit(Initiated(MakeTransfer(14, 1000, 32)));

  auto events = f.Drain();
  REQUIRE(events.size() == 1);
  CHECK(events[0].warning.kind == WarningKind::ConversionFailed);
  CHECK(events[0].warning.severity == Severity::Critical);
  CHECK(f.service->b1_to_b2().Size() == 0);
  CHECK(f.chain2->contracts().TotalCalls() == 0);
}

TEST_CASE("BridgeService - tracker progress is served before chain events",
          "[bridge][service]") {
  BridgeFixture f;
  f.chain1->Emit(Initiated(MakeTransfer(15)));

  auto first = f.service->PollNext();
  REQUIRE(first.ready());
  CHECK(first.item->kind == EventKind::Contract);
  RunUntilIdle(f.io);  // lock result lands in the tracker

  f.chain1->Emit(Initiated(MakeTransfer(16)));

  auto second = f.service->PollNext();
  REQUIRE(second.ready());
  CHECK(second.item->kind == EventKind::Progress);
  CHECK(second.item->progress.bridge_transfer_id == MakeId(15));

  auto third = f.service->PollNext();
  REQUIRE(third.ready());
  CHECK(third.item->kind == EventKind::Contract);
  CHECK(third.item->contract.bridge_transfer_id() == MakeId(16));
}

TEST_CASE("BridgeService - events carry origin and timestamp", "[bridge][service]") {
  util::MockTimeScope mock_time(1700000000);
  BridgeFixture f;
  f.chain1->Emit(Initiated(MakeTransfer(17)));

  auto events = f.Drain();
  REQUIRE(events.size() == 2);
  for (const auto& e : events) {
    CHECK(e.timestamp == 1700000000);
  }
  CHECK(events[0].ToString().find("[B1I]") == 0);
}

TEST_CASE("BridgeService - waker reaches every source", "[bridge][service]") {
  BridgeFixture f;
  int wakes = 0;
  f.service->SetWaker([&wakes]() { ++wakes; });

  f.chain1->Emit(Initiated(MakeTransfer(18)));
  CHECK(wakes == 1);
  f.chain2->Emit(Locked(MakeLock(19)));
  CHECK(wakes == 2);

  REQUIRE(f.service->PollNext().ready());
  RunUntilIdle(f.io);  // tracker progress wakes as well
  CHECK(wakes == 3);

  CHECK(f.service->PollNext().status == PollStatus::Ready);
}

TEST_CASE("BridgeService - idle orchestrator is pending, never ended", "[bridge][service]") {
  BridgeFixture f;
  CHECK(f.service->PollNext().status == PollStatus::Pending);

  f.chain1->FailStream("gone");
  f.chain2->FailStream("gone");
  f.Drain();
  CHECK(f.service->PollNext().status == PollStatus::Pending);
}
