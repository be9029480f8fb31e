// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#ifndef SWAPRELAY_CHAIN_JOURNAL_CHAIN_HPP
#define SWAPRELAY_CHAIN_JOURNAL_CHAIN_HPP

#include "bridge/blockchain_service.hpp"
#include "bridge/event_stream.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace swaprelay {
namespace chain {

/**
 * JournalChainService - file-backed chain adapter
 *
 * Contract events are read from a JSON-lines file written by an external
 * chain watcher (or by hand for dry-runs and replays). The file is tailed
 * every poll_interval; only complete lines are consumed, blank lines are
 * skipped. The first malformed line fails the event stream: the relay stops
 * reading this chain and keeps serving the other one.
 *
 * Contract calls are appended to calls_path as JSON lines for an external
 * submitter:
 *   {"call":"lock","chain":...,"timestamp":...,"bridge_transfer_id":..., ...}
 *   {"call":"complete","chain":...,"bridge_transfer_id":...,"secret":...}
 *   {"call":"abort","chain":...,"bridge_transfer_id":...}
 * A call succeeds once its line is durably appended. Results are always
 * delivered asynchronously through the io_context.
 */
class JournalChainService : public bridge::BlockchainService {
public:
  struct Config {
    std::string name;
    std::filesystem::path events_path;
    std::filesystem::path calls_path;
    std::chrono::milliseconds poll_interval;

    Config() : name("chain"), poll_interval(std::chrono::milliseconds(500)) {}
  };

  JournalChainService(boost::asio::io_context& io_context, const Config& config);
  ~JournalChainService() override;

  JournalChainService(const JournalChainService&) = delete;
  JournalChainService& operator=(const JournalChainService&) = delete;

  // Start/stop tailing the events file
  void Start();
  void Stop();

  // Consume newly appended lines now; returns the number of events queued
  size_t PollJournal();

  std::string name() const override { return config_.name; }
  bridge::EventStream<bridge::ContractEvent>& Events() override { return events_; }
  bridge::InitiatorContract& initiator_contract() override { return initiator_; }
  bridge::CounterpartyContract& counterparty_contract() override { return counterparty_; }

  const Config& config() const { return config_; }
  uint64_t lines_read() const { return lines_read_; }
  bool failed() const { return failed_; }

private:
  class Initiator : public bridge::InitiatorContract {
  public:
    explicit Initiator(JournalChainService& owner) : owner_(owner) {}
    void CompleteBridgeTransfer(const bridge::BridgeTransferId& id,
                                const bridge::HashLockPreImage& secret,
                                bridge::ContractCallHandler handler) override;

  private:
    JournalChainService& owner_;
  };

  class Counterparty : public bridge::CounterpartyContract {
  public:
    explicit Counterparty(JournalChainService& owner) : owner_(owner) {}
    void LockBridgeTransfer(const bridge::LockDetails& details,
                            bridge::ContractCallHandler handler) override;
    void AbortBridgeTransfer(const bridge::BridgeTransferId& id,
                             bridge::ContractCallHandler handler) override;

  private:
    JournalChainService& owner_;
  };

  void RecordCall(const std::string& call, nlohmann::json fields,
                  bridge::ContractCallHandler handler);
  void ScheduleTick();
  void FailStream(const std::string& reason);

  boost::asio::io_context& io_context_;
  const Config config_;

  bridge::QueuedEventStream<bridge::ContractEvent> events_;
  Initiator initiator_;
  Counterparty counterparty_;

  // Tail state (io_context thread only)
  uint64_t offset_{0};
  std::string partial_line_;
  uint64_t lines_read_{0};
  bool failed_{false};
  bool running_{false};

  boost::asio::steady_timer timer_;
  std::shared_ptr<int> lifetime_token_;
};

} // namespace chain
} // namespace swaprelay

#endif // SWAPRELAY_CHAIN_JOURNAL_CHAIN_HPP
