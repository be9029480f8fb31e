// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/journal_chain.hpp"
#include "bridge/json_codec.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <boost/asio/post.hpp>

namespace swaprelay {
namespace chain {

using json = nlohmann::json;

JournalChainService::JournalChainService(boost::asio::io_context& io_context,
                                         const Config& config)
    : io_context_(io_context),
      config_(config),
      initiator_(*this),
      counterparty_(*this),
      timer_(io_context),
      lifetime_token_(std::make_shared<int>(0)) {}

JournalChainService::~JournalChainService() {
  Stop();
  lifetime_token_.reset();
}

void JournalChainService::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  LOG_CHAIN_INFO("JournalChain {}: tailing {} every {}ms, calls -> {}", config_.name,
                 config_.events_path.string(), config_.poll_interval.count(),
                 config_.calls_path.string());
  PollJournal();
  ScheduleTick();
}

void JournalChainService::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  timer_.cancel();
}

void JournalChainService::ScheduleTick() {
  if (!running_ || failed_) {
    return;
  }
  std::weak_ptr<int> guard = lifetime_token_;
  timer_.expires_after(config_.poll_interval);
  timer_.async_wait([this, guard](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || guard.expired()) {
      return;
    }
    PollJournal();
    ScheduleTick();
  });
}

size_t JournalChainService::PollJournal() {
  if (failed_) {
    return 0;
  }

  std::error_code ec;
  if (!std::filesystem::exists(config_.events_path, ec)) {
    LOG_CHAIN_TRACE("JournalChain {}: {} not present yet", config_.name,
                    config_.events_path.string());
    return 0;
  }

  auto data = util::read_file_from(config_.events_path, offset_);
  if (!data) {
    FailStream("events journal unreadable or truncated at offset " + std::to_string(offset_));
    return 0;
  }
  if (data->empty()) {
    return 0;
  }
  offset_ += data->size();

  std::string buffer = partial_line_ + *data;
  partial_line_.clear();

  size_t queued = 0;
  size_t start = 0;
  while (start < buffer.size()) {
    size_t end = buffer.find('\n', start);
    if (end == std::string::npos) {
      // Incomplete trailing line, wait for the writer to finish it
      partial_line_ = buffer.substr(start);
      break;
    }

    std::string line = buffer.substr(start, end - start);
    start = end + 1;
    ++lines_read_;

    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) {
      continue;
    }

    std::string error;
    auto event = bridge::ParseContractEventLine(line, error);
    if (!event) {
      FailStream("line " + std::to_string(lines_read_) + ": " + error);
      return queued;
    }

    LOG_CHAIN_DEBUG("JournalChain {}: {}", config_.name, event->ToString());
    events_.Push(std::move(*event));
    ++queued;
  }

  return queued;
}

void JournalChainService::FailStream(const std::string& reason) {
  LOG_CHAIN_ERROR("JournalChain {}: {}", config_.name, reason);
  failed_ = true;
  timer_.cancel();
  events_.Fail(reason);
}

void JournalChainService::RecordCall(const std::string& call, json fields,
                                     bridge::ContractCallHandler handler) {
  fields["call"] = call;
  fields["chain"] = config_.name;
  fields["timestamp"] = util::GetTime();

  bridge::ContractCallResult result;
  if (util::append_line(config_.calls_path, bridge::DumpJsonLine(fields))) {
    LOG_CHAIN_DEBUG("JournalChain {}: recorded {} call", config_.name, call);
    result = bridge::ContractCallResult::Success();
  } else {
    LOG_CHAIN_WARN("JournalChain {}: failed to record {} call in {}", config_.name, call,
                   config_.calls_path.string());
    result = bridge::ContractCallResult::Failure("cannot append to " +
                                                 config_.calls_path.string());
  }

  boost::asio::post(io_context_, [handler = std::move(handler), result]() {
    if (handler) {
      handler(result);
    }
  });
}

void JournalChainService::Initiator::CompleteBridgeTransfer(
    const bridge::BridgeTransferId& id, const bridge::HashLockPreImage& secret,
    bridge::ContractCallHandler handler) {
  json fields;
  fields["bridge_transfer_id"] = id.GetHex();
  fields["secret"] = secret.GetHex();
  owner_.RecordCall("complete", std::move(fields), std::move(handler));
}

void JournalChainService::Counterparty::LockBridgeTransfer(const bridge::LockDetails& details,
                                                           bridge::ContractCallHandler handler) {
  json fields;
  fields["bridge_transfer_id"] = details.bridge_transfer_id.GetHex();
  fields["initiator_address"] = details.initiator_address.ToString();
  fields["recipient_address"] = details.recipient_address.ToString();
  fields["hash_lock"] = details.hash_lock.GetHex();
  fields["time_lock"] = details.time_lock;
  fields["amount"] = details.amount;
  owner_.RecordCall("lock", std::move(fields), std::move(handler));
}

void JournalChainService::Counterparty::AbortBridgeTransfer(
    const bridge::BridgeTransferId& id, bridge::ContractCallHandler handler) {
  json fields;
  fields["bridge_transfer_id"] = id.GetHex();
  owner_.RecordCall("abort", std::move(fields), std::move(handler));
}

} // namespace chain
} // namespace swaprelay
