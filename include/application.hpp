// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/active_swap.hpp"
#include "bridge/bridge_service.hpp"
#include "bridge/notifications.hpp"
#include "bridge/relay_driver.hpp"
#include "chain/journal_chain.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace swaprelay {
namespace app {

// One side of the relayed chain pair
struct ChainConfig {
  std::string name;
  // Empty paths default to <datadir>/<name>.events.jsonl and
  // <datadir>/<name>.calls.jsonl
  std::filesystem::path events_path;
  std::filesystem::path calls_path;
  // Address width on this chain (20 for EVM, 32 for Move)
  size_t address_bytes = 32;
};

// Application configuration
struct AppConfig {
  // Data directory
  std::filesystem::path datadir;

  ChainConfig chain1;
  ChainConfig chain2;

  // Per-direction tracker retry policy
  bridge::ActiveSwapMap::Config swap_config;

  // Journal tail interval
  std::chrono::milliseconds poll_interval{500};

  // Relay driver fairness budget
  size_t max_events_per_turn = 64;

  // Unified event log (JSON lines); empty = <datadir>/events.jsonl
  std::filesystem::path event_log;

  // Logging
  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {
    chain1.name = "chain1";
    chain2.name = "chain2";
  }
};

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  bridge::BridgeService &bridge_service() { return *bridge_; }
  bridge::RelayDriver &relay_driver() { return *driver_; }
  chain::JournalChainService &chain1() { return *chain1_; }
  chain::JournalChainService &chain2() { return *chain2_; }
  const AppConfig &config() const { return config_; }

  // Status
  bool is_running() const { return running_; }
  uint64_t critical_warnings() const { return critical_warnings_; }
  std::filesystem::path event_log_path() const;

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<uint64_t> critical_warnings_{0};

  // Reactor (single io thread)
  boost::asio::io_context io_context_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::unique_ptr<std::thread> io_thread_;

  std::unique_ptr<util::DirectoryLock> datadir_lock_;

  // Components (initialized in order)
  std::shared_ptr<chain::JournalChainService> chain1_;
  std::shared_ptr<chain::JournalChainService> chain2_;
  std::unique_ptr<bridge::BridgeService> bridge_;
  std::unique_ptr<bridge::RelayDriver> driver_;

  // Notification subscriptions
  // IMPORTANT: Must be declared AFTER components so they are destroyed BEFORE
  bridge::BridgeNotifications::Subscription event_log_sub_;
  bridge::BridgeNotifications::Subscription critical_sub_;

  // Initialization steps
  bool init_datadir();
  bool init_chains();
  bool init_bridge();
  void init_subscriptions();

  chain::JournalChainService::Config make_chain_config(const ChainConfig &chain) const;

  // Shutdown
  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace swaprelay
