// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "bridge/conversion.hpp"
#include "bridge/json_codec.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <boost/asio/post.hpp>
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace swaprelay {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  // Tear down in reverse dependency order while the io_context still exists
  event_log_sub_.Unsubscribe();
  critical_sub_.Unsubscribe();
  driver_.reset();
  bridge_.reset();
  chain1_.reset();
  chain2_.reset();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

std::filesystem::path Application::event_log_path() const {
  return config_.event_log.empty() ? config_.datadir / "events.jsonl"
                                   : config_.event_log;
}

bool Application::initialize() {
  // Print startup banner (use std::cout for immediate visibility before logger
  // fully initialized)
  std::cout << GetStartupBanner(config_.chain1.name, config_.chain2.name)
            << std::flush;

  LOG_INFO("Initializing SwapRelay...");

  if (config_.chain1.name.empty() || config_.chain2.name.empty() ||
      config_.chain1.name == config_.chain2.name) {
    LOG_ERROR("Chain names must be non-empty and distinct (got '{}' and '{}')",
              config_.chain1.name, config_.chain2.name);
    return false;
  }

  // Create and lock data directory
  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_chains()) {
    LOG_ERROR("Failed to initialize chain adapters");
    return false;
  }

  if (!init_bridge()) {
    LOG_ERROR("Failed to initialize bridge service");
    return false;
  }

  init_subscriptions();

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }
  if (!driver_) {
    LOG_ERROR("Application not initialized");
    return false;
  }

  LOG_INFO("Starting SwapRelay...");

  // Setup signal handlers
  setup_signal_handlers();

  work_guard_.emplace(boost::asio::make_work_guard(io_context_));

  // Everything below runs on the io thread from here on
  boost::asio::post(io_context_, [this]() {
    driver_->Start();
    chain1_->Start();
    chain2_->Start();
  });

  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      io_context_.run();
    } catch (const std::exception &e) {
      LOG_ERROR("Application: io thread terminated by exception: {}", e.what());
      shutdown_requested_ = true;
    }
  });

  running_ = true;

  LOG_INFO("SwapRelay started successfully");
  LOG_INFO("Data directory: {}", config_.datadir.string());
  LOG_INFO("Event log: {}", event_log_path().string());
  LOG_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down SwapRelay...");

  running_ = false;

  // Stop the reactor first: no handler runs after this point
  LOG_INFO("Stopping io thread...");
  work_guard_.reset();
  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  if (driver_) {
    driver_->Stop();
    LOG_INFO("Relayed {} event(s) in {} turn(s), {} critical warning(s)",
             driver_->events_processed(), driver_->turns(),
             critical_warnings_.load());
  }
  if (chain1_) chain1_->Stop();
  if (chain2_) chain2_->Stop();

  if (bridge_) {
    for (const bridge::ActiveSwapMap *tracker : {&bridge_->b1_to_b2(), &bridge_->b2_to_b1()}) {
      for (const auto &id : tracker->ActiveIds()) {
        LOG_WARN("Swap {} ({}) still in flight at shutdown", id.GetHex(), tracker->name());
      }
    }
  }

  // Release data directory lock
  if (datadir_lock_) {
    datadir_lock_->Release();
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // Lock the data directory to prevent multiple instances
  datadir_lock_ = std::make_unique<util::DirectoryLock>(config_.datadir, ".lock");
  util::LockResult lock_result = datadir_lock_->Acquire();

  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "SwapRelay is probably already running.",
              config_.datadir.string());
    return false;
  }

  LOG_DEBUG("Successfully locked data directory");
  return true;
}

chain::JournalChainService::Config
Application::make_chain_config(const ChainConfig &chain) const {
  chain::JournalChainService::Config c;
  c.name = chain.name;
  c.events_path = chain.events_path.empty()
                      ? config_.datadir / (chain.name + ".events.jsonl")
                      : chain.events_path;
  c.calls_path = chain.calls_path.empty()
                     ? config_.datadir / (chain.name + ".calls.jsonl")
                     : chain.calls_path;
  c.poll_interval = config_.poll_interval;
  return c;
}

bool Application::init_chains() {
  LOG_INFO("Initializing chain adapters...");

  if (config_.chain1.address_bytes == 0 || config_.chain2.address_bytes == 0) {
    LOG_ERROR("Address width must be at least one byte");
    return false;
  }

  chain1_ = std::make_shared<chain::JournalChainService>(
      io_context_, make_chain_config(config_.chain1));
  chain2_ = std::make_shared<chain::JournalChainService>(
      io_context_, make_chain_config(config_.chain2));

  LOG_INFO("  {}: events {}, calls {}", chain1_->name(),
           chain1_->config().events_path.string(),
           chain1_->config().calls_path.string());
  LOG_INFO("  {}: events {}, calls {}", chain2_->name(),
           chain2_->config().events_path.string(),
           chain2_->config().calls_path.string());
  return true;
}

bool Application::init_bridge() {
  LOG_INFO("Initializing bridge service...");

  auto converter = bridge::MakeConverter(config_.chain1.address_bytes,
                                         config_.chain2.address_bytes);

  bridge_ = std::make_unique<bridge::BridgeService>(
      io_context_, chain1_, chain2_, converter, config_.swap_config);

  bridge::RelayDriver::Config driver_config;
  driver_config.max_events_per_turn = config_.max_events_per_turn;
  driver_ = std::make_unique<bridge::RelayDriver>(io_context_, *bridge_, driver_config);

  LOG_INFO("Retry policy: {} attempt(s), {}ms apart",
           bridge_->b1_to_b2().config().max_attempts,
           bridge_->b1_to_b2().config().retry_delay.count());
  return true;
}

void Application::init_subscriptions() {
  const std::filesystem::path log_path = event_log_path();

  event_log_sub_ = bridge::BridgeEvents().SubscribeEvent(
      [log_path](const bridge::Event &event) {
        if (!util::append_line(log_path, bridge::DumpJsonLine(bridge::EventToJson(event)))) {
          LOG_APP_ERROR("Failed to append event to {}", log_path.string());
        }
      });

  critical_sub_ = bridge::BridgeEvents().SubscribeCriticalWarning(
      [this](const bridge::Event &event) {
        ++critical_warnings_;
        LOG_APP_ERROR("CRITICAL: {}. Manual intervention required.",
                      event.ToString());
      });
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char* msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);  // Use literal length to avoid strlen()
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace swaprelay
