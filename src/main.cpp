#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <filesystem>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.swaprelay)\n"
      << "\n"
      << "Chains (N = 1 or 2):\n"
      << "  --chainN-name=<name>          Chain name (default: chain1, chain2)\n"
      << "  --chainN-events=<path>        Contract event journal (JSON lines)\n"
      << "                                Default: <datadir>/<name>.events.jsonl\n"
      << "  --chainN-calls=<path>         Contract call journal (JSON lines)\n"
      << "                                Default: <datadir>/<name>.calls.jsonl\n"
      << "  --chainN-address-bytes=<n>    Address width in bytes (default: 32)\n"
      << "\n"
      << "Relay:\n"
      << "  --max-attempts=<n>        Contract call attempts before giving up (default: 5)\n"
      << "  --retry-delay-ms=<ms>     Delay between attempts (default: 2000)\n"
      << "  --poll-interval-ms=<ms>   Event journal poll interval (default: 500)\n"
      << "  --max-events-per-turn=<n> Events handled per scheduler turn (default: 64)\n"
      << "  --eventlog=<path>         Unified event log (default: <datadir>/events.jsonl)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: bridge, swap, chain, app, all\n"
      << "                       Can be comma-separated: --debug=bridge,swap\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

namespace {

// Applies --chainN-* options; returns false on an invalid value
bool parse_chain_option(const std::string &option, const std::string &value,
                        swaprelay::app::ChainConfig &chain, bool &handled) {
  handled = true;
  if (option == "name") {
    chain.name = value;
  } else if (option == "events") {
    chain.events_path = value;
  } else if (option == "calls") {
    chain.calls_path = value;
  } else if (option == "address-bytes") {
    auto width = swaprelay::util::SafeParseInt(value, 1, 64);
    if (!width) {
      std::cerr << "Error: Invalid address width: " << value << std::endl;
      std::cerr << "Width must be a number between 1 and 64" << std::endl;
      return false;
    }
    chain.address_bytes = static_cast<size_t>(*width);
  } else {
    handled = false;
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    swaprelay::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << swaprelay::GetFullVersionString() << std::endl;
        std::cout << swaprelay::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--chain1-") == 0 || arg.find("--chain2-") == 0) {
        size_t eq = arg.find('=');
        if (eq == std::string::npos) {
          std::cerr << "Error: Missing value for " << arg << std::endl;
          return 1;
        }
        auto &chain = arg[7] == '1' ? config.chain1 : config.chain2;
        bool handled = false;
        if (!parse_chain_option(arg.substr(9, eq - 9), arg.substr(eq + 1), chain, handled)) {
          return 1;
        }
        if (!handled) {
          std::cerr << "Unknown option: " << arg << std::endl;
          print_usage(argv[0]);
          return 1;
        }
      } else if (arg.find("--max-attempts=") == 0) {
        auto attempts = swaprelay::util::SafeParseInt(arg.substr(15), 1, 1000);
        if (!attempts) {
          std::cerr << "Error: Invalid attempt count: " << arg.substr(15) << std::endl;
          std::cerr << "Attempts must be a number between 1 and 1000" << std::endl;
          return 1;
        }
        config.swap_config.max_attempts = static_cast<size_t>(*attempts);
      } else if (arg.find("--retry-delay-ms=") == 0) {
        auto delay = swaprelay::util::SafeParseInt64(arg.substr(17), 0, 3600000);
        if (!delay) {
          std::cerr << "Error: Invalid retry delay: " << arg.substr(17) << std::endl;
          std::cerr << "Delay must be between 0 and 3600000 milliseconds" << std::endl;
          return 1;
        }
        config.swap_config.retry_delay = std::chrono::milliseconds(*delay);
      } else if (arg.find("--poll-interval-ms=") == 0) {
        auto interval = swaprelay::util::SafeParseInt64(arg.substr(19), 10, 3600000);
        if (!interval) {
          std::cerr << "Error: Invalid poll interval: " << arg.substr(19) << std::endl;
          std::cerr << "Interval must be between 10 and 3600000 milliseconds" << std::endl;
          return 1;
        }
        config.poll_interval = std::chrono::milliseconds(*interval);
      } else if (arg.find("--max-events-per-turn=") == 0) {
        auto budget = swaprelay::util::SafeParseInt(arg.substr(22), 1, 100000);
        if (!budget) {
          std::cerr << "Error: Invalid event budget: " << arg.substr(22) << std::endl;
          std::cerr << "Budget must be a number between 1 and 100000" << std::endl;
          return 1;
        }
        config.max_events_per_turn = static_cast<size_t>(*budget);
      } else if (arg.find("--eventlog=") == 0) {
        config.event_log = arg.substr(11);
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=bridge,swap
        for (const auto &component : swaprelay::util::SplitList(arg.substr(8))) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Ensure datadir exists before initializing file logger
    if (!swaprelay::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory: " << config.datadir.string()
                << std::endl;
      return 1;
    }
    // Initialize logging system (enable file logging with debug.log)
    std::string log_file = (config.datadir / "debug.log").string();
    swaprelay::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto& component : debug_components) {
      if (component == "all") {
        swaprelay::util::LogManager::SetLogLevel("trace");
      } else if (!swaprelay::util::LogManager::SetComponentLevel(component, "trace")) {
        LOG_WARN("Unknown debug component '{}' ignored", component);
      }
    }

    // Create and initialize application
    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // This prevents race conditions where async callbacks try to log after logger is destroyed
    {
      swaprelay::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      // Run until shutdown requested
      app.wait_for_shutdown();

      // app destructor runs here, stopping the relay
    }

    // Shutdown logging AFTER app is fully destroyed
    swaprelay::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    swaprelay::util::LogManager::Shutdown();
    return 1;
  }
}
