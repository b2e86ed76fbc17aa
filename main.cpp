// -----------------------------------------------------------------------------
// stockcheck: single executable entry point.
//
// One-shot mode (default):
//   1) Build the AppConfig from an optional JSON file plus command line
//      overrides.
//   2) Load the inventory export into a StockCheckEngine.
//   3) Read the want-list (not needed for the bin report), reconcile, and
//      print the result in the configured format on stdout.
//
// Server mode (--serve or "server.enabled" in the config):
//   2) as above, then start the StockServer and keep answering commands
//      until Ctrl-C. RELOAD picks up a new export without a restart.
//
// Log lines are tagged with their component. Loading and warnings log to
// stderr, so in one-shot mode stdout carries the report and nothing else.
// Only the server lifecycle lines go to stdout.
// -----------------------------------------------------------------------------

#include "stockcheck/config/app_config.hpp"
#include "stockcheck/engine/stock_check_engine.hpp"
#include "stockcheck/errors.hpp"
#include "stockcheck/io/wants_list_reader.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

// Set by the SIGINT/SIGTERM handler, polled by the server-mode wait loop.
std::atomic<bool> g_stop_requested{false};

void stopHandler(int /*signum*/) { g_stop_requested.store(true); }

void printUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " [--config FILE] [--inventory FILE] [--wants FILE]\n"
               "       [--format summary|picking|invoice|update_csv|json|bins]"
               " [--serve]\n";
}

struct CommandLine {
  std::optional<std::string> config_path;
  std::optional<std::string> inventory_path;
  std::optional<std::string> wants_path;
  std::optional<std::string> format;
  bool serve{false};
  bool help{false};
};

// Throws ConfigError for unknown flags or a flag missing its value.
CommandLine parseCommandLine(int argc, char** argv) {
  CommandLine cli;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw stockcheck::ConfigError("missing value for " + arg);
      }
      return argv[++i];
    };

    if (arg == "--config") {
      cli.config_path = value();
    } else if (arg == "--inventory") {
      cli.inventory_path = value();
    } else if (arg == "--wants") {
      cli.wants_path = value();
    } else if (arg == "--format") {
      cli.format = value();
    } else if (arg == "--serve") {
      cli.serve = true;
    } else if (arg == "--help" || arg == "-h") {
      cli.help = true;
    } else {
      throw stockcheck::ConfigError("unknown argument: " + arg);
    }
  }
  return cli;
}

stockcheck::config::AppConfig buildConfig(const CommandLine& cli) {
  stockcheck::config::AppConfig config;
  if (cli.config_path) {
    config = stockcheck::config::loadConfig(*cli.config_path);
  }
  if (cli.inventory_path) {
    config.inventory_path = *cli.inventory_path;
  }
  if (cli.wants_path) {
    config.wants_path = *cli.wants_path;
  }
  if (cli.format) {
    auto format = stockcheck::config::parseOutputFormat(*cli.format);
    if (!format) {
      throw stockcheck::ConfigError("unknown format: " + *cli.format);
    }
    config.output_format = *format;
  }
  if (cli.serve) {
    config.server.enabled = true;
  }
  stockcheck::config::validate(config);
  return config;
}

int runServer(stockcheck::StockCheckEngine& engine) {
  std::signal(SIGINT, stopHandler);
  std::signal(SIGTERM, stopHandler);

  engine.start();
  std::cout << "[main] Serving. Press Ctrl-C to shut down.\n";

  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();
  return 0;
}

int runOnce(stockcheck::StockCheckEngine& engine) {
  const auto& config = engine.config();

  std::vector<stockcheck::domain::WantEntry> wants;
  if (config.output_format != stockcheck::config::OutputFormat::Bins) {
    if (config.wants_path.empty()) {
      throw stockcheck::ConfigError("no wants list given (--wants)");
    }
    wants = stockcheck::io::WantsListReader::readFile(config.wants_path).entries;
  }

  std::cout << engine.report(wants, config.output_format);
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    CommandLine cli = parseCommandLine(argc, argv);
    if (cli.help) {
      printUsage(argv[0]);
      return 0;
    }

    stockcheck::StockCheckEngine engine(buildConfig(cli));
    engine.reloadInventory();

    if (engine.config().server.enabled) {
      return runServer(engine);
    }
    return runOnce(engine);
  } catch (const stockcheck::ConfigError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    printUsage(argv[0]);
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }
}
