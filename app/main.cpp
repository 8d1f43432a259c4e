#include "Logger.h"
#include "Node.h"
#include "Utilities.h"

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <signal.h>
#include <iostream>
#include <string>

namespace {
std::atomic<bool> g_stopRequested{ false };

void signalHandler(int signal) {
  if (signal == SIGINT) {
    g_stopRequested = true;
  }
}

void installSignalHandler() {
  // No SA_RESTART: a blocked read on stdin must return on Ctrl+C
  struct sigaction action {};
  action.sa_handler = signalHandler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
}

int configureLogging(const hl::Node::Config &config, bool debugMode) {
  auto logger = hl::logging::getRootLogger();
  hl::logging::Level level =
      debugMode ? hl::logging::Level::DEBUG
                : hl::logging::parseLevel(config.logLevel,
                                          hl::logging::Level::INFO);
  logger.setLevel(level);

  if (!config.logFile.empty()) {
    try {
      logger.addFileHandler(config.logFile, level);
    } catch (const std::exception &e) {
      std::cerr << "Failed to open log file: " << e.what() << std::endl;
      return 1;
    }
  }
  return 0;
}

int runNode(const hl::Node::Config &config) {
  auto logger = hl::logging::getLogger("hl");

  hl::Node node(config);
  auto startResult = node.start();
  if (!startResult) {
    logger.error << "Failed to start node: " << startResult.error().message;
    return 1;
  }

  std::string line;
  while (!g_stopRequested && std::getline(std::cin, line)) {
    if (line.empty()) {
      continue;
    }
    std::cout << node.handleRequest(line) << std::endl;
  }

  node.stop();
  logger.info << "Node stopped";
  return 0;
}
} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{ "hl-node - In-memory ledger with hybrid PoW/PoS consensus" };

  std::string configPath;
  app.add_option("-c,--config", configPath, "JSON configuration file");

  bool debugMode = false;
  app.add_flag("--debug", debugMode, "Enable debug logging");

  int64_t intervalMillis = -1;
  app.add_option("--interval", intervalMillis,
                 "Block production interval in milliseconds (0 = on demand)");

  std::string minerAddress;
  app.add_option("--miner", minerAddress,
                 "Miner address credited by scheduled block production");

  app.footer("Example:\n"
             "  echo '{\"type\":\"get_stats\"}' | hl-node -c node.json\n"
             "\n"
             "Requests are read as one JSON object per line from stdin and\n"
             "answered with one JSON object per line on stdout.\n");

  CLI11_PARSE(app, argc, argv);

  nlohmann::json jConfig = nlohmann::json::object();
  if (!configPath.empty()) {
    auto loaded = hl::utl::loadJsonFile(configPath);
    if (!loaded) {
      std::cerr << "Failed to load configuration: " << loaded.error().message
                << std::endl;
      return 1;
    }
    jConfig = loaded.value();
    if (!jConfig.is_object()) {
      std::cerr << "Configuration must be a JSON object" << std::endl;
      return 1;
    }
  }

  if (intervalMillis >= 0 || !minerAddress.empty()) {
    if (!jConfig.contains("producer")) {
      jConfig["producer"] = nlohmann::json::object();
    }
    // A malformed section is left for Config::fromJson to report
    if (jConfig["producer"].is_object()) {
      if (intervalMillis >= 0) {
        jConfig["producer"]["intervalMillis"] = intervalMillis;
      }
      if (!minerAddress.empty()) {
        jConfig["producer"]["minerAddress"] = minerAddress;
      }
    }
  }

  auto config = hl::Node::Config::fromJson(jConfig);
  if (!config) {
    std::cerr << "Invalid configuration: " << config.error().message
              << std::endl;
    return 1;
  }

  if (configureLogging(config.value(), debugMode) != 0) {
    return 1;
  }

  installSignalHandler();

  return runNode(config.value());
}
