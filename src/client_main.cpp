#include "Config.hpp"
#include "SyncEngine.hpp"
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>

std::atomic<bool> running{true};
std::mutex cv_m;
std::condition_variable cv;

static void signalHandler(int sig) {
  std::cout << "[Main] Shutdown signal received (" << sig << ")" << std::endl;
  running.store(false);
  cv.notify_all();
}

int main(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <client-config.json>" << std::endl;
    return 1;
  }

  filesync::ClientConfig config;
  try {
    config = filesync::loadClientConfig(argv[1]);
  } catch (const filesync::ConfigError &e) {
    std::cerr << "[Main] Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);
  std::cout << "Sync Client starting..." << std::endl;

  try {
    filesync::SyncEngine engine(config);
    auto started = engine.start();
    if (!started) {
      std::cerr << "[Main] Failed to start: " << started.error().describe()
                << std::endl;
      return 1;
    }

    std::cout << "[Main] Performing initial sync..." << std::endl;
    auto report = engine.performInitialSync();
    if (!report) {
      std::cerr << "[Main] Initial sync failed: " << report.error().describe()
                << std::endl;
    } else if (!report.value().ok()) {
      for (const auto &failure : report.value().failed)
        std::cerr << "[Main] " << failure.path << ": "
                  << failure.error.describe() << std::endl;
    }

    std::cout << "[Main] Running. Monitoring: " << config.sync_directory
              << std::endl;
    std::unique_lock<std::mutex> lock(cv_m);
    cv.wait(lock, [] { return !running.load(); });
    lock.unlock();

    engine.stop();
    std::cout << "[Main] Finished." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
