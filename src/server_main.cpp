#include "Config.hpp"
#include "SyncServer.hpp"
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
    std::cerr << "usage: " << argv[0] << " <server-config.json>" << std::endl;
    return 1;
  }

  filesync::ServerConfig config;
  try {
    config = filesync::loadServerConfig(argv[1]);
  } catch (const filesync::ConfigError &e) {
    std::cerr << "[Main] Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  try {
    filesync::SyncServer server(config);
    auto started = server.start();
    if (!started) {
      std::cerr << "[Main] Failed to start: " << started.error().describe()
                << std::endl;
      return 1;
    }
    std::cout << "[Main] Running. Press Ctrl+C to exit gracefully." << std::endl;

    std::unique_lock<std::mutex> lock(cv_m);
    cv.wait(lock, [] { return !running.load(); });
    lock.unlock();

    server.stop();
    std::cout << "[Main] Finished." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
