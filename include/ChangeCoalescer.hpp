#pragma once

#include "FileSystemScanner.hpp"
#include "Metrics.hpp"
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace filesync {

enum class RawEventKind { Created, Modified, Deleted, Moved };

// One notification from the filesystem backend. Paths are absolute.
struct RawEvent {
  RawEventKind kind = RawEventKind::Modified;
  std::string absPath;
  std::string oldAbsPath; // Moved only
  bool isDirectory = false;
};

// A debounced change, ready to be synced. info.path is relative to the root.
struct LocalChange {
  SyncOperation operation = SyncOperation::Update;
  FileInfo info;
  std::optional<std::string> old_path; // Relative source of a move
};

struct CoalescerOptions {
  std::vector<std::string> ignorePatterns;
  std::chrono::milliseconds baseDelay{100};
  std::chrono::milliseconds maxDelay{2000};
  double adaptiveFactor = 1.5;
  std::chrono::milliseconds rapidWindow{1000};
  std::chrono::milliseconds tick{50};
  std::chrono::milliseconds cleanupInterval = std::chrono::seconds(60);
  std::chrono::milliseconds staleAfter = std::chrono::minutes(5);
};

/**
 * ChangeCoalescer turns bursts of raw filesystem events into one committed
 * change per path.
 *
 * Each path has at most one pending entry with a deadline. A new event for
 * the path replaces the entry and pushes the deadline out; repeated events
 * less than rapidWindow apart grow the delay by adaptiveFactor up to
 * maxDelay. A pending Create absorbs later Updates. A single scheduler thread
 * commits due entries, re-checking the file on disk first.
 */
class ChangeCoalescer {
public:
  using Clock = std::chrono::steady_clock;
  using Callback = std::function<void(const LocalChange &)>;

  ChangeCoalescer(std::string syncRoot, Callback callback,
                  CoalescerOptions options = {},
                  MetricsSink &metrics = defaultMetrics());
  ~ChangeCoalescer();

  ChangeCoalescer(const ChangeCoalescer &) = delete;
  ChangeCoalescer &operator=(const ChangeCoalescer &) = delete;

  void start();
  void stop();

  void onEvent(const RawEvent &event);
  void onEvent(const RawEvent &event, Clock::time_point at);

  // Commits every entry whose deadline is at or before now. Returns the count.
  size_t flushDue(Clock::time_point now);
  // Forgets last-event timestamps older than staleAfter.
  size_t cleanupStale(Clock::time_point now);

  size_t pendingCount() const;
  size_t trackedCount() const;

private:
  struct Pending {
    SyncOperation operation;
    std::optional<std::string> oldPath;
    Clock::time_point deadline;
  };
  struct LastSeen {
    Clock::time_point at;
    std::chrono::milliseconds delay;
  };

  void schedule(const std::string &absPath, SyncOperation op,
                std::optional<std::string> oldPath, Clock::time_point at);
  void commit(const std::string &absPath, const Pending &pending);
  bool ignored(const std::string &absPath) const;
  void run();

  std::string m_syncRoot;
  Callback m_callback;
  CoalescerOptions m_options;
  MetricsSink &m_metrics;
  FileSystemScanner m_scanner;

  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::map<std::string, Pending> m_pending;
  std::map<std::string, LastSeen> m_lastSeen;
  bool m_running = false;
  std::thread m_thread;
};

} // namespace filesync
