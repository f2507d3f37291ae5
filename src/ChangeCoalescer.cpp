#include "ChangeCoalescer.hpp"
#include "PathUtils.hpp"
#include <algorithm>
#include <iostream>

namespace fs = std::filesystem;

namespace filesync {

ChangeCoalescer::ChangeCoalescer(std::string syncRoot, Callback callback,
                                 CoalescerOptions options, MetricsSink &metrics)
    : m_syncRoot(std::move(syncRoot)), m_callback(std::move(callback)),
      m_options(std::move(options)), m_metrics(metrics),
      m_scanner(m_syncRoot) {}

ChangeCoalescer::~ChangeCoalescer() { stop(); }

void ChangeCoalescer::start() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_running)
    return;
  m_running = true;
  m_thread = std::thread(&ChangeCoalescer::run, this);
}

void ChangeCoalescer::stop() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running && !m_thread.joinable())
      return;
    m_running = false;
  }
  m_cv.notify_all();
  if (m_thread.joinable())
    m_thread.join();
}

void ChangeCoalescer::run() {
  auto nextCleanup = Clock::now() + m_options.cleanupInterval;
  std::unique_lock<std::mutex> lock(m_mutex);
  while (m_running) {
    m_cv.wait_for(lock, m_options.tick, [this]() { return !m_running; });
    if (!m_running)
      break;
    lock.unlock();

    auto now = Clock::now();
    flushDue(now);
    if (now >= nextCleanup) {
      cleanupStale(now);
      nextCleanup = now + m_options.cleanupInterval;
    }
    lock.lock();
  }
}

bool ChangeCoalescer::ignored(const std::string &absPath) const {
  if (hasPartialSuffix(absPath))
    return true;
  auto rel = toRelativePath(fs::path(absPath), fs::path(m_syncRoot));
  return shouldIgnore(rel, m_options.ignorePatterns);
}

void ChangeCoalescer::onEvent(const RawEvent &event) {
  onEvent(event, Clock::now());
}

void ChangeCoalescer::onEvent(const RawEvent &event, Clock::time_point at) {
  switch (event.kind) {
  case RawEventKind::Created:
    if (!ignored(event.absPath))
      schedule(event.absPath, SyncOperation::Create, std::nullopt, at);
    break;

  case RawEventKind::Modified:
    if (!event.isDirectory && !ignored(event.absPath))
      schedule(event.absPath, SyncOperation::Update, std::nullopt, at);
    break;

  case RawEventKind::Deleted:
    if (hasPartialSuffix(event.absPath))
      break;
    if (event.isDirectory || !ignored(event.absPath))
      schedule(event.absPath, SyncOperation::Delete, std::nullopt, at);
    break;

  case RawEventKind::Moved: {
    if (hasPartialSuffix(event.absPath) && hasPartialSuffix(event.oldAbsPath))
      break;
    bool sourceIgnored = !event.oldAbsPath.empty() && ignored(event.oldAbsPath);
    bool destIgnored = ignored(event.absPath);

    if (sourceIgnored && !event.isDirectory) {
      // Temp-file-then-rename saves show up as a move out of an ignored name.
      if (!destIgnored)
        schedule(event.absPath, SyncOperation::Create, std::nullopt, at);
      break;
    }
    if (destIgnored) {
      if (!event.oldAbsPath.empty())
        schedule(event.oldAbsPath, SyncOperation::Delete, std::nullopt, at);
      break;
    }
    std::optional<std::string> oldRel;
    if (!event.oldAbsPath.empty())
      oldRel = toRelativePath(fs::path(event.oldAbsPath), fs::path(m_syncRoot));
    schedule(event.absPath, SyncOperation::Move, oldRel, at);
    break;
  }
  }
}

void ChangeCoalescer::schedule(const std::string &absPath, SyncOperation op,
                               std::optional<std::string> oldPath,
                               Clock::time_point at) {
  std::lock_guard<std::mutex> lock(m_mutex);

  auto delay = m_options.baseDelay;
  auto seen = m_lastSeen.find(absPath);
  if (seen != m_lastSeen.end() && at - seen->second.at < m_options.rapidWindow) {
    auto grown = std::chrono::milliseconds(static_cast<int64_t>(
        static_cast<double>(seen->second.delay.count()) *
        m_options.adaptiveFactor));
    delay = std::min(m_options.maxDelay, grown);
  }
  m_lastSeen[absPath] = {at, delay};

  auto existing = m_pending.find(absPath);
  if (existing != m_pending.end()) {
    m_metrics.incrementCounter("watcher.events_coalesced");
    if (existing->second.operation == SyncOperation::Create &&
        op == SyncOperation::Update) {
      existing->second.deadline = at + delay;
      return;
    }
    // A later event on a moved path still owes the server a removal of the
    // source.
    if (existing->second.oldPath && !oldPath) {
      if (op != SyncOperation::Delete)
        op = SyncOperation::Move;
      oldPath = existing->second.oldPath;
    }
  }
  m_pending[absPath] = {op, std::move(oldPath), at + delay};
}

size_t ChangeCoalescer::flushDue(Clock::time_point now) {
  std::vector<std::pair<std::string, Pending>> due;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_pending.begin(); it != m_pending.end();) {
      if (it->second.deadline <= now) {
        due.emplace_back(it->first, it->second);
        it = m_pending.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (const auto &[absPath, pending] : due)
    commit(absPath, pending);
  return due.size();
}

void ChangeCoalescer::commit(const std::string &absPath,
                             const Pending &pending) {
  LocalChange change;
  change.operation = pending.operation;
  change.old_path = pending.oldPath;

  if (change.operation != SyncOperation::Delete) {
    auto info = m_scanner.statFile(fs::path(absPath));
    if (info)
      change.info = *info;
    else
      change.operation = SyncOperation::Delete;
  }

  if (change.operation == SyncOperation::Delete) {
    change.info = FileInfo{};
    change.info.path = toRelativePath(fs::path(absPath), fs::path(m_syncRoot));
    change.info.modified_time = nowMillis();
  }

  m_metrics.incrementCounter("watcher.changes_committed", 1,
                             {{"operation", toString(change.operation)}});
  if (m_callback)
    m_callback(change);
}

size_t ChangeCoalescer::cleanupStale(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(m_mutex);
  size_t removed = 0;
  for (auto it = m_lastSeen.begin(); it != m_lastSeen.end();) {
    if (now - it->second.at > m_options.staleAfter) {
      it = m_lastSeen.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

size_t ChangeCoalescer::pendingCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_pending.size();
}

size_t ChangeCoalescer::trackedCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_lastSeen.size();
}

} // namespace filesync
