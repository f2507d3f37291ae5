#include "FilesystemWatcher.hpp"
#include <efsw/efsw.hpp>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <set>
#include <vector>

namespace fs = std::filesystem;

namespace filesync {

static std::string joinPath(const std::string &dir, const std::string &name) {
  std::string full = dir + name;
  if (!dir.empty() && dir.back() != '/' && dir.back() != '\\')
    full = dir + "/" + name;
  return fs::path(full).lexically_normal().generic_string();
}

// Comparable spelling of a path that may no longer exist.
static std::string directoryKey(const std::string &path) {
  std::error_code ec;
  auto resolved = fs::weakly_canonical(fs::path(path), ec);
  if (ec)
    return fs::path(path).lexically_normal().generic_string();
  return resolved.generic_string();
}

static bool isBelowKey(const std::string &key, const std::string &base) {
  return key.size() > base.size() && key.compare(0, base.size(), base) == 0 &&
         key[base.size()] == '/';
}

struct FilesystemWatcher::Impl : public efsw::FileWatchListener {
  efsw::WatchID watchId = 0;
  bool running = false;
  std::mutex mtx;
  FilesystemWatcher::Callback callback;

  // Directories known to exist below the root. A deleted path can no longer
  // be inspected, so this decides whether a Delete was a directory.
  std::mutex dirMutex;
  std::set<std::string> knownDirectories;

  efsw::FileWatcher watcher; // Destroyed first, stops delivering events

  // Records dir and every directory below it.
  void rememberTree(const std::string &dir) {
    std::vector<std::string> found{directoryKey(dir)};
    std::error_code ec;
    fs::recursive_directory_iterator it(
        dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      std::error_code typeEc;
      if (it->is_directory(typeEc) && !it->is_symlink(typeEc))
        found.push_back(directoryKey(it->path().string()));
    }
    std::lock_guard<std::mutex> lock(dirMutex);
    knownDirectories.insert(found.begin(), found.end());
  }

  // Drops dir and everything below it. Returns whether dir was known.
  bool forgetTree(const std::string &dir) {
    auto key = directoryKey(dir);
    std::lock_guard<std::mutex> lock(dirMutex);
    bool known = knownDirectories.erase(key) > 0;
    auto it = knownDirectories.lower_bound(key + "/");
    while (it != knownDirectories.end() && isBelowKey(*it, key))
      it = knownDirectories.erase(it);
    return known;
  }

  void emit(const RawEvent &event) {
    std::lock_guard<std::mutex> lock(mtx);
    if (callback)
      callback(event);
  }

  void handleFileAction(efsw::WatchID, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename) override {
    RawEvent event;
    event.absPath = joinPath(dir, filename);
    std::error_code ec;
    event.isDirectory = fs::is_directory(event.absPath, ec);

    switch (action) {
    case efsw::Actions::Add:
      event.kind = RawEventKind::Created;
      if (event.isDirectory)
        rememberTree(event.absPath);
      break;
    case efsw::Actions::Delete:
      event.kind = RawEventKind::Deleted;
      if (forgetTree(event.absPath))
        event.isDirectory = true;
      break;
    case efsw::Actions::Modified:
      event.kind = RawEventKind::Modified;
      break;
    case efsw::Actions::Moved:
      event.kind = RawEventKind::Moved;
      if (!oldFilename.empty()) {
        event.oldAbsPath = joinPath(dir, oldFilename);
        forgetTree(event.oldAbsPath);
      }
      if (event.isDirectory)
        rememberTree(event.absPath);
      break;
    default:
      return;
    }
    emit(event);
  }
};

FilesystemWatcher::FilesystemWatcher(const std::string &path, Callback callback)
    : m_impl(std::make_unique<Impl>()), m_path(path) {
  m_impl->callback = std::move(callback);
}

FilesystemWatcher::~FilesystemWatcher() { stop(); }

Result<void> FilesystemWatcher::start() {
  if (m_impl->running)
    return Result<void>::Ok();

  m_impl->rememberTree(m_path);
  m_impl->watchId = m_impl->watcher.addWatch(m_path, m_impl.get(), true);
  if (m_impl->watchId < 0) {
    auto reason = efsw::Errors::Log::getLastErrorLog();
    std::cerr << "[Watcher] Error starting watcher: " << reason << std::endl;
    return Result<void>::Error(
        SyncError::fileOperation("cannot watch directory", m_path, "watch",
                                 reason));
  }
  m_impl->watcher.watch();
  m_impl->running = true;
  std::cout << "[Watcher] Started monitoring: " << m_path << std::endl;
  return Result<void>::Ok();
}

void FilesystemWatcher::stop() {
  if (!m_impl->running)
    return;

  m_impl->watcher.removeWatch(m_impl->watchId);
  {
    // Waits for a callback in flight.
    std::lock_guard<std::mutex> lock(m_impl->mtx);
    m_impl->callback = nullptr;
  }
  {
    std::lock_guard<std::mutex> lock(m_impl->dirMutex);
    m_impl->knownDirectories.clear();
  }
  m_impl->running = false;
  std::cout << "[Watcher] Stopped monitoring: " << m_path << std::endl;
}

bool FilesystemWatcher::isRunning() const { return m_impl->running; }

} // namespace filesync
