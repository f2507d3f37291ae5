#pragma once
#include "ChangeCoalescer.hpp"
#include "SyncError.hpp"
#include <functional>
#include <memory>
#include <string>

namespace filesync {

/**
 * FilesystemWatcher monitors a directory tree with efsw and forwards every
 * notification as a RawEvent. Debouncing is left to the receiver.
 */
class FilesystemWatcher {
public:
  using Callback = std::function<void(const RawEvent &event)>;

  FilesystemWatcher(const std::string &path, Callback callback);
  ~FilesystemWatcher();

  Result<void> start();
  void stop();
  bool isRunning() const;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  std::string m_path;
};

} // namespace filesync
