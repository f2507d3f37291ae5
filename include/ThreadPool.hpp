#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace filesync {

/**
 * Fixed-size worker pool. Used for checksum-heavy scans and for bounded
 * upload/download batches.
 */
class ThreadPool {
public:
  explicit ThreadPool(size_t threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  template <class F, class... Args>
  auto submit(F &&f, Args &&...args) -> std::future<decltype(f(args...))>;

  size_t size() const { return m_workers.size(); }

private:
  std::vector<std::thread> m_workers;
  std::queue<std::function<void()>> m_tasks;

  std::mutex m_queueMutex;
  std::condition_variable m_condition;
  bool m_stop = false;
};

template <class F, class... Args>
auto ThreadPool::submit(F &&f, Args &&...args)
    -> std::future<decltype(f(args...))> {
  using return_type = decltype(f(args...));

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    if (m_stop)
      throw std::runtime_error("submit on stopped ThreadPool");
    m_tasks.emplace([task]() { (*task)(); });
  }
  m_condition.notify_one();
  return res;
}

} // namespace filesync
