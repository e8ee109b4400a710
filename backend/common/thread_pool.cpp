#include "thread_pool.hpp"

ThreadPool::ThreadPool(unsigned int size, size_t capacity) {
  _poolSize = size < 1 ? 1 : size;
  _capacity = capacity < 1 ? 1 : capacity;
  _threads.reserve(_poolSize);

  for (unsigned int i = 0; i < _poolSize; i++) {
    _threads.emplace_back([this]() { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock{_mtx};
    _stop.store(true, std::memory_order_release);
  }
  _cv.notify_all();
  _space_cv.notify_all();

  for (auto& thread : _threads) {
    if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
      thread.join();
    }
  }
}

size_t ThreadPool::pending() const {
  std::lock_guard<std::mutex> lock{_mtx};
  return _tasks.size();
}

void ThreadPool::workerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock{_mtx};
      // 等待任务或关闭信号
      _cv.wait(lock, [this]() -> bool {
        return _stop.load(std::memory_order_acquire) || !_tasks.empty();
      });

      // 关闭后仍然把已排队的任务执行完
      if (_stop.load(std::memory_order_acquire) && _tasks.empty()) {
        break;
      }

      task = std::move(_tasks.front());
      _tasks.pop();
    }
    _space_cv.notify_one();
    task();
  }
}
