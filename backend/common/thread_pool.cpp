#include "thread_pool.hpp"

namespace common {

ThreadPool::ThreadPool(unsigned int size) {
  _poolSize = size < 1 ? 2 : size;
  _threads.reserve(_poolSize);

  for (size_t i = 0; i < _poolSize; i++) {
    _threads.emplace_back([this]() -> void { workerLoop(); });
  }
}

// Queued tasks are drained before the workers exit; jthread joins on destruction
ThreadPool::~ThreadPool() {
  _stop.store(true, std::memory_order_release);
  _cv.notify_all();
  _threads.clear();
}

void ThreadPool::workerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock{_mtx};
      _cv.wait(lock, [this]() -> bool {
        return _stop.load(std::memory_order_acquire) || !_tasks.empty();
      });

      if (_stop.load(std::memory_order_acquire) && _tasks.empty()) {
        break;
      }

      task = std::move(_tasks.front());
      _tasks.pop();
    }
    task();
  }
}

} // namespace common
