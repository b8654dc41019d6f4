#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace parkwise::core {

// Fixed-size worker pool. Header-only.
//
// Used to run independent simulation batches side by side; each job owns all
// of its mutable state, so the pool needs no further synchronisation.
class JobSystem {
public:
  // threadCount == 0 picks hardware_concurrency() (4 if unknown).
  explicit JobSystem(std::size_t threadCount = 0) {
    if (threadCount == 0) threadCount = defaultThreadCount();
    threadCount_ = threadCount;

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
      threads_.emplace_back([this]() { workerLoop(); });
    }
  }

  ~JobSystem() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
  }

  JobSystem(const JobSystem&) = delete;
  JobSystem& operator=(const JobSystem&) = delete;

  std::size_t threadCount() const { return threadCount_; }

  static std::size_t defaultThreadCount() {
    const unsigned hc = std::thread::hardware_concurrency();
    return hc > 0 ? static_cast<std::size_t>(hc) : 4;
  }

  template <class F>
  auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> fut = task->get_future();

    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (stopping_) {
        // Pool is shutting down; run inline rather than drop the job.
        lock.unlock();
        (*task)();
        return fut;
      }
      queue_.emplace_back([task]() { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  // Blocks until the queue is empty and no worker is running a job.
  void waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idleCv_.wait(lock, [&]() { return queue_.empty() && active_ == 0; });
  }

private:
  void workerLoop() {
    for (;;) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]() { return stopping_ || !queue_.empty(); });
        if (stopping_ && queue_.empty()) return;

        task = std::move(queue_.front());
        queue_.pop_front();
        ++active_;
      }

      task();

      {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
        if (queue_.empty() && active_ == 0) idleCv_.notify_all();
      }
    }
  }

  std::size_t threadCount_{1};
  std::vector<std::thread> threads_{};

  std::mutex mutex_{};
  std::condition_variable cv_{};
  std::condition_variable idleCv_{};

  std::deque<std::function<void()>> queue_{};
  std::size_t active_{0};
  bool stopping_{false};
};

} // namespace parkwise::core
