#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed-size worker pool. Symbol lanes are stepped here in parallel.
class ThreadPool {
public:
  explicit ThreadPool(std::size_t n_threads) : stop_(false) {
    if (n_threads == 0) {
      n_threads = 1;
    }
    workers_.reserve(n_threads);
    for (std::size_t i = 0; i < n_threads; ++i) {
      workers_.emplace_back([this]() { worker_loop(); });
    }
  }

  ~ThreadPool() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_ = true;
    }
    condition_.notify_all();
    for (auto &worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  // Exceptions thrown by f surface from the returned future's get()
  template <class F> auto submit(F &&f) -> std::future<decltype(f())> {
    using R = decltype(f());

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> future = task->get_future();

    {
      std::lock_guard<std::mutex> lock(mutex_);
      tasks_.emplace([task]() { (*task)(); });
    }
    condition_.notify_one();
    return future;
  }

  std::size_t size() const { return workers_.size(); }

private:
  void worker_loop() {
    for (;;) {
      std::function<void()> job;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });
        if (stop_ && tasks_.empty()) {
          return;
        }
        job = std::move(tasks_.front());
        tasks_.pop();
      }
      job();
    }
  }

  std::mutex mutex_;
  std::condition_variable condition_;
  bool stop_;
  std::queue<std::function<void()>> tasks_;
  std::vector<std::thread> workers_;
};
