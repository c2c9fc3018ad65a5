#pragma once

#include "fill.hpp"
#include "thread_safe_queue.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

using FillListener = std::function<void(const Fill &)>;

// Delivers fills to registered listeners on a dedicated thread so listener
// I/O stays off the tick path
class FillDispatcher {
public:
  FillDispatcher();
  ~FillDispatcher();

  FillDispatcher(const FillDispatcher &) = delete;
  FillDispatcher &operator=(const FillDispatcher &) = delete;

  void add_listener(FillListener listener);
  std::size_t listener_count() const;

  void publish(const Fill &fill);
  void publish(const std::vector<Fill> &fills);

  // Block until every fill published so far has been delivered
  void drain();

  // Deliver what is queued, then stop the thread. Later publishes are dropped.
  void shutdown();

  std::uint64_t delivered() const;

private:
  ThreadSafeQueue<Fill> queue_;
  std::thread worker_;

  mutable std::mutex mutex_;
  std::condition_variable drained_;
  std::vector<FillListener> listeners_;
  std::uint64_t published_;
  std::uint64_t delivered_;

  void run();
};
