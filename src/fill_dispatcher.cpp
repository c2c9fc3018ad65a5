#include "fill_dispatcher.hpp"

#include "log.hpp"

FillDispatcher::FillDispatcher() : published_(0), delivered_(0) {
  worker_ = std::thread([this]() { run(); });
}

FillDispatcher::~FillDispatcher() { shutdown(); }

void FillDispatcher::add_listener(FillListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.push_back(std::move(listener));
}

std::size_t FillDispatcher::listener_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

void FillDispatcher::publish(const Fill &fill) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listeners_.empty()) {
      return;
    }
    ++published_;
  }
  if (!queue_.push(fill)) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      --published_;
    }
    drained_.notify_all();
  }
}

void FillDispatcher::publish(const std::vector<Fill> &fills) {
  for (const auto &fill : fills) {
    publish(fill);
  }
}

void FillDispatcher::drain() {
  std::unique_lock<std::mutex> lock(mutex_);
  drained_.wait(lock, [this]() { return delivered_ >= published_; });
}

void FillDispatcher::shutdown() {
  queue_.close();
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::uint64_t FillDispatcher::delivered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return delivered_;
}

void FillDispatcher::run() {
  while (auto fill = queue_.pop()) {
    std::vector<FillListener> listeners;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      listeners = listeners_;
    }

    for (const auto &listener : listeners) {
      try {
        listener(*fill);
      } catch (const std::exception &e) {
        log_warn("Fill listener failed on fill " + std::to_string(fill->id) +
                 ": " + e.what());
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++delivered_;
    }
    drained_.notify_all();
  }
}
