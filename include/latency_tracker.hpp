#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

// Wall-clock durations of simulation ticks, in nanoseconds
class LatencyTracker {
private:
  mutable std::mutex mutex_;
  std::deque<long long> latencies_;
  std::size_t max_samples_;

  std::vector<long long> sorted_samples() const;
  static long long percentile(const std::vector<long long> &sorted, double p);
  static void print_histogram(const std::vector<long long> &sorted);

public:
  explicit LatencyTracker(std::size_t max_samples = 100000);

  void record(long long latency_ns);
  std::size_t count() const;

  // p in [0, 100]. Returns 0 when nothing was recorded.
  long long percentile(double p) const;

  void print_statistics() const;
};
