#include "latency_tracker.hpp"
#include <algorithm>
#include <climits>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>

LatencyTracker::LatencyTracker(std::size_t max_samples)
    : max_samples_(max_samples) {}

void LatencyTracker::record(long long latency_ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  latencies_.push_back(latency_ns);
  if (max_samples_ > 0 && latencies_.size() > max_samples_) {
    latencies_.pop_front();
  }
}

std::size_t LatencyTracker::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latencies_.size();
}

std::vector<long long> LatencyTracker::sorted_samples() const {
  std::vector<long long> sorted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sorted.assign(latencies_.begin(), latencies_.end());
  }
  std::sort(sorted.begin(), sorted.end());
  return sorted;
}

long long LatencyTracker::percentile(double p) const {
  return percentile(sorted_samples(), p);
}

long long LatencyTracker::percentile(const std::vector<long long> &sorted,
                                     double p) {
  if (sorted.empty()) {
    return 0;
  }
  size_t n = sorted.size();
  size_t index = static_cast<size_t>((p / 100.0) * n);
  if (index >= n)
    index = n - 1;
  return sorted[index];
}

void LatencyTracker::print_statistics() const {
  auto sorted = sorted_samples();
  if (sorted.empty()) {
    std::cout << "No tick latencies recorded!" << std::endl;
    return;
  }

  std::cout << "\n=== Tick Latency Distribution (" << sorted.size()
            << " ticks) ===" << std::endl;
  std::cout << "p50 (median): " << percentile(sorted, 50) / 1000 << " us"
            << std::endl;
  std::cout << "p95: " << percentile(sorted, 95) / 1000 << " us" << std::endl;
  std::cout << "p99: " << percentile(sorted, 99) / 1000 << " us" << std::endl;
  std::cout << "p99.9: " << percentile(sorted, 99.9) / 1000 << " us"
            << std::endl;

  print_histogram(sorted);
}

void LatencyTracker::print_histogram(const std::vector<long long> &sorted) {
  std::cout << "\n=== Histogram ===" << std::endl;

  const std::pair<std::string, std::pair<long long, long long>> buckets[] = {
      {"<100us", {0, 100000}},
      {"100-500us", {100000, 500000}},
      {"500us-1ms", {500000, 1000000}},
      {"1-5ms", {1000000, 5000000}},
      {">5ms", {5000000, LLONG_MAX}}};

  size_t total = sorted.size();
  for (const auto &[label, range] : buckets) {
    auto first = std::lower_bound(sorted.begin(), sorted.end(), range.first);
    auto last = std::lower_bound(sorted.begin(), sorted.end(), range.second);
    auto count = static_cast<long long>(std::distance(first, last));
    double percentage = (count * 100.0) / total;

    std::cout << std::left << std::setw(10) << label << std::right << ": "
              << count << " (" << std::fixed << std::setprecision(1)
              << percentage << "%) " << std::defaultfloat;

    int bar_length = static_cast<int>(percentage / 2);
    std::cout << std::string(bar_length, '#') << std::endl;
  }
}
