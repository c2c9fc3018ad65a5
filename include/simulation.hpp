#pragma once

#include "analytics.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "fill_dispatcher.hpp"
#include "latency_tracker.hpp"
#include "market_state.hpp"
#include "order.hpp"
#include "order_book.hpp"
#include "symbol_lane.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// One simulation run: owns every symbol lane and the clock that steps them.
// Independent instances may coexist in one process.
class Simulation {
private:
  SimulationConfig config_;

  mutable std::mutex lanes_mutex_;
  std::vector<std::unique_ptr<SymbolLane>> lanes_; // lane index - 1
  std::unordered_map<std::string, SymbolLane *> lanes_by_symbol_;

  ThreadPool pool_;
  FillDispatcher dispatcher_;
  LatencyTracker tick_latency_;

  std::mutex step_mutex_; // one tick at a time
  std::atomic<std::uint64_t> tick_;
  std::atomic<bool> running_;

  std::mutex control_mutex_; // serializes start() and stop()
  std::thread clock_thread_;
  std::mutex clock_mutex_;
  std::condition_variable clock_cv_;
  bool stop_requested_;

  void run_clock();
  void advance_tick();

  std::vector<SymbolLane *> lane_list() const;
  SymbolLane *find_lane(const std::string &symbol) const;
  SymbolLane *lane_for_order(OrderId order_id) const;

public:
  // Throws ValidationError when the configuration is inconsistent
  explicit Simulation(SimulationConfig config = SimulationConfig());
  ~Simulation();

  Simulation(const Simulation &) = delete;
  Simulation &operator=(const Simulation &) = delete;

  // Setup
  Status add_symbol(const std::string &symbol, double initial_price);

  // Real-time clock
  Status start();
  Status stop(); // finishes the current tick and drains queued fills

  // Manual stepping, rejected while the clock runs
  Status step();
  Status run_ticks(std::size_t num_ticks);

  // Order entry
  Result<OrderId> submit_order(const OrderRequest &request);
  Result<ExecutionReport> execute_order(const OrderRequest &request);
  Status cancel_order(OrderId order_id);
  Result<Order> get_order(OrderId order_id) const;

  // Read-only views of the last published snapshot
  Result<BookSnapshot> get_order_book(const std::string &symbol,
                                      std::size_t depth) const;
  Result<MarketState> get_market_state(const std::string &symbol) const;
  Result<AnalyticsSnapshot> get_analytics(const std::string &symbol) const;

  std::vector<std::string> symbols() const;
  std::vector<std::string> halted_symbols() const;

  // Fill events, delivered off the tick path
  void add_fill_listener(FillListener listener);
  void drain_fills();

  std::uint64_t current_tick() const { return tick_.load(); }
  SimTime current_time() const {
    return static_cast<SimTime>(tick_.load()) * config_.tick_duration_us;
  }
  bool is_running() const { return running_.load(); }

  const SimulationConfig &config() const { return config_; }
  const LatencyTracker &tick_latency() const { return tick_latency_; }

  // Lane access for tests and reports. nullptr for an unknown symbol.
  SymbolLane *lane(const std::string &symbol) { return find_lane(symbol); }

  void print_summary() const;
};
