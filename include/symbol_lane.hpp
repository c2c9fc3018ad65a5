#pragma once

#include "agent_simulator.hpp"
#include "analytics.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "execution_engine.hpp"
#include "liquidity_model.hpp"
#include "market_state.hpp"
#include "order_book.hpp"
#include "price_discovery.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Everything a reader may see about one symbol, published as one immutable
// unit
struct LaneSnapshot {
  BookSnapshot book;
  MarketState market;
  AnalyticsSnapshot analytics;
  std::uint64_t tick = 0;
};

// Single writer for one symbol: owns the book and every model around it.
// All mutation goes through the lane mutex; readers take the published
// snapshot.
class SymbolLane {
public:
  SymbolLane(std::string symbol, double initial_price,
             std::uint64_t lane_index, const SimulationConfig &config);

  SymbolLane(const SymbolLane &) = delete;
  SymbolLane &operator=(const SymbolLane &) = delete;

  // Run one tick: price discovery, liquidity recovery, agents, analytics,
  // publish. Returns the fills produced. A halted lane does nothing.
  std::vector<Fill> step(std::uint64_t tick, SimTime now);

  // External order entry, serialized with the tick
  Result<ExecutionReport> submit(const OrderRequest &request);
  Status cancel(OrderId order_id);
  std::optional<Order> get_order(OrderId order_id) const;

  std::shared_ptr<const LaneSnapshot> snapshot() const;

  bool halted() const { return halted_.load(); }
  std::string halt_reason() const;

  const std::string &symbol() const { return symbol_; }
  std::uint64_t lane_index() const { return lane_index_; }

  // Direct access for tests and reports. Not synchronized with step().
  AgentSimulator &agent_simulator() { return agents_; }
  const OrderBook &order_book() const { return book_; }

  void print_summary() const;

private:
  SimulationConfig config_;
  std::string symbol_;
  std::uint64_t lane_index_;

  mutable std::mutex mutex_;
  OrderBook book_;
  LiquidityModel liquidity_;
  PriceDiscovery price_;
  ExecutionEngine engine_;
  AgentSimulator agents_;
  AnalyticsEngine analytics_;

  std::uint64_t tick_;
  SimTime now_;

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const LaneSnapshot> snapshot_;

  std::atomic<bool> halted_;
  std::string halt_reason_; // guarded by mutex_

  MarketState market_state() const;
  void record_trades(const ExecutionReport &report);
  void publish();
  void halt(const std::string &reason);
  std::string describe_book() const;
};
