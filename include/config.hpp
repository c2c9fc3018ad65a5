#pragma once

#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

// Key/value behaviour parameters (agent tuning knobs)
struct ParameterSet {
  std::unordered_map<std::string, double> values;

  double get_parameter(const std::string &key, double default_val = 0.0) const {
    auto it = values.find(key);
    return (it != values.end()) ? it->second : default_val;
  }

  void set_parameter(const std::string &key, double value) {
    values[key] = value;
  }
};

struct OrderBookConfig {
  std::size_t max_depth = 50; // levels per side in published snapshots
  double tick_size = 0.01;
  bool enforce_tick_size = true;
  std::size_t retained_terminal_orders = 100000; // 0 = keep everything
  std::size_t retained_fills = 100000;           // 0 = keep everything
};

struct LiquidityConfig {
  double base_liquidity = 10000.0;
  double decay_rate = 0.1; // fraction of the deficit recovered per tick
  double impact_coefficient = 0.01;
  double consumption_rate = 1.0; // liquidity removed per unit traded
  double min_liquidity = 1.0;    // floor used by the impact curve
  double min_liquidity_fraction = 0.1; // floor as a fraction of the base
};

struct PriceDiscoveryConfig {
  double momentum_factor = 0.3;
  double mean_reversion_rate = 0.05;
  double volatility = 0.001; // per-tick std-dev of returns
  std::size_t trend_window = 5;
  std::size_t reversion_window = 20;
  std::size_t volatility_window = 20;
  std::size_t history_length = 100;
  double max_flow_return = 0.05; // largest relative move flow causes per tick
};

struct ExecutionConfig {
  SlippageModel slippage_model = SlippageModel::SQUARE_ROOT;
  double slippage_coefficient = 0.0005;
  SimTime latency_us = 500;
  double max_slippage = 0.05; // cap on the taker's relative price adjustment
  MarketRemainderPolicy market_remainder = MarketRemainderPolicy::LEAVE_PARTIAL;
};

enum class AnalyticsTrigger { EVERY_TICK, EVERY_N_TRADES };

struct AnalyticsConfig {
  AnalyticsTrigger trigger = AnalyticsTrigger::EVERY_TICK;
  std::size_t every_n_trades = 10;
  std::size_t volatility_window = 50;
  std::size_t vwap_window = 100;
  std::size_t effective_spread_window = 100;
  std::size_t imbalance_levels = 5;
};

// Order in which agent actions are applied within a tick
enum class AgentOrdering { BY_ID, SEEDED_SHUFFLE };

struct AgentPopulationConfig {
  std::size_t market_makers = 5;
  std::size_t noise_traders = 20;
  std::size_t informed_traders = 10;
  std::size_t momentum_traders = 5;
  AgentOrdering ordering = AgentOrdering::BY_ID;

  ParameterSet market_maker_params;
  ParameterSet noise_trader_params;
  ParameterSet informed_trader_params;
  ParameterSet momentum_trader_params;

  std::size_t total() const {
    return market_makers + noise_traders + informed_traders + momentum_traders;
  }

  const ParameterSet &params_for(AgentType type) const;
};

struct SimulationConfig {
  std::chrono::milliseconds tick_interval{100}; // wall-clock cadence
  SimTime tick_duration_us = 100000;            // simulated time per tick
  std::uint64_t seed = 42;
  std::size_t worker_threads = 0; // 0 = hardware concurrency

  OrderBookConfig book;
  LiquidityConfig liquidity;
  PriceDiscoveryConfig price;
  ExecutionConfig execution;
  AnalyticsConfig analytics;
  AgentPopulationConfig agents;

  // Throws ValidationError on the first inconsistent field
  void validate() const;
};
