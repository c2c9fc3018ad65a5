#pragma once

#include "config.hpp"
#include "types.hpp"

#include <string>
#include <unordered_map>

// Liquidity beyond the visible book, one level per symbol. Trading consumes
// it, time restores it toward the configured base.
class LiquidityModel {
public:
  LiquidityModel();
  explicit LiquidityModel(const LiquidityConfig &config);

  // Registers a symbol at the base level. Returns false if already known.
  bool add_symbol(const std::string &symbol);
  bool has_symbol(const std::string &symbol) const;

  // Throws NotFoundError for unknown symbols
  double level(const std::string &symbol) const;
  double base_level() const { return config_.base_liquidity; }

  // Smallest liquidity the impact curve divides by
  double impact_floor() const;

  // Signed relative price adjustment for trading order_size against the
  // given liquidity: coefficient * sqrt(size / liquidity), positive for buys.
  double impact(double order_size, double liquidity, Side side) const;
  double impact(const std::string &symbol, double order_size, Side side) const;

  // Remove consumption_rate * quantity, never below zero
  void apply_consumption(const std::string &symbol, double consumed_quantity);

  // Exponential recovery toward the base, never above it
  void decay_toward_base(const std::string &symbol, std::size_t elapsed_ticks);

  const LiquidityConfig &config() const { return config_; }

private:
  LiquidityConfig config_;
  std::unordered_map<std::string, double> levels_;

  double &level_ref(const std::string &symbol);
};
