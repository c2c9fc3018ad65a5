#include "liquidity_model.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>

LiquidityModel::LiquidityModel() : LiquidityModel(LiquidityConfig()) {}

LiquidityModel::LiquidityModel(const LiquidityConfig &config)
    : config_(config) {}

bool LiquidityModel::add_symbol(const std::string &symbol) {
  return levels_.emplace(symbol, config_.base_liquidity).second;
}

bool LiquidityModel::has_symbol(const std::string &symbol) const {
  return levels_.count(symbol) > 0;
}

double LiquidityModel::level(const std::string &symbol) const {
  auto it = levels_.find(symbol);
  if (it == levels_.end()) {
    throw NotFoundError("No liquidity tracked for symbol " + symbol);
  }
  return it->second;
}

double &LiquidityModel::level_ref(const std::string &symbol) {
  auto it = levels_.find(symbol);
  if (it == levels_.end()) {
    throw NotFoundError("No liquidity tracked for symbol " + symbol);
  }
  return it->second;
}

double LiquidityModel::impact_floor() const {
  return std::max(config_.min_liquidity,
                  config_.min_liquidity_fraction * config_.base_liquidity);
}

double LiquidityModel::impact(double order_size, double liquidity,
                              Side side) const {
  if (order_size <= 0.0) {
    return 0.0;
  }
  const double effective = std::max(liquidity, impact_floor());
  const double magnitude =
      config_.impact_coefficient * std::sqrt(order_size / effective);
  return side_sign(side) * magnitude;
}

double LiquidityModel::impact(const std::string &symbol, double order_size,
                              Side side) const {
  return impact(order_size, level(symbol), side);
}

void LiquidityModel::apply_consumption(const std::string &symbol,
                                       double consumed_quantity) {
  if (consumed_quantity <= 0.0) {
    return;
  }
  double &current = level_ref(symbol);
  current = std::max(0.0, current - config_.consumption_rate * consumed_quantity);
}

void LiquidityModel::decay_toward_base(const std::string &symbol,
                                       std::size_t elapsed_ticks) {
  double &current = level_ref(symbol);
  const double base = config_.base_liquidity;
  if (elapsed_ticks == 0 || current >= base) {
    current = std::min(current, base);
    return;
  }

  const double remaining_fraction =
      std::pow(1.0 - config_.decay_rate, static_cast<double>(elapsed_ticks));
  current = std::min(base, base - (base - current) * remaining_fraction);
}
