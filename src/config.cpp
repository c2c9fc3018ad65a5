#include "config.hpp"

#include "errors.hpp"

#include <cmath>

namespace {

void require(bool condition, const std::string &message) {
  if (!condition) {
    throw ValidationError("Invalid configuration: " + message);
  }
}

bool positive(double value) { return std::isfinite(value) && value > 0.0; }

bool non_negative(double value) { return std::isfinite(value) && value >= 0.0; }

} // namespace

const ParameterSet &AgentPopulationConfig::params_for(AgentType type) const {
  switch (type) {
  case AgentType::MARKET_MAKER:
    return market_maker_params;
  case AgentType::NOISE_TRADER:
    return noise_trader_params;
  case AgentType::INFORMED_TRADER:
    return informed_trader_params;
  case AgentType::MOMENTUM_TRADER:
    return momentum_trader_params;
  }
  return market_maker_params;
}

void SimulationConfig::validate() const {
  require(tick_interval.count() >= 0, "tick_interval must be >= 0");
  require(tick_duration_us > 0, "tick_duration_us must be > 0");

  require(book.max_depth > 0, "book.max_depth must be > 0");
  require(positive(book.tick_size), "book.tick_size must be > 0");

  require(positive(liquidity.base_liquidity),
          "liquidity.base_liquidity must be > 0");
  require(non_negative(liquidity.decay_rate) && liquidity.decay_rate <= 1.0,
          "liquidity.decay_rate must be in [0, 1]");
  require(non_negative(liquidity.impact_coefficient),
          "liquidity.impact_coefficient must be >= 0");
  require(non_negative(liquidity.consumption_rate),
          "liquidity.consumption_rate must be >= 0");
  require(positive(liquidity.min_liquidity),
          "liquidity.min_liquidity must be > 0");
  require(non_negative(liquidity.min_liquidity_fraction) &&
              liquidity.min_liquidity_fraction <= 1.0,
          "liquidity.min_liquidity_fraction must be in [0, 1]");

  require(non_negative(price.momentum_factor),
          "price.momentum_factor must be >= 0");
  require(non_negative(price.mean_reversion_rate) &&
              price.mean_reversion_rate <= 1.0,
          "price.mean_reversion_rate must be in [0, 1]");
  require(non_negative(price.volatility), "price.volatility must be >= 0");
  require(price.trend_window > 0, "price.trend_window must be > 0");
  require(price.reversion_window > 0, "price.reversion_window must be > 0");
  require(price.volatility_window > 1, "price.volatility_window must be > 1");
  require(price.history_length >= price.reversion_window &&
              price.history_length > price.trend_window &&
              price.history_length >= price.volatility_window,
          "price.history_length must cover every window");
  require(non_negative(price.max_flow_return) && price.max_flow_return < 1.0,
          "price.max_flow_return must be in [0, 1)");

  require(non_negative(execution.slippage_coefficient),
          "execution.slippage_coefficient must be >= 0");
  require(execution.latency_us >= 0, "execution.latency_us must be >= 0");
  require(non_negative(execution.max_slippage) && execution.max_slippage < 1.0,
          "execution.max_slippage must be in [0, 1)");

  require(analytics.every_n_trades > 0, "analytics.every_n_trades must be > 0");
  require(analytics.volatility_window > 1,
          "analytics.volatility_window must be > 1");
  require(analytics.vwap_window > 0, "analytics.vwap_window must be > 0");
  require(analytics.effective_spread_window > 0,
          "analytics.effective_spread_window must be > 0");
  require(analytics.imbalance_levels > 0,
          "analytics.imbalance_levels must be > 0");
}
